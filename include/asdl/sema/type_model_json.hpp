// asdl/sema/type_model_json.hpp - JSON dump of a resolved TypeModel
#pragma once

#include <nlohmann/json.hpp>

#include "asdl/sema/type_model.hpp"

namespace asdl
{

/**
 * Dump modules, types, constructor tags, field indices, resolved field
 * types and multiplicities.
 *
 * The dump only depends on the schema text, so two loads of the same text
 * produce equal JSON.
 */
[[nodiscard]] nlohmann::json to_json(const TypeModel & model);

[[nodiscard]] nlohmann::json to_json(const TypeInfo & type);

}  // namespace asdl
