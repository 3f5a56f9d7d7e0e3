// asdl/ast/json_visitor.hpp - JSON serialization for declaration trees
//
// Ranges are emitted as byte offsets.
//
#pragma once

#include <nlohmann/json.hpp>

#include "asdl/ast/ast.hpp"

namespace asdl
{

/**
 * Serialize any declaration node to JSON.
 *
 * @param node The node to serialize (nullptr gives a JSON null)
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a parsed source including all its modules.
 */
[[nodiscard]] nlohmann::json to_json(const SchemaFile * file);

}  // namespace asdl
