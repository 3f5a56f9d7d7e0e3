// asdl/sema/embedding_cycle_checker.cpp - Types without a finite inhabitant
#include "asdl/sema/embedding_cycle_checker.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace asdl
{

namespace
{

struct Edge
{
  const TypeInfo * target = nullptr;
  SourceRange fieldRange;
};

using InhabitedSet = std::unordered_set<const TypeInfo *>;

bool field_is_inhabited(const FieldInfo & f, const InhabitedSet & inhabited)
{
  if (f.multiplicity != Multiplicity::Single || f.type.is_primitive()) {
    return true;
  }
  return inhabited.count(f.type.type_info()) > 0;
}

bool constructor_is_inhabited(const ConstructorInfo & c, const InhabitedSet & inhabited)
{
  for (const auto & f : c.fields) {
    if (!field_is_inhabited(f, inhabited)) {
      return false;
    }
  }
  return true;
}

InhabitedSet compute_inhabited(const TypeModel & model)
{
  InhabitedSet inhabited;
  inhabited.reserve(model.types().size());

  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto * t : model.types()) {
      if (inhabited.count(t) > 0) continue;
      for (const auto & c : t->constructors) {
        if (constructor_is_inhabited(c, inhabited)) {
          inhabited.insert(t);
          changed = true;
          break;
        }
      }
    }
  }
  return inhabited;
}

// Single-multiplicity edges between types that are not inhabited.
void collect_edges(
  const TypeInfo * type, const InhabitedSet & inhabited, std::vector<Edge> & out)
{
  for (const auto & c : type->constructors) {
    for (const auto & f : c.fields) {
      if (f.multiplicity != Multiplicity::Single || !f.type.is_declared()) continue;
      const TypeInfo * target = f.type.type_info();
      if (inhabited.count(target) > 0) continue;
      out.push_back({target, f.range});
    }
  }
}

enum class Color : uint8_t { White, Gray, Black };

std::string cycle_path(const std::vector<const TypeInfo *> & stack, const TypeInfo * target)
{
  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == target) {
      break;
    }
  }

  std::string path;
  for (size_t i = (start < stack.size() ? start : 0); i < stack.size(); ++i) {
    path += stack[i]->name;
    path += " -> ";
  }
  path += target->name;
  return path;
}

}  // namespace

bool EmbeddingCycleChecker::check(const TypeModel & model)
{
  hasErrors_ = false;
  errorCount_ = 0;

  const InhabitedSet inhabited = compute_inhabited(model);
  if (inhabited.size() == model.types().size()) {
    return true;
  }

  std::vector<const TypeInfo *> roots;
  std::unordered_map<const TypeInfo *, std::vector<Edge>> adj;
  for (const auto * t : model.types()) {
    if (inhabited.count(t) > 0) continue;
    roots.push_back(t);
    std::vector<Edge> edges;
    collect_edges(t, inhabited, edges);
    adj.emplace(t, std::move(edges));
  }

  std::unordered_map<const TypeInfo *, Color> color;
  color.reserve(roots.size());
  for (const auto * r : roots) {
    color.emplace(r, Color::White);
  }

  std::vector<const TypeInfo *> stack;
  stack.reserve(roots.size());

  std::function<void(const TypeInfo *)> dfs;
  dfs = [&](const TypeInfo * u) {
    color[u] = Color::Gray;
    stack.push_back(u);

    for (const auto & e : adj[u]) {
      const Color c = color[e.target];
      if (c == Color::Gray) {
        report_error(
          e.fieldRange, "type `" + e.target->name +
                          "` has no finite value; it embeds itself through single fields: " +
                          cycle_path(stack, e.target));
        continue;
      }
      if (c == Color::White) {
        dfs(e.target);
      }
    }

    stack.pop_back();
    color[u] = Color::Black;
  };

  for (const auto * r : roots) {
    if (color[r] == Color::White) {
      dfs(r);
    }
  }

  return !has_errors();
}

void EmbeddingCycleChecker::report_error(SourceRange range, std::string_view message)
{
  hasErrors_ = true;
  ++errorCount_;
  if (diags_) {
    diags_->report(ErrorCode::CycleError, range, std::string(message), "embedded here")
      .with_help("make a field on the cycle optional (`?`) or repeated (`*`)");
  }
}

}  // namespace asdl
