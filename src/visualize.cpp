#include "bkregex/regex.hpp"

#include "bkregex/ast.hpp"

#include <cstddef>
#include <format>
#include <ostream>
#include <print>
#include <string>
#include <string_view>

using namespace bkregex;

namespace {
auto escape_label(std::string_view label) -> std::string {
  std::string output;
  for (char c : label) {
    switch (c) {
    default:
      output.push_back(c);
      break;
    case '"':
    case '\\':
      output.push_back('\\');
      output.push_back(c);
      break;
    case '\n':
      output += "\\\\n";
      break;
    case '\t':
      output += "\\\\t";
      break;
    }
  }
  return output;
}

auto pretty_format(Node const &node) -> std::string {
  auto const description = describe(node);
  if (description.empty()) {
    return std::string{type_name(node)};
  }
  return std::format("{}({})", type_name(node), description);
}

auto unique_node_tag(size_t id) -> std::string {
  return std::format("node_{}", id);
}

// Depth first, a node is numbered before its children
auto output_subtree(std::ostream &out_stream, Node const &node, size_t &next_id)
    -> void {
  size_t const id = next_id++;
  std::print(out_stream, "  {} [label=\"{}\"]\n", unique_node_tag(id),
             escape_label(pretty_format(node)));

  for (auto const *child : children(node)) {
    std::print(out_stream, "  {} -> {}\n", unique_node_tag(id),
               unique_node_tag(next_id));
    output_subtree(out_stream, *child, next_id);
  }
}
} // namespace

auto Pattern::visualize(std::ostream &out_stream) const -> void {
  out_stream << "digraph {\n";

  size_t next_id = 0;
  output_subtree(out_stream, root(), next_id);

  out_stream << "}" << std::endl;
}
