#pragma once

#include "Builder/Resolver.hpp"
#include "Dependency.hpp"

#include <cstddef>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace weld {

struct DepEdge {
  std::size_t from;
  std::size_t to;
  DependencyType type;
};

// Components and their dependencies.  Node indices follow declaration
// order.  Cycles are allowed here; only edges that need the target's binary
// must be acyclic, and that is checked when planning.
class DepGraph {
public:
  static rs::Result<DepGraph>
  create(const std::vector<ResolvedComponent>& components) noexcept;

  std::size_t size() const noexcept { return nodes.size(); }
  const std::string& name(const std::size_t idx) const { return nodes[idx]; }
  std::optional<std::size_t> indexOf(std::string_view name) const;

  const std::vector<DepEdge>& edges() const noexcept { return edgeList; }

  // Targets of `idx`'s outgoing edges, deduplicated, in declaration order.
  std::vector<std::size_t> successors(std::size_t idx,
                                      bool binaryOnly = false) const;

  // Tarjan's algorithm over every edge.  Each component lists node indices;
  // components come out in reverse topological order.
  std::vector<std::vector<std::size_t>> stronglyConnectedComponents() const;

  // Groups of components that call each other, including self-calls.
  std::vector<std::vector<std::size_t>> cycles() const;

private:
  DepGraph() = default;

  std::vector<std::string> nodes;
  std::unordered_map<std::string, std::size_t> index;
  std::vector<DepEdge> edgeList;
  // Edge indices per source node.
  std::vector<std::vector<std::size_t>> outEdges;
};

} // namespace weld
