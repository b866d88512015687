#include "Builder/DepGraph.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace weld {

rs::Result<DepGraph>
DepGraph::create(const std::vector<ResolvedComponent>& components) noexcept {
  DepGraph graph;
  graph.nodes.reserve(components.size());
  for (const ResolvedComponent& comp : components) {
    rs_ensure(graph.index.emplace(comp.name, graph.nodes.size()).second,
              "duplicate component `{}`", comp.name);
    graph.nodes.push_back(comp.name);
  }
  graph.outEdges.resize(graph.nodes.size());

  for (std::size_t from = 0; from < components.size(); ++from) {
    for (const ComponentDependency& dep : components[from].dependencies) {
      const auto to = graph.indexOf(dep.target);
      rs_ensure(to.has_value(),
                "component `{}` depends on unknown component `{}`",
                components[from].name, dep.target);

      graph.outEdges[from].push_back(graph.edgeList.size());
      graph.edgeList.push_back(
          DepEdge{ .from = from, .to = *to, .type = dep.type });
      spdlog::trace("edge: {} -> {} ({})", components[from].name, dep.target,
                    dep.type);
    }
  }

  for (const auto& cycle : graph.cycles()) {
    std::vector<std::string_view> names;
    for (const std::size_t idx : cycle) {
      names.emplace_back(graph.nodes[idx]);
    }
    spdlog::debug("dependency cycle tolerated: {}", fmt::join(names, ", "));
  }
  return rs::Ok(std::move(graph));
}

std::optional<std::size_t> DepGraph::indexOf(const std::string_view name) const {
  const auto itr = index.find(std::string(name));
  if (itr == index.end()) {
    return std::nullopt;
  }
  return itr->second;
}

std::vector<std::size_t> DepGraph::successors(const std::size_t idx,
                                              const bool binaryOnly) const {
  std::vector<std::size_t> succs;
  for (const std::size_t edgeIdx : outEdges[idx]) {
    const DepEdge& edge = edgeList[edgeIdx];
    if (binaryOnly && !needsTargetBinary(edge.type)) {
      continue;
    }
    if (std::ranges::find(succs, edge.to) == succs.end()) {
      succs.push_back(edge.to);
    }
  }
  return succs;
}

namespace {

class Tarjan {
  static constexpr std::size_t UNVISITED =
      std::numeric_limits<std::size_t>::max();

  const DepGraph& graph;
  std::size_t counter = 0;
  std::vector<std::size_t> order;
  std::vector<std::size_t> lowLink;
  std::vector<bool> onStack;
  std::vector<std::size_t> stack;
  std::vector<std::vector<std::size_t>> sccs;

  void visit(const std::size_t v) {
    order[v] = lowLink[v] = counter++;
    stack.push_back(v);
    onStack[v] = true;

    for (const std::size_t w : graph.successors(v)) {
      if (order[w] == UNVISITED) {
        visit(w);
        lowLink[v] = std::min(lowLink[v], lowLink[w]);
      } else if (onStack[w]) {
        lowLink[v] = std::min(lowLink[v], order[w]);
      }
    }

    if (lowLink[v] != order[v]) {
      return;
    }
    std::vector<std::size_t> scc;
    std::size_t w = 0;
    do {
      w = stack.back();
      stack.pop_back();
      onStack[w] = false;
      scc.push_back(w);
    } while (w != v);
    std::ranges::sort(scc);
    sccs.push_back(std::move(scc));
  }

public:
  explicit Tarjan(const DepGraph& graph)
      : graph(graph), order(graph.size(), UNVISITED),
        lowLink(graph.size(), 0), onStack(graph.size(), false) {}

  std::vector<std::vector<std::size_t>> run() {
    for (std::size_t v = 0; v < graph.size(); ++v) {
      if (order[v] == UNVISITED) {
        visit(v);
      }
    }
    return std::move(sccs);
  }
};

} // namespace

std::vector<std::vector<std::size_t>>
DepGraph::stronglyConnectedComponents() const {
  return Tarjan(*this).run();
}

std::vector<std::vector<std::size_t>> DepGraph::cycles() const {
  std::vector<std::vector<std::size_t>> result;
  for (auto& scc : stronglyConnectedComponents()) {
    bool selfLoop = false;
    if (scc.size() == 1) {
      const std::vector<std::size_t> succs = successors(scc.front());
      selfLoop = std::ranges::find(succs, scc.front()) != succs.end();
    }
    if (scc.size() > 1 || selfLoop) {
      result.push_back(std::move(scc));
    }
  }
  return result;
}

} // namespace weld
