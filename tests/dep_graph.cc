#include "Builder/DepGraph.hpp"
#include "Builder/Resolver.hpp"
#include "Dependency.hpp"

#include <boost/ut.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace {

weld::ResolvedComponent
component(std::string name, std::vector<weld::ComponentDependency> deps = {}) {
  weld::ResolvedComponent comp;
  comp.name = std::move(name);
  comp.baseDir = ".";
  comp.dependencies = std::move(deps);
  return comp;
}

weld::ComponentDependency wasm(std::string target) {
  return { weld::DependencyType::Wasm, std::move(target) };
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "nodes follow declaration order and edges point at targets"_test = [] {
    const auto graph =
        weld::DepGraph::create(
            { component("b", { weld::ComponentDependency::wasmRpc("a") }),
              component("a") })
            .unwrap();

    expect(graph.size() == 2U);
    expect(graph.name(0) == "b");
    expect(graph.indexOf("a") == std::size_t{ 1 });
    expect(!graph.indexOf("c").has_value());
    expect(graph.edges().size() == 1U);
    expect(graph.successors(0) == std::vector<std::size_t>{ 1 });
    expect(graph.successors(0, /*binaryOnly=*/true).empty());
  };

  "dangling dependency targets are fatal"_test = [] {
    const auto graph = weld::DepGraph::create(
        { component("a", { weld::ComponentDependency::wasmRpc("ghost") }) });
    expect(graph.is_err());
    expect(std::string(graph.unwrap_err()->what())
           == "component `a` depends on unknown component `ghost`");
  };

  "rpc cycles are tolerated and reported"_test = [] {
    const auto graph =
        weld::DepGraph::create(
            { component("a", { weld::ComponentDependency::wasmRpc("b") }),
              component("b", { weld::ComponentDependency::wasmRpc("a") }),
              component("c", { weld::ComponentDependency::wasmRpc("c") }),
              component("d", { weld::ComponentDependency::wasmRpc("a") }) })
            .unwrap();

    const auto cycles = graph.cycles();
    expect(cycles.size() == 2U);
    expect(cycles[0] == std::vector<std::size_t>{ 0, 1 }
           || cycles[1] == std::vector<std::size_t>{ 0, 1 });
    expect(cycles[0] == std::vector<std::size_t>{ 2 }
           || cycles[1] == std::vector<std::size_t>{ 2 });

    // Every node lands in exactly one strongly connected component.
    std::size_t covered = 0;
    for (const auto& scc : graph.stronglyConnectedComponents()) {
      covered += scc.size();
    }
    expect(covered == 4U);
  };

  "binary successors are deduplicated"_test = [] {
    const auto graph =
        weld::DepGraph::create(
            { component("app", { wasm("lib"), wasm("lib"),
                                 weld::ComponentDependency::wasmRpc("lib") }),
              component("lib") })
            .unwrap();
    expect(graph.edges().size() == 3U);
    expect(graph.successors(0, /*binaryOnly=*/true)
           == std::vector<std::size_t>{ 1 });
  };
}
