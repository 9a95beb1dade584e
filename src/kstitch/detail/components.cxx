#include "components.hpp"

#include "boost/pending/disjoint_sets.hpp"

namespace kstitch::detail {

auto CountEdgeComponents(Multigraph const& graph) -> std::size_t {
  auto sets = boost::disjoint_sets_with_storage<>(graph.NodeCount());
  for (auto const src : graph.Keys()) {
    for (auto const dst : graph.Successors(src)) {
      sets.union_set(src, dst);
    }
  }

  auto n_components = 0UL;
  for (auto id = NodeId(0); id < graph.NodeCount(); ++id) {
    auto const has_edges = graph.OutDegree(id) > 0U || graph.InDegree(id) > 0U;
    if (has_edges && sets.find_set(id) == id) {
      ++n_components;
    }
  }

  return n_components;
}

}  // namespace kstitch::detail
