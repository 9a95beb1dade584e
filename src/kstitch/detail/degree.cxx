#include "degree.hpp"

namespace kstitch::detail {

auto Balance(Multigraph const& graph, NodeId const id) -> std::int64_t {
  return static_cast<std::int64_t>(graph.OutDegree(id)) -
         static_cast<std::int64_t>(graph.InDegree(id));
}

auto FindImbalance(Multigraph const& graph) -> DegreeImbalance {
  auto dst = DegreeImbalance();
  for (auto id = NodeId(0); id < graph.NodeCount(); ++id) {
    switch (auto const balance = Balance(graph, id); balance) {
      case -1:
      case 0:
        break;
      case 1:
        dst.surplus_out.push_back(id);
        break;
      default:
        dst.excessive.push_back(id);
        break;
    }
  }

  return dst;
}

}  // namespace kstitch::detail
