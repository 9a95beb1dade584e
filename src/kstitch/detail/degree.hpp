#ifndef KSTITCH_DETAIL_DEGREE_HPP_
#define KSTITCH_DETAIL_DEGREE_HPP_

#include <cstdint>
#include <vector>

#include "kstitch/graph.hpp"

namespace kstitch::detail {

struct DegreeImbalance {
  std::vector<NodeId> surplus_out;  // outdegree - indegree == 1
  std::vector<NodeId> excessive;    // |outdegree - indegree| > 1
};

[[nodiscard]] auto Balance(Multigraph const& graph, NodeId const id)
    -> std::int64_t;

// NOTE: nodes are listed in arena order
[[nodiscard]] auto FindImbalance(Multigraph const& graph) -> DegreeImbalance;

}  // namespace kstitch::detail

#endif /* KSTITCH_DETAIL_DEGREE_HPP_ */
