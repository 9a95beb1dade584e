#ifndef KSTITCH_DETAIL_TRAVERSAL_HPP_
#define KSTITCH_DETAIL_TRAVERSAL_HPP_

#include <vector>

#include "kstitch/configs.hpp"
#include "kstitch/graph.hpp"

namespace kstitch::detail {

/**
 * @brief iterative hierholzer walk consuming the edges of graph
 *
 * Throws NoEulerianPathError when the walk gets stuck before its end and
 * DisconnectedGraphError when edges are left unvisited.
 *
 * @return node ids from start to end
 */
[[nodiscard]] auto WalkEdges(Multigraph& graph, NodeId const start,
                             TraversalConfig const& config)
    -> std::vector<NodeId>;

}  // namespace kstitch::detail

#endif /* KSTITCH_DETAIL_TRAVERSAL_HPP_ */
