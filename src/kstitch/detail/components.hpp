#ifndef KSTITCH_DETAIL_COMPONENTS_HPP_
#define KSTITCH_DETAIL_COMPONENTS_HPP_

#include <cstddef>

#include "kstitch/graph.hpp"

namespace kstitch::detail {

/**
 * @brief weakly connected components spanned by the edges of graph
 *
 * Nodes without any incident edge are not counted.
 */
[[nodiscard]] auto CountEdgeComponents(Multigraph const& graph)
    -> std::size_t;

}  // namespace kstitch::detail

#endif /* KSTITCH_DETAIL_COMPONENTS_HPP_ */
