#include "traversal.hpp"

#include <algorithm>
#include <optional>

#include "fmt/compile.h"
#include "fmt/core.h"
#include "kstitch/errors.hpp"

namespace kstitch::detail {

auto WalkEdges(Multigraph& graph, NodeId const start,
               TraversalConfig const& config) -> std::vector<NodeId> {
  auto const n_edges = graph.EdgeCount();
  auto const poll_interval = std::max(config.poll_interval, 1U);

  auto stack = std::vector<NodeId>{start};
  auto path = std::vector<NodeId>();

  stack.reserve(n_edges + 1U);
  path.reserve(n_edges + 1U);

  // node that has to be popped next for the walk to stay a single trail
  auto expected_pop = std::optional<NodeId>();

  for (auto n_iters = 1ULL; !stack.empty(); ++n_iters) {
    if (config.should_abort && n_iters % poll_interval == 0U &&
        config.should_abort()) {
      throw TraversalAbortedError(
          fmt::format(FMT_COMPILE("[kstitch::FindEulerianPath] aborted with "
                                  "{}/{} edges consumed"),
                      n_edges - graph.EdgeCount(), n_edges));
    }

    auto const curr = stack.back();
    if (graph.OutDegree(curr) > 0U) {
      stack.push_back(graph.TakeEdge(curr));
      continue;
    }

    if (expected_pop && *expected_pop != curr) {
      throw NoEulerianPathError(
          fmt::format(FMT_COMPILE("[kstitch::FindEulerianPath] walk got stuck "
                                  "at {} before reaching the end at {}"),
                      graph.Label(curr), graph.Label(path.front())));
    }

    path.push_back(curr);
    stack.pop_back();

    if (!stack.empty()) {
      expected_pop = stack.back();
    }
  }

  if (path.size() != n_edges + 1U) {
    throw DisconnectedGraphError(
        fmt::format(FMT_COMPILE("[kstitch::FindEulerianPath] walk from {} "
                                "used {}/{} edges"),
                    graph.Label(start), path.size() - 1U, n_edges));
  }

  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace kstitch::detail
