#include "kstitch/algorithm.hpp"

#include <iterator>
#include <string_view>
#include <utility>

#include "biosoup/timer.hpp"
#include "detail/components.hpp"
#include "detail/degree.hpp"
#include "detail/traversal.hpp"
#include "fmt/compile.h"
#include "fmt/core.h"
#include "kstitch/io.hpp"

namespace kstitch {

auto CheckConnectivity(Multigraph const& graph) -> void {
  auto const n_components = detail::CountEdgeComponents(graph);
  if (n_components > 1U) {
    throw DisconnectedGraphError(fmt::format(
        FMT_COMPILE("[kstitch::CheckConnectivity] edges span {} disjoint "
                    "components"),
        n_components));
  }
}

auto CheckDegreeBalance(Multigraph const& graph) -> void {
  auto const imbalance = detail::FindImbalance(graph);

  auto const fail = [&graph](std::string_view reason, NodeId const id) {
    throw NoEulerianPathError(
        fmt::format(FMT_COMPILE("[kstitch::CheckDegreeBalance] {} at {} "
                                "(out {}, in {})"),
                    reason, graph.Label(id), graph.OutDegree(id),
                    graph.InDegree(id)));
  };

  if (!imbalance.excessive.empty()) {
    fail("degree difference above one", imbalance.excessive.front());
  }
  // balances sum to zero, a second sink implies a second source
  if (imbalance.surplus_out.size() > 1U) {
    fail("second node with surplus outgoing edges", imbalance.surplus_out[1]);
  }
}

auto SelectStartNode(Multigraph const& graph) -> NodeId {
  auto const& keys = graph.Keys();
  if (keys.empty()) {
    throw EmptyInputError("[kstitch::SelectStartNode] graph has no edges");
  }

  for (auto const id : keys) {
    if (graph.OutDegree(id) > graph.InDegree(id)) {
      return id;
    }
  }

  return keys.front();
}

auto FindEulerianPath(Multigraph graph, NodeId const start,
                      TraversalConfig const& config)
    -> std::vector<std::string> {
  if (graph.Empty()) {
    throw EmptyInputError("[kstitch::FindEulerianPath] graph has no edges");
  }

  auto const ids = detail::WalkEdges(graph, start, config);

  auto dst = std::vector<std::string>();
  dst.reserve(ids.size());
  for (auto const id : ids) {
    dst.push_back(graph.Label(id));
  }

  return dst;
}

auto StitchPath(std::vector<std::string> const& path) -> std::string {
  if (path.empty()) {
    return {};
  }

  auto dst = path.front();
  dst.reserve(dst.size() + path.size() - 1U);
  for (auto iter = std::next(path.cbegin()); iter != path.cend(); ++iter) {
    if (!iter->empty()) {
      dst.push_back(iter->back());
    }
  }

  return dst;
}

auto Reconstruct(std::vector<KmerPair> const& pairs,
                 ReconstructConfig const& config) -> std::string {
  if (pairs.empty()) {
    throw EmptyInputError("[kstitch::Reconstruct] no paired k-mers supplied");
  }

  auto timer = biosoup::Timer();
  auto const log_stage = [&config, &timer](std::string_view message) -> void {
    if (config.verbose) {
      fmt::print(stderr,
                 FMT_COMPILE("[kstitch::Reconstruct]({:12.3f}s) : {}\n"),
                 timer.Stop(), message);
    }
  };

  timer.Start();
  auto graph = BuildGraph(pairs);
  log_stage(fmt::format(FMT_COMPILE("built graph with {} nodes and {} edges"),
                        graph.NodeCount(), graph.EdgeCount()));

  if (config.validate) {
    timer.Start();
    CheckConnectivity(graph);
    CheckDegreeBalance(graph);
    log_stage("validated graph");
  }

  timer.Start();
  auto const start = SelectStartNode(graph);
  auto const path =
      FindEulerianPath(std::move(graph), start, config.traversal_config);
  log_stage(fmt::format(FMT_COMPILE("found eulerian path over {} nodes"),
                        path.size()));

  timer.Start();
  auto dst = StitchPath(path);
  log_stage(fmt::format(FMT_COMPILE("stitched sequence of length {}"),
                        dst.size()));

  return dst;
}

auto ReconstructReads(
    std::vector<std::unique_ptr<biosoup::NucleicAcid>> const& reads,
    std::uint32_t const k, ReconstructConfig const& config)
    -> std::vector<std::unique_ptr<biosoup::NucleicAcid>> {
  auto dst = std::vector<std::unique_ptr<biosoup::NucleicAcid>>();
  dst.reserve(reads.size());

  for (auto const& read : reads) {
    auto data = Reconstruct(Decompose(read->InflateData(), k), config);
    dst.emplace_back(
        std::make_unique<biosoup::NucleicAcid>(read->name, std::move(data)));
    dst.back()->id = read->id;
  }

  return dst;
}

}  // namespace kstitch
