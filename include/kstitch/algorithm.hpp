#ifndef KSTITCH_ALGORITHM_HPP_
#define KSTITCH_ALGORITHM_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "biosoup/nucleic_acid.hpp"
#include "kstitch/configs.hpp"
#include "kstitch/errors.hpp"
#include "kstitch/graph.hpp"

namespace kstitch {

/**
 * @brief throw DisconnectedGraphError unless all edges share one weakly
 * connected component
 */
auto CheckConnectivity(Multigraph const& graph) -> void;

/**
 * @brief throw NoEulerianPathError if the degrees rule out an eulerian path
 */
auto CheckDegreeBalance(Multigraph const& graph) -> void;

/**
 * @brief first key with outdegree above indegree, else the first key
 */
[[nodiscard]] auto SelectStartNode(Multigraph const& graph) -> NodeId;

/**
 * @brief consume every edge of graph walking from start
 *
 * @return node labels in walk order, one more than the number of edges
 */
[[nodiscard]] auto FindEulerianPath(Multigraph graph, NodeId const start,
                                    TraversalConfig const& config = {})
    -> std::vector<std::string>;

/**
 * @brief first label followed by the last character of every other label
 */
[[nodiscard]] auto StitchPath(std::vector<std::string> const& path)
    -> std::string;

/**
 * @brief assemble the sequence spelled by the paired k-mers
 */
[[nodiscard]] auto Reconstruct(std::vector<KmerPair> const& pairs,
                               ReconstructConfig const& config = {})
    -> std::string;

/**
 * @brief reconstruct every read on its own from its k-mer pairs
 *
 * Records keep their name and id, the first failing read aborts the batch.
 */
[[nodiscard]] auto ReconstructReads(
    std::vector<std::unique_ptr<biosoup::NucleicAcid>> const& reads,
    std::uint32_t const k, ReconstructConfig const& config = {})
    -> std::vector<std::unique_ptr<biosoup::NucleicAcid>>;

}  // namespace kstitch

#endif /* KSTITCH_ALGORITHM_HPP_ */
