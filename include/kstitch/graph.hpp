#ifndef KSTITCH_GRAPH_HPP_
#define KSTITCH_GRAPH_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kstitch {

using NodeId = std::uint32_t;

struct KmerPair {
  std::string source;
  std::string destination;
};

/**
 * @brief directed multigraph over string labels
 *
 * Labels are interned into an insertion ordered arena. Every node owns a bag
 * of destination ids, parallel edges are kept as repeated entries. Labels seen
 * only as a destination are nodes but not keys, their bag is empty.
 */
class Multigraph {
 public:
  Multigraph() = default;

  // disable copying
  Multigraph(Multigraph const&) = delete;
  Multigraph& operator=(Multigraph const&) = delete;

  // enable ownership transfer
  Multigraph(Multigraph&&) = default;
  Multigraph& operator=(Multigraph&&) = default;

  auto AddEdge(std::string_view source, std::string_view destination) -> void;

  /**
   * @brief remove the most recently added edge leaving src
   *
   * @return destination of the removed edge
   */
  auto TakeEdge(NodeId const src) -> NodeId;

  [[nodiscard]] auto Find(std::string_view label) const
      -> std::optional<NodeId>;

  [[nodiscard]] auto Label(NodeId const id) const -> std::string const&;

  [[nodiscard]] auto OutDegree(NodeId const id) const -> std::uint32_t;
  [[nodiscard]] auto InDegree(NodeId const id) const -> std::uint32_t;

  [[nodiscard]] auto Successors(NodeId const id) const
      -> std::vector<NodeId> const&;

  /**
   * @brief destinations of label, empty for unknown or destination only labels
   */
  [[nodiscard]] auto Successors(std::string_view label) const
      -> std::vector<NodeId> const&;

  // labels that appeared as a source, in order of first appearance
  [[nodiscard]] auto Keys() const -> std::vector<NodeId> const& {
    return keys_;
  }

  [[nodiscard]] auto NodeCount() const -> std::size_t { return nodes_.size(); }
  [[nodiscard]] auto EdgeCount() const -> std::size_t { return n_edges_; }
  [[nodiscard]] auto Empty() const -> bool { return n_edges_ == 0U; }

  friend auto operator==(Multigraph const& lhs, Multigraph const& rhs)
      -> bool;

 private:
  struct Node {
    std::string label;
    std::vector<NodeId> out;
    std::uint32_t in_degree = 0U;
    bool is_key = false;
  };

  struct LabelHash {
    using is_transparent = void;

    auto operator()(std::string_view label) const -> std::size_t {
      return std::hash<std::string_view>()(label);
    }
  };

  auto Intern(std::string_view label) -> NodeId;
  auto CheckId(NodeId const id) const -> void;

  std::vector<Node> nodes_;
  std::unordered_map<std::string, NodeId, LabelHash, std::equal_to<>> index_;
  std::vector<NodeId> keys_;
  std::size_t n_edges_ = 0U;
};

/**
 * @brief build the multigraph with one edge per pair, input order preserved
 */
[[nodiscard]] auto BuildGraph(std::vector<KmerPair> const& pairs)
    -> Multigraph;

}  // namespace kstitch

#endif /* KSTITCH_GRAPH_HPP_ */
