#include "kstitch/graph.hpp"

#include <stdexcept>

#include "fmt/compile.h"
#include "fmt/core.h"
#include "kstitch/errors.hpp"

namespace kstitch {

namespace detail {

auto const kEmptyBag = std::vector<NodeId>();

}  // namespace detail

auto Multigraph::Intern(std::string_view label) -> NodeId {
  if (auto const iter = index_.find(label); iter != index_.end()) {
    return iter->second;
  }

  auto const id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(Node{.label = std::string(label)});
  index_.emplace(nodes_.back().label, id);

  return id;
}

auto Multigraph::CheckId(NodeId const id) const -> void {
  if (id >= nodes_.size()) {
    throw std::out_of_range(fmt::format(
        FMT_COMPILE("[kstitch::Multigraph] node id {} out of range ({} nodes)"),
        id, nodes_.size()));
  }
}

auto Multigraph::AddEdge(std::string_view source, std::string_view destination)
    -> void {
  auto const src = Intern(source);
  auto const dst = Intern(destination);

  auto& src_node = nodes_[src];
  if (!src_node.is_key) {
    src_node.is_key = true;
    keys_.push_back(src);
  }

  src_node.out.push_back(dst);
  ++nodes_[dst].in_degree;
  ++n_edges_;
}

auto Multigraph::TakeEdge(NodeId const src) -> NodeId {
  CheckId(src);
  auto& bag = nodes_[src].out;
  if (bag.empty()) {
    throw std::logic_error(
        fmt::format(FMT_COMPILE("[kstitch::Multigraph::TakeEdge] node {} has "
                                "no outgoing edges left"),
                    nodes_[src].label));
  }

  auto const dst = bag.back();
  bag.pop_back();

  --nodes_[dst].in_degree;
  --n_edges_;

  return dst;
}

auto Multigraph::Find(std::string_view label) const -> std::optional<NodeId> {
  if (auto const iter = index_.find(label); iter != index_.end()) {
    return iter->second;
  }

  return std::nullopt;
}

auto Multigraph::Label(NodeId const id) const -> std::string const& {
  CheckId(id);
  return nodes_[id].label;
}

auto Multigraph::OutDegree(NodeId const id) const -> std::uint32_t {
  CheckId(id);
  return static_cast<std::uint32_t>(nodes_[id].out.size());
}

auto Multigraph::InDegree(NodeId const id) const -> std::uint32_t {
  CheckId(id);
  return nodes_[id].in_degree;
}

auto Multigraph::Successors(NodeId const id) const
    -> std::vector<NodeId> const& {
  CheckId(id);
  return nodes_[id].out;
}

auto Multigraph::Successors(std::string_view label) const
    -> std::vector<NodeId> const& {
  auto const id = Find(label);
  return id ? nodes_[*id].out : detail::kEmptyBag;
}

auto operator==(Multigraph const& lhs, Multigraph const& rhs) -> bool {
  if (lhs.nodes_.size() != rhs.nodes_.size() || lhs.keys_ != rhs.keys_ ||
      lhs.n_edges_ != rhs.n_edges_) {
    return false;
  }

  for (auto i = 0U; i < lhs.nodes_.size(); ++i) {
    auto const& l = lhs.nodes_[i];
    auto const& r = rhs.nodes_[i];
    if (l.label != r.label || l.out != r.out || l.in_degree != r.in_degree) {
      return false;
    }
  }

  return true;
}

auto BuildGraph(std::vector<KmerPair> const& pairs) -> Multigraph {
  auto dst = Multigraph();
  for (auto i = 0U; i < pairs.size(); ++i) {
    auto const& [source, destination] = pairs[i];
    if (source.empty() || destination.empty()) {
      throw InvalidPairError(fmt::format(
          FMT_COMPILE("[kstitch::BuildGraph] pair {} has an empty label"), i));
    }

    dst.AddEdge(source, destination);
  }

  return dst;
}

}  // namespace kstitch
