#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "kstitch/algorithm.hpp"
#include "kstitch/io.hpp"

namespace {

auto const kChainPairs = std::vector<kstitch::KmerPair>{
    {"AC", "CT"}, {"CT", "TG"}, {"TG", "GA"}};

}  // namespace

TEST_CASE("Reconstruct chain", "[algorithm][reconstruct]") {
  CHECK(kstitch::Reconstruct(kChainPairs) == "ACTGA");
}

TEST_CASE("Reconstruct chain without validation",
          "[algorithm][reconstruct]") {
  auto config = kstitch::ReconstructConfig();
  config.validate = false;

  CHECK(kstitch::Reconstruct(kChainPairs, config) == "ACTGA");
}

TEST_CASE("Empty input", "[algorithm][error]") {
  CHECK_THROWS_AS(kstitch::Reconstruct({}), kstitch::EmptyInputError);
  CHECK_THROWS_AS(kstitch::SelectStartNode(kstitch::BuildGraph({})),
                  kstitch::EmptyInputError);
}

TEST_CASE("Disjoint chains", "[algorithm][error]") {
  auto const pairs =
      std::vector<kstitch::KmerPair>{{"AA", "AB"}, {"CC", "CD"}};

  SECTION("with validation") {
    CHECK_THROWS_AS(kstitch::Reconstruct(pairs),
                    kstitch::DisconnectedGraphError);
  }

  SECTION("without validation") {
    auto config = kstitch::ReconstructConfig();
    config.validate = false;

    CHECK_THROWS_AS(kstitch::Reconstruct(pairs, config),
                    kstitch::DisconnectedGraphError);
  }
}

TEST_CASE("Disjoint cycles pass degree check", "[algorithm][error]") {
  auto const pairs = std::vector<kstitch::KmerPair>{
      {"AA", "AA"}, {"CC", "CC"}};
  auto const graph = kstitch::BuildGraph(pairs);

  CHECK_NOTHROW(kstitch::CheckDegreeBalance(graph));
  CHECK_THROWS_AS(kstitch::CheckConnectivity(graph),
                  kstitch::DisconnectedGraphError);

  auto const start = kstitch::SelectStartNode(graph);
  CHECK_THROWS_AS(
      kstitch::FindEulerianPath(kstitch::BuildGraph(pairs), start),
      kstitch::DisconnectedGraphError);
}

TEST_CASE("Connectivity ignores edge direction", "[algorithm][components]") {
  SECTION("shared destination") {
    auto const graph = kstitch::BuildGraph({{"AA", "AB"}, {"CC", "AB"}});
    CHECK_NOTHROW(kstitch::CheckConnectivity(graph));
  }

  SECTION("chain given back to front") {
    auto const graph =
        kstitch::BuildGraph({{"TG", "GA"}, {"CT", "TG"}, {"AC", "CT"}});
    CHECK_NOTHROW(kstitch::CheckConnectivity(graph));
  }

  SECTION("three islands") {
    auto const graph = kstitch::BuildGraph(
        {{"AA", "AB"}, {"CC", "CD"}, {"CD", "CC"}, {"GG", "GG"}});
    CHECK_THROWS_AS(kstitch::CheckConnectivity(graph),
                    kstitch::DisconnectedGraphError);
  }
}

TEST_CASE("Degree balance", "[algorithm][degree]") {
  SECTION("two sources") {
    auto const graph =
        kstitch::BuildGraph({{"AB", "BC"}, {"AD", "BC"}, {"BC", "CE"}});
    CHECK_NOTHROW(kstitch::CheckConnectivity(graph));
    CHECK_THROWS_AS(kstitch::CheckDegreeBalance(graph),
                    kstitch::NoEulerianPathError);
  }

  SECTION("two sinks") {
    auto const graph =
        kstitch::BuildGraph({{"AB", "BC"}, {"BC", "CD"}, {"BC", "CE"}});
    CHECK_THROWS_AS(kstitch::CheckDegreeBalance(graph),
                    kstitch::NoEulerianPathError);
  }

  SECTION("difference above one") {
    auto const graph = kstitch::BuildGraph(
        {{"AA", "AB"}, {"AA", "AB"}, {"AB", "AC"}, {"AB", "AC"}});
    CHECK_THROWS_AS(kstitch::CheckDegreeBalance(graph),
                    kstitch::NoEulerianPathError);
  }

  SECTION("single path") {
    auto const graph = kstitch::BuildGraph(kChainPairs);
    CHECK_NOTHROW(kstitch::CheckDegreeBalance(graph));
  }

  SECTION("closed circuit") {
    auto const graph =
        kstitch::BuildGraph({{"AB", "BC"}, {"BC", "CA"}, {"CA", "AB"}});
    CHECK_NOTHROW(kstitch::CheckDegreeBalance(graph));
  }
}

TEST_CASE("Branching walk is never silently accepted", "[algorithm][error]") {
  // both branches leave AB, no single trail covers them
  auto const pairs =
      std::vector<kstitch::KmerPair>{{"AB", "BC"}, {"AB", "BD"}};

  auto config = kstitch::ReconstructConfig();
  config.validate = false;

  CHECK_THROWS_AS(kstitch::Reconstruct(pairs, config),
                  kstitch::NoEulerianPathError);
}

TEST_CASE("Start node selection", "[algorithm][start]") {
  SECTION("surplus outgoing edges") {
    // TG is the first key, AC the only unbalanced one
    auto const graph = kstitch::BuildGraph(
        {{"TG", "GA"}, {"AC", "CT"}, {"CT", "TG"}});
    CHECK(graph.Label(kstitch::SelectStartNode(graph)) == "AC");
  }

  SECTION("closed circuit falls back to the first key") {
    auto const graph =
        kstitch::BuildGraph({{"CA", "AB"}, {"AB", "BC"}, {"BC", "CA"}});
    CHECK(graph.Label(kstitch::SelectStartNode(graph)) == "CA");
  }

  SECTION("indegree is counted per node") {
    // every bag is non-empty, only the true indegree exposes the source
    auto const graph = kstitch::BuildGraph(
        {{"BB", "BC"}, {"BC", "CB"}, {"CB", "BB"}, {"AB", "BB"}});
    CHECK(graph.Label(kstitch::SelectStartNode(graph)) == "AB");
  }
}

TEST_CASE("Eulerian path covers every edge", "[algorithm][path]") {
  auto const pairs = std::vector<kstitch::KmerPair>{
      {"AB", "BC"}, {"BC", "CA"}, {"CA", "AB"}, {"AB", "BD"}};
  auto graph = kstitch::BuildGraph(pairs);
  auto const start = kstitch::SelectStartNode(graph);

  auto const path = kstitch::FindEulerianPath(std::move(graph), start);

  REQUIRE(path.size() == pairs.size() + 1U);
  CHECK(path.front() == "AB");
  CHECK(path.back() == "BD");
  CHECK(path == std::vector<std::string>{"AB", "BC", "CA", "AB", "BD"});
}

TEST_CASE("Closed circuit returns to its start", "[algorithm][path]") {
  auto const pairs = std::vector<kstitch::KmerPair>{
      {"CAT", "ATC"}, {"ATC", "TCA"}, {"TCA", "CAT"}};

  auto const path = kstitch::FindEulerianPath(
      kstitch::BuildGraph(pairs),
      kstitch::SelectStartNode(kstitch::BuildGraph(pairs)));

  REQUIRE(path.size() == 4UL);
  CHECK(path.front() == "CAT");
  CHECK(path.back() == "CAT");
  CHECK(kstitch::Reconstruct(pairs) == "CATCAT");
}

TEST_CASE("Parallel edges are all consumed", "[algorithm][path]") {
  auto const pairs = std::vector<kstitch::KmerPair>{
      {"AA", "AA"}, {"AA", "AA"}, {"AA", "AT"}};

  CHECK(kstitch::Reconstruct(pairs) == "AAAAT");
}

TEST_CASE("Start outside the graph", "[algorithm][path][error]") {
  CHECK_THROWS_AS(
      kstitch::FindEulerianPath(kstitch::BuildGraph(kChainPairs), 17U),
      std::out_of_range);
}

TEST_CASE("Traversal can be aborted", "[algorithm][path][abort]") {
  auto n_polls = 0U;

  auto config = kstitch::ReconstructConfig();
  config.traversal_config.poll_interval = 2U;
  config.traversal_config.should_abort = [&n_polls]() -> bool {
    return ++n_polls == 2U;
  };

  auto const pairs = kstitch::Decompose("GATGCATACGCCTTTACTTGCTGTG", 4U);
  CHECK_THROWS_AS(kstitch::Reconstruct(pairs, config),
                  kstitch::TraversalAbortedError);
  CHECK(n_polls == 2U);
}

TEST_CASE("Stitch path", "[algorithm][stitch]") {
  CHECK(kstitch::StitchPath({}).empty());
  CHECK(kstitch::StitchPath({"GATT"}) == "GATT");
  CHECK(kstitch::StitchPath({"GAT", "ATT", "TTA"}) == "GATTA");
}

TEST_CASE("Round trip through shuffled k-mer pairs",
          "[algorithm][reconstruct][shuffle]") {
  using namespace std::string_literals;

  /* clang-format off */
  auto const cases = std::vector<std::pair<std::string, std::uint32_t>>{
    {"GATGCATACGCCTTTACTTGCTGTGTCCACCCCATCGGAC"s, 4U},
    {"TTGACAGGTCACGCAGAGGCGCGCCCTCCTGAAGTGCGTG"s, 5U},
    {"GACACTCGCTATGAATCTCTGATTTACCCACTCTGCCAAA"s, 6U}
  };
  /* clang-format on */

  auto rng = std::mt19937(42U);
  for (auto const& [sequence, k] : cases) {
    auto pairs = kstitch::Decompose(sequence, k);
    REQUIRE(pairs.size() == sequence.size() - k);

    CHECK(kstitch::Reconstruct(pairs) == sequence);
    for (auto i = 0; i < 5; ++i) {
      std::shuffle(pairs.begin(), pairs.end(), rng);
      CHECK(kstitch::Reconstruct(pairs) == sequence);
    }
  }
}
