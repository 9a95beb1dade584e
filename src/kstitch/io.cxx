#include "kstitch/io.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "bioparser/fasta_parser.hpp"
#include "bioparser/fastq_parser.hpp"
#include "fmt/compile.h"
#include "fmt/core.h"

std::atomic_uint32_t biosoup::NucleicAcid::num_objects{0U};

namespace kstitch {

namespace detail {

auto constexpr kFastaExts = std::array<char const*, 4>{
    ".fasta", ".fa", ".fasta.gz", ".fa.gz"};
auto constexpr kFastqExts = std::array<char const*, 4>{
    ".fastq", ".fq", ".fastq.gz", ".fq.gz"};

auto constexpr kArrow = std::string_view("->");

auto HasExtension(std::string_view path,
                  std::array<char const*, 4> const& exts) -> bool {
  return std::any_of(exts.cbegin(), exts.cend(),
                     [path](std::string_view ext) -> bool {
                       return path.size() >= ext.size() &&
                              path.substr(path.size() - ext.size()) == ext;
                     });
}

auto CreateParser(std::string const& path)
    -> std::unique_ptr<bioparser::Parser<biosoup::NucleicAcid>> {
  using ReadParser = bioparser::Parser<biosoup::NucleicAcid>;

  if (HasExtension(path, kFastaExts)) {
    return ReadParser::Create<bioparser::FastaParser>(path);
  }
  if (HasExtension(path, kFastqExts)) {
    return ReadParser::Create<bioparser::FastqParser>(path);
  }

  throw std::invalid_argument(
      fmt::format(FMT_COMPILE("[kstitch::LoadReads] unsupported file type {}"),
                  path));
}

// "SRC DST", "SRC -> DST" and "SRC->DST" are accepted
auto ParsePairLine(std::string const& line, std::size_t const line_no)
    -> KmerPair {
  auto tokens = std::vector<std::string>();
  auto iss = std::istringstream(line);
  for (auto token = std::string(); iss >> token;) {
    if (auto const pos = token.find(kArrow);
        pos != std::string::npos && token != kArrow) {
      if (pos > 0U) {
        tokens.emplace_back(token.substr(0U, pos));
      }
      tokens.emplace_back(kArrow);
      if (pos + kArrow.size() < token.size()) {
        tokens.emplace_back(token.substr(pos + kArrow.size()));
      }
    } else {
      tokens.emplace_back(std::move(token));
    }
  }

  if (tokens.size() == 3U && tokens[1] == kArrow) {
    tokens.erase(std::next(tokens.begin()));
  }

  if (tokens.size() != 2U || tokens[0] == kArrow || tokens[1] == kArrow) {
    throw std::invalid_argument(fmt::format(
        FMT_COMPILE("[kstitch::ParsePairs] malformed pair on line {}: '{}'"),
        line_no, line));
  }

  return KmerPair{.source = std::move(tokens[0]),
                  .destination = std::move(tokens[1])};
}

}  // namespace detail

auto ParsePairs(std::istream& is) -> std::vector<KmerPair> {
  auto dst = std::vector<KmerPair>();

  auto line = std::string();
  for (auto line_no = 1UL; std::getline(is, line); ++line_no) {
    auto const first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    dst.emplace_back(detail::ParsePairLine(line, line_no));
  }

  if (is.bad()) {
    throw std::runtime_error("[kstitch::ParsePairs] error reading input");
  }

  return dst;
}

auto LoadPairs(std::string const& path) -> std::vector<KmerPair> {
  if (path == "-") {
    return ParsePairs(std::cin);
  }

  auto ifs = std::ifstream(path);
  if (!ifs.is_open()) {
    throw std::runtime_error(fmt::format(
        FMT_COMPILE("[kstitch::LoadPairs] unable to open {}"), path));
  }

  return ParsePairs(ifs);
}

auto IsSequenceFile(std::string_view path) -> bool {
  return detail::HasExtension(path, detail::kFastaExts) ||
         detail::HasExtension(path, detail::kFastqExts);
}

auto LoadReads(std::string const& path)
    -> std::vector<std::unique_ptr<biosoup::NucleicAcid>> {
  return detail::CreateParser(path)->Parse(
      std::numeric_limits<std::uint64_t>::max());
}

auto Decompose(std::string_view sequence, std::uint32_t const k)
    -> std::vector<KmerPair> {
  if (k == 0U) {
    throw std::invalid_argument("[kstitch::Decompose] k must be positive");
  }
  if (sequence.size() < k + 1ULL) {
    throw std::invalid_argument(fmt::format(
        FMT_COMPILE("[kstitch::Decompose] sequence of length {} is shorter "
                    "than k + 1 = {}"),
        sequence.size(), k + 1ULL));
  }

  auto dst = std::vector<KmerPair>();
  dst.reserve(sequence.size() - k);
  for (auto i = 0UL; i + k < sequence.size(); ++i) {
    dst.push_back(KmerPair{.source = std::string(sequence.substr(i, k)),
                           .destination =
                               std::string(sequence.substr(i + 1U, k))});
  }

  return dst;
}

}  // namespace kstitch
