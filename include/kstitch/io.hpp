#ifndef KSTITCH_IO_HPP_
#define KSTITCH_IO_HPP_

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "biosoup/nucleic_acid.hpp"
#include "kstitch/graph.hpp"

namespace kstitch {

/**
 * @brief Parse one pair per line, "SRC DST" or "SRC -> DST"
 */
auto ParsePairs(std::istream& is) -> std::vector<KmerPair>;

/**
 * @brief Load pairs from a file, "-" reads stdin
 */
auto LoadPairs(std::string const& path) -> std::vector<KmerPair>;

/**
 * @brief Check if path names a fasta/fastq file
 */
auto IsSequenceFile(std::string_view path) -> bool;

/**
 * @brief Load every record of a fasta/fastq file, optionally gzipped
 */
auto LoadReads(std::string const& path)
    -> std::vector<std::unique_ptr<biosoup::NucleicAcid>>;

/**
 * @brief Split sequence into pairs of consecutive overlapping k-mers
 */
auto Decompose(std::string_view sequence, std::uint32_t const k)
    -> std::vector<KmerPair>;

}  // namespace kstitch

#endif /* KSTITCH_IO_HPP_ */
