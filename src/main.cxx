#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "biosoup/timer.hpp"
#include "cxxopts.hpp"
#include "fmt/compile.h"
#include "fmt/core.h"
#include "kstitch/algorithm.hpp"
#include "kstitch/configs.hpp"
#include "kstitch/io.hpp"

int main(int argc, char** argv) {
  try {
    auto options = cxxopts::Options(
        "kstitch", "kstitch reconstructs a sequence from paired k-mers");

    /* clang-format off */
    options.add_options()
      ("k,kmer-len", "k used to decompose fasta/fastq sequences, each record is reconstructed on its own", cxxopts::value<std::uint32_t>())
      ("n,name", "name of the output record for pairs input", cxxopts::value<std::string>()->default_value("contig"))
      ("no-validate", "skip connectivity and degree checks before the walk")
      ("v,verbose", "print stage timings to stderr")
      ("h,help", "print help")
      ("input", "pairs file ('-' for stdin) or fasta/fastq file", cxxopts::value<std::string>());
    /* clang-format on */

    options.parse_positional({"input"});
    options.positional_help("<input>");
    auto const result = options.parse(argc, argv);

    if (result.count("help") || !result.count("input")) {
      fmt::print(stderr, "{}\n", options.help());
      return result.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    auto config = kstitch::ReconstructConfig();
    config.validate = !result.count("no-validate");
    config.verbose = result.count("verbose") > 0U;

    auto timer = biosoup::Timer();
    auto const input_path = result["input"].as<std::string>();

    if (!kstitch::IsSequenceFile(input_path)) {
      timer.Start();
      auto const pairs = kstitch::LoadPairs(input_path);

      if (config.verbose) {
        fmt::print(stderr,
                   FMT_COMPILE("[kstitch]({:12.3f}s) : loaded {} pairs\n"),
                   timer.Stop(), pairs.size());
      }

      auto const sequence = kstitch::Reconstruct(pairs, config);
      fmt::print(stdout, FMT_COMPILE(">{}\n{}\n"),
                 result["name"].as<std::string>(), sequence);

      return EXIT_SUCCESS;
    }

    if (!result.count("kmer-len")) {
      throw std::invalid_argument(
          "[kstitch] --kmer-len is required for fasta/fastq input");
    }

    timer.Start();
    auto const reads = kstitch::LoadReads(input_path);

    if (config.verbose) {
      fmt::print(stderr,
                 FMT_COMPILE("[kstitch]({:12.3f}s) : loaded {} sequences\n"),
                 timer.Stop(), reads.size());
    }

    timer.Start();
    auto const contigs = kstitch::ReconstructReads(
        reads, result["kmer-len"].as<std::uint32_t>(), config);

    if (config.verbose) {
      fmt::print(stderr,
                 FMT_COMPILE("[kstitch]({:12.3f}s) : reconstructed {} "
                             "sequences\n"),
                 timer.Stop(), contigs.size());
    }

    for (auto const& it : contigs) {
      fmt::print(stdout, FMT_COMPILE(">{}\n{}\n"), it->name, it->InflateData());
    }

  } catch (std::exception const& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
