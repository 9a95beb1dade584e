#ifndef KSTITCH_CONFIGS_HPP_
#define KSTITCH_CONFIGS_HPP_

#include <cstdint>
#include <functional>

namespace kstitch {

struct TraversalConfig {
  // polled every poll_interval iterations, true aborts the traversal
  std::function<bool()> should_abort;
  std::uint32_t poll_interval = 1U << 16U;
};

struct ReconstructConfig {
  bool validate = true;
  bool verbose = false;

  TraversalConfig traversal_config;
};

}  // namespace kstitch

#endif /* KSTITCH_CONFIGS_HPP_ */
