#ifndef KSTITCH_ERRORS_HPP_
#define KSTITCH_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace kstitch {

/**
 * @brief base for every failure of the reconstruction pipeline
 */
class ReconstructionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// no paired k-mers were supplied
class EmptyInputError : public ReconstructionError {
 public:
  using ReconstructionError::ReconstructionError;
};

// edges left unconsumed, the graph has more than one component
class DisconnectedGraphError : public ReconstructionError {
 public:
  using ReconstructionError::ReconstructionError;
};

// degree imbalance rules out an eulerian path
class NoEulerianPathError : public ReconstructionError {
 public:
  using ReconstructionError::ReconstructionError;
};

class TraversalAbortedError : public ReconstructionError {
 public:
  using ReconstructionError::ReconstructionError;
};

class InvalidPairError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace kstitch

#endif /* KSTITCH_ERRORS_HPP_ */
