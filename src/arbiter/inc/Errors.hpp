#ifndef ARBITER_ARBITER_ERRORS_HPP
#define ARBITER_ARBITER_ERRORS_HPP
/**
 * @file Errors.hpp
 * @brief Caller-visible failures of ResourceManager::acquire().
 *
 * Both are recoverable: the caller is expected to report "busy, try again".
 */

#include <stdexcept> // std::runtime_error
#include <string>    // std::string

namespace arbiter {

/// @brief Base of all arbitration errors.
class ArbiterError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief The request was not admitted within its timeout.
 * @note The request has already been removed from the queue when this is thrown.
 */
class TimeoutError : public ArbiterError {
public:
  TimeoutError(const std::string& what, bool waitedForVram)
      : ArbiterError(what), waitedForVram_(waitedForVram) {}

  /// @brief True if the last admission attempt failed on VRAM headroom.
  [[nodiscard]] bool waitedForVram() const noexcept { return waitedForVram_; }

private:
  bool waitedForVram_;
};

/// @brief Neither the control plane nor the target service could be reached.
class ResourceUnavailableError : public ArbiterError {
public:
  using ArbiterError::ArbiterError;
};

} // namespace arbiter

#endif // ARBITER_ARBITER_ERRORS_HPP
