#pragma once

#include <stdexcept>
#include <string>

namespace data_capturing {

/**
 * @brief Raised when captured data violates an ordering or consistency rule,
 *        e.g. a location older than its predecessor in the same track.
 */
class InconsistentDataError final : public std::runtime_error {
  public:
    explicit InconsistentDataError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief Lifecycle state that made a capturing operation illegal. */
enum class DataCapturingErrorKind {
    IsPaused,    /**< The measurement is paused but should not be. */
    NotPaused,   /**< The measurement is not paused but should be. */
    IsRunning,   /**< The measurement is running but should not be. */
    NotRunning,  /**< The measurement is neither running nor paused. */
    IsStopped    /**< The measurement was stopped and cannot be restarted. */
};

/**
 * @brief Raised when a lifecycle operation is called in a state that does not
 *        allow it, e.g. resuming a measurement that was never paused.
 */
class DataCapturingError final : public std::logic_error {
  public:
    DataCapturingError(DataCapturingErrorKind kind, const std::string& message)
        : std::logic_error(message),
          kind_(kind) {}

    [[nodiscard]] DataCapturingErrorKind kind() const noexcept {
        return kind_;
    }

  private:
    DataCapturingErrorKind kind_;
};

}  // namespace data_capturing
