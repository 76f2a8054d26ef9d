// === Errors ==================================================================
//
// Error taxonomy shared by the coordination components. Only the kinds that
// cross an API boundary synchronously are thrown; stale data, routing gaps and
// state conflicts are reported as values by the components that detect them.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace guard_link {

/** @brief Classification attached to every coordination failure. */
enum class ErrorKind {
    Authentication,  /**< Bad or expired token, connection refused, access denied. */
    Validation,      /**< Malformed input or unknown agent/site/alert. */
    StaleData,       /**< Out-of-order sample; dropped silently. */
    Routing,         /**< Room without any known recipient. */
    Persistence,     /**< Durable store write failed. */
    StateConflict    /**< Transition requested on a terminal alert. */
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/** @brief Base exception carrying an ErrorKind. */
class GuardLinkError : public std::runtime_error {
  public:
    GuardLinkError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept;

  private:
    ErrorKind kind_;
};

class AuthenticationError final : public GuardLinkError {
  public:
    explicit AuthenticationError(const std::string& message);
};

class ValidationError final : public GuardLinkError {
  public:
    explicit ValidationError(const std::string& message);
};

class PersistenceError final : public GuardLinkError {
  public:
    explicit PersistenceError(const std::string& message);
};

}  // namespace guard_link
