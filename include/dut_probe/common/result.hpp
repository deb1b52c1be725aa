#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "error_code.hpp"

namespace dutprobe {

/**
 * @brief Failure detail carried by Result and Status
 *
 * `field` names the offending key for kMissingField / kInvalidField.
 * `raw` keeps the datagram bytes that could not be decoded, when there were any.
 */
struct Error {
  ErrorCode code{ErrorCode::kNone};
  std::string message{};
  std::string field{};
  std::vector<uint8_t> raw{};
};

[[nodiscard]] inline Error MakeError(ErrorCode code, std::string message) {
  return Error{code, std::move(message), {}, {}};
}

/**
 * @brief Value-or-error return type
 *
 * Mirrors the std::optional surface (has_value, operator*, operator->) so call sites
 * read the same way, with error() available when there is no value.
 */
template <typename T>
class Result {
 public:
  Result(T value)  // NOLINT(google-explicit-constructor)
      : storage_(std::move(value)) {}
  Result(Error error)  // NOLINT(google-explicit-constructor)
      : storage_(std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T &value() & { return std::get<T>(storage_); }
  [[nodiscard]] T const &value() const & { return std::get<T>(storage_); }
  [[nodiscard]] T &&value() && { return std::get<T>(std::move(storage_)); }

  [[nodiscard]] T &operator*() & { return value(); }
  [[nodiscard]] T const &operator*() const & { return value(); }
  [[nodiscard]] T &&operator*() && { return std::move(*this).value(); }
  [[nodiscard]] T *operator->() { return &value(); }
  [[nodiscard]] T const *operator->() const { return &value(); }

  [[nodiscard]] Error const &error() const & { return std::get<Error>(storage_); }
  [[nodiscard]] Error &&error() && { return std::get<Error>(std::move(storage_)); }

 private:
  std::variant<T, Error> storage_;
};

/**
 * @brief Result for operations with nothing to return on success
 */
class Status {
 public:
  Status() = default;
  Status(Error error)  // NOLINT(google-explicit-constructor)
      : error_(std::move(error)) {}

  [[nodiscard]] static Status Ok() { return {}; }

  [[nodiscard]] bool ok() const noexcept { return error_.code == ErrorCode::kNone; }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] Error const &error() const & { return error_; }
  [[nodiscard]] Error &&error() && { return std::move(error_); }

 private:
  Error error_{};
};

}  // namespace dutprobe
