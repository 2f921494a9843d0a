#pragma once

#include <fmt/format.h>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string_view>

#include "common/utils/StatusCode.h"
#include "common/utils/String.h"

namespace ostmig {

// `Status` carries a code and an optional message. The message is heap allocated only when present,
// so an OK status or a bare code stays a cheap value.
class [[nodiscard]] Status {
  struct status_ok_t {};

 public:
  Status() = delete;
  explicit Status(status_code_t code)
      : code_(code) {}
  Status(const Status &other) { *this = other; }
  Status(Status &&other) = default;

  constexpr static status_ok_t OK{};
  /* implicit */ Status(status_ok_t)
      : Status(StatusCode::kOK) {}

  Status(status_code_t code, std::string_view msg)
      : code_(code),
        message_(std::make_unique<String>(msg)) {}

  Status(status_code_t code, String &&msg)
      : code_(code),
        message_(std::make_unique<String>(std::move(msg))) {}

  Status(status_code_t code, const char *msg)
      : Status(code, std::string_view(msg)) {}

  Status &operator=(const Status &other) {
    if (std::addressof(other) != this) {
      code_ = other.code_;
      message_ = other.message_ ? std::make_unique<String>(*other.message_) : nullptr;
    }
    return *this;
  }
  Status &operator=(Status &&other) = default;

  status_code_t code() const { return code_; }
  std::string_view message() const { return message_ ? std::string_view(*message_) : std::string_view(); }

  String describe() const {
    return message_ ? fmt::format("{}({}) {}", StatusCode::toString(code_), code_, *message_)
                    : fmt::format("{}({})", StatusCode::toString(code_), code_);
  }

  bool isOK() const { return code_ == StatusCode::kOK; }
  explicit operator bool() const { return isOK(); }

 private:
  status_code_t code_;
  std::unique_ptr<String> message_;
};

inline std::ostream &operator<<(std::ostream &os, const Status &status) { return os << status.describe(); }

class StatusException : public std::runtime_error {
 public:
  explicit StatusException(Status status)
      : std::runtime_error(status.describe()),
        status_(std::move(status)) {}

  const Status &get() const { return status_; }

 private:
  Status status_;
};
}  // namespace ostmig

FMT_BEGIN_NAMESPACE

template <>
struct formatter<ostmig::Status> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ostmig::Status &status, FormatContext &ctx) const {
    return formatter<std::string_view>::format(status.describe(), ctx);
  }
};

FMT_END_NAMESPACE
