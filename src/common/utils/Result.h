#pragma once

#include <folly/Expected.h>
#include <folly/Likely.h>
#include <folly/Unit.h>
#include <folly/logging/xlog.h>

#include "common/utils/Status.h"

#define RETURN_ERROR(result) return ::ostmig::makeError(std::move(result.error()))

#define MAKE_ERROR_F(code, ...) ::ostmig::makeError((code), fmt::format(__VA_ARGS__))

#define RETURN_ON_ERROR(result)         \
  do {                                  \
    auto &&_result = (result);          \
    if (UNLIKELY(_result.hasError())) { \
      RETURN_ERROR(_result);            \
    }                                   \
  } while (0)

#define RETURN_AND_LOG_ON_ERROR(result)         \
  do {                                          \
    auto &&_result = (result);                  \
    if (UNLIKELY(_result.hasError())) {         \
      XLOGF(ERR, "error: {}", _result.error()); \
      RETURN_ERROR(_result);                    \
    }                                           \
  } while (0)

#define RETURN_ON_ERROR_MSG_WRAP(originResult, fmt_str, ...)                                     \
  do {                                                                                           \
    auto &&_sub_result = (originResult);                                                         \
    if (UNLIKELY(_sub_result.hasError())) {                                                      \
      auto _code = _sub_result.error().code();                                                   \
      auto _msg = _sub_result.error().message();                                                 \
      return MAKE_ERROR_F(_code, fmt_str ". origin error: {}" __VA_OPT__(, ) __VA_ARGS__, _msg); \
    }                                                                                            \
  } while (false)

#define CHECK_RESULT(name, expr)           \
  auto &&name##Result = (expr);            \
  if (UNLIKELY(name##Result.hasError())) { \
    RETURN_ERROR(name##Result);            \
  }                                        \
  auto &name = *name##Result

namespace ostmig {
template <typename T>
using Result = folly::Expected<T, Status>;

template <typename T>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<Result<T>> : std::true_type {};

using Void = folly::Unit;

template <typename... Args>
[[nodiscard]] inline folly::Unexpected<Status> makeError(Args &&...args) {
  return folly::makeUnexpected(Status(std::forward<Args>(args)...));
}

template <typename T>
[[nodiscard]] inline status_code_t getStatusCode(const Result<T> &result) {
  return result.hasError() ? result.error().code() : StatusCode::kOK;
}

}  // namespace ostmig

FMT_BEGIN_NAMESPACE

template <>
struct formatter<folly::Unit> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const folly::Unit &, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "Void{{}}");
  }
};

template <typename T>
struct formatter<ostmig::Result<T>> : formatter<T> {
  template <typename FormatContext>
  auto format(const ostmig::Result<T> &result, FormatContext &ctx) const {
    if (result.hasError()) return fmt::format_to(ctx.out(), "{}", result.error());
    return formatter<T>::format(result.value(), ctx);
  }
};

FMT_END_NAMESPACE
