#pragma once

#include <boost/algorithm/string.hpp>
#include <folly/String.h>
#include <magic_enum.hpp>
#include <string_view>
#include <vector>

#include "common/utils/String.h"

namespace ostmig {
template <typename T>
requires(std::is_enum_v<T>) inline String toString(T t) { return String(magic_enum::enum_name(t)); }

template <typename T>
requires(std::is_enum_v<T>) inline std::string_view toStringView(T t) { return magic_enum::enum_name(t); }

auto splitAndTransform(std::string_view src, auto &&delimiterPredicte, auto &&transform) {
  using RetType = std::decay_t<decltype(transform(src))>;
  std::vector<std::string_view> slices;
  boost::split(slices, src, std::forward<decltype(delimiterPredicte)>(delimiterPredicte));
  std::vector<RetType> result;
  result.reserve(slices.size());
  for (auto slice : slices) {
    if (!slice.empty()) {
      result.push_back(transform(slice));
    }
  }
  return result;
}

// "a, b,,c " -> {"a", "b", "c"}
inline std::vector<String> splitList(std::string_view src, char delimiter = ',') {
  auto parts = splitAndTransform(src, boost::is_any_of(std::string(1, delimiter)), [](std::string_view s) {
    return folly::trimWhitespace(s).str();
  });
  std::erase_if(parts, [](const String &s) { return s.empty(); });
  return parts;
}

}  // namespace ostmig
