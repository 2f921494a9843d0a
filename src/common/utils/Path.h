#pragma once

#include <boost/filesystem.hpp>
#include <fmt/format.h>

namespace ostmig {

using Path = boost::filesystem::path;

}  // namespace ostmig

FMT_BEGIN_NAMESPACE

template <>
struct formatter<ostmig::Path> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ostmig::Path &path, FormatContext &ctx) const {
    return formatter<std::string_view>::format(path.string(), ctx);
  }
};

FMT_END_NAMESPACE
