#pragma once

#include <string>
#include <string_view>

namespace ostmig {

using String = std::string;

}  // namespace ostmig
