#include "StatusCode.h"

namespace ostmig::StatusCode {

std::string_view toString(status_code_t code) {
  switch (code) {
#define RAW_STATUS(name, ...) \
  case k##name:               \
    return #name;
#define STATUS(ns, name, ...) \
  case ns##Code::k##name:     \
    return #ns "::" #name;
#include "StatusCodeDetails.h"
#undef RAW_STATUS
#undef STATUS
  };
  return "UnknownStatusCode";
}

StatusCodeType typeOf(status_code_t code) {
  switch (code) {
#define RAW_STATUS(name, ...) \
  case k##name:               \
    return StatusCodeType::Common;
#define STATUS(ns, name, ...) \
  case ns##Code::k##name:     \
    return StatusCodeType::ns;
#include "StatusCodeDetails.h"
#undef RAW_STATUS
#undef STATUS
  };
  return StatusCodeType::Invalid;
}

}  // namespace ostmig::StatusCode
