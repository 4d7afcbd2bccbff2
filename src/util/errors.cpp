#include "csv_reflow/errors.hpp"

namespace cr {

std::string_view error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:                 return "none";
    case ErrorKind::EmptyInput:           return "empty_input";
    case ErrorKind::DecodeFailure:        return "decode_failure";
    case ErrorKind::ParseFailure:         return "parse_failure";
    case ErrorKind::ConfigurationInvalid: return "configuration_invalid";
    case ErrorKind::Io:                   return "io";
  }
  return "unknown";
}

}
