#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace cr {

// Stream-level conditions surfaced to the caller. Malformed records are
// warnings and never appear here; an ambiguous delimiter sample resolves to
// the fallback and is never reported either.
enum class ErrorKind {
  None,
  EmptyInput,
  DecodeFailure,
  ParseFailure,          // quoted field never closed, or larger than the record limit
  ConfigurationInvalid,
  Io,
};

std::string_view error_kind_name(ErrorKind k) noexcept;

struct ReflowError {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::uint64_t line = 0; // physical input line, 0 if not tied to one

  explicit operator bool() const noexcept { return kind != ErrorKind::None; }
};

struct MalformedRecord {
  std::uint64_t line = 0;
  std::size_t expected_fields = 0;
  std::size_t actual_fields = 0;
};

}
