#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace pktstack {

/** @brief Kinds of failure reported by the codec and the header stack. */
enum class Errc : uint8_t {
  Format,       // malformed or truncated wire bytes
  TypeMismatch, // value of the wrong kind for a typed field or slot
  Range,        // index or field value out of bounds
  Shape,        // slice query where only scalar indexing exists
  EnumValue     // code outside an enumerated table
};

constexpr auto to_string(Errc e) noexcept -> std::string_view {
  switch (e) {
  case Errc::Format: return "format error";
  case Errc::TypeMismatch: return "type mismatch";
  case Errc::Range: return "index out of range";
  case Errc::Shape: return "unsupported query shape";
  case Errc::EnumValue: return "undefined enumerated value";
  }
  return "unknown error";
}

struct Error {
  Errc code;
  std::string message;

  auto what() const -> std::string {
    return std::string{to_string(code)} + ": " + message;
  }
};

template <typename T> using Result = std::expected<T, Error>;

inline auto fail(Errc code, std::string message) -> std::unexpected<Error> {
  return std::unexpected<Error>{Error{code, std::move(message)}};
}

/** @brief Half-open range query; containers reject it with Errc::Shape. */
struct Slice {
  std::ptrdiff_t start{0};
  std::ptrdiff_t stop{0};
};

/**
 * @brief Validate a signed index against a container size.
 *
 * Negative indices are not an alias for "from the end".
 */
inline auto checked_index(std::ptrdiff_t idx, std::size_t size)
    -> Result<std::size_t> {
  if (idx < 0 || static_cast<std::size_t>(idx) >= size) {
    return fail(Errc::Range, "index " + std::to_string(idx) +
                                 " outside [0, " + std::to_string(size) + ")");
  }
  return static_cast<std::size_t>(idx);
}

inline auto slice_rejected(const Slice& s) -> std::unexpected<Error> {
  return fail(Errc::Shape, "slice [" + std::to_string(s.start) + ":" +
                               std::to_string(s.stop) +
                               "] requested, only integer indexing is supported");
}

} // namespace pktstack
