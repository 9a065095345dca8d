#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "error.hxx"

namespace pktstack {

using Bytes = std::vector<uint8_t>;
using ByteSpan = std::span<const uint8_t>;

template <typename T, typename V> struct is_variant_member : std::false_type {};

template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

/** @brief T is one of the alternatives of the variant V. */
template <typename T, typename V>
concept VariantMember = is_variant_member<T, V>::value;

/** @brief Byte-swap a value if the host is little-endian. */
template <typename _Tp>
  requires std::integral<_Tp>
constexpr _Tp autoswap(_Tp tp) {
  if constexpr (std::endian::native == std::endian::little) {
    return std::byteswap(tp);
  } else {
    return tp;
  }
}

/** @brief Read a trivially copyable type from a byte array. */
template <typename _Tp>
  requires std::is_trivially_copyable_v<_Tp>
constexpr _Tp read_from_bytes(const uint8_t* src) {
  _Tp tp;
  std::memcpy(&tp, src, sizeof(_Tp));
  return tp;
}

/**
 * @brief Encode @p value as a @p width byte big-endian field.
 *
 * Fails with Errc::Range when the value needs more than @p width bytes.
 */
inline auto encode_uint(uint64_t value, std::size_t width) -> Result<Bytes> {
  if (width == 0 || width > sizeof(uint64_t)) {
    return fail(Errc::Range, "field width " + std::to_string(width) +
                                 " not in [1, 8]");
  }
  if (width < sizeof(uint64_t) && (value >> (width * 8u)) != 0u) {
    return fail(Errc::Range, "value " + std::to_string(value) +
                                 " does not fit in " + std::to_string(width) +
                                 " bytes");
  }
  Bytes out(width);
  for (std::size_t i = 0; i < width; ++i) {
    out[width - 1 - i] = static_cast<uint8_t>(value >> (i * 8u));
  }
  return out;
}

/** @brief Decode a @p width byte big-endian field; returns value and rest. */
inline auto decode_uint(ByteSpan bytes, std::size_t width)
    -> Result<std::pair<uint64_t, ByteSpan>> {
  if (width == 0 || width > sizeof(uint64_t)) {
    return fail(Errc::Range, "field width " + std::to_string(width) +
                                 " not in [1, 8]");
  }
  if (bytes.size() < width) {
    return fail(Errc::Format, "need " + std::to_string(width) +
                                  " bytes, have " +
                                  std::to_string(bytes.size()));
  }
  uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    v = (v << 8u) | bytes[i];
  }
  return std::pair{v, bytes.subspan(width)};
}

/**
 * @brief Bounds-checked forward cursor over a read-only byte buffer.
 *
 * Every successful read advances by at least one octet.
 */
class ByteReader {
public:
  constexpr explicit ByteReader(ByteSpan data) noexcept : data_{data} {}

  constexpr auto offset() const noexcept -> std::size_t { return pos_; }
  constexpr auto remaining() const noexcept -> std::size_t {
    return data_.size() - pos_;
  }
  constexpr bool empty() const noexcept { return pos_ >= data_.size(); }
  constexpr auto rest() const noexcept -> ByteSpan {
    return data_.subspan(pos_);
  }

  template <std::unsigned_integral _Tp> auto read() -> Result<_Tp> {
    if (remaining() < sizeof(_Tp)) {
      return truncated(sizeof(_Tp));
    }
    const auto v = autoswap(read_from_bytes<_Tp>(data_.data() + pos_));
    pos_ += sizeof(_Tp);
    return v;
  }

  auto take(std::size_t n) -> Result<ByteSpan> {
    if (remaining() < n) {
      return truncated(n);
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
  }

private:
  auto truncated(std::size_t wanted) const -> std::unexpected<Error> {
    return fail(Errc::Format, "truncated at offset " + std::to_string(pos_) +
                                  ": need " + std::to_string(wanted) +
                                  " bytes, have " +
                                  std::to_string(remaining()));
  }

  ByteSpan data_;
  std::size_t pos_{0};
};

} // namespace pktstack
