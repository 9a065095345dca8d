#pragma once

#include <concepts>
#include <cstring>
#include <optional>

#include "utils.hxx"

namespace pktstack {

template <typename T>
concept WireHeader = std::is_trivially_copyable_v<T> &&
                     std::is_standard_layout_v<T> && (alignof(T) == 1);

/**
 * @brief A lightweight view over a fixed wire layout inside a packet buffer.
 *
 * - Zero-copy: wraps a pointer into the packet data.
 * - Safe: alignment is 1 due to [[gnu::packed]] on wire structs.
 * - Decoders copy the layout out before building a value header.
 */
template <WireHeader H> class HeaderView {
  using header_t = H;

public:
  constexpr HeaderView() noexcept = default;
  constexpr explicit HeaderView(const header_t* p) noexcept : p_{p} {}

  constexpr explicit HeaderView(const uint8_t* p) noexcept
      : p_{reinterpret_cast<const header_t*>(p)} {}

  /** @brief View @p bytes, or an empty view if they are too short. */
  static constexpr auto over(ByteSpan bytes) noexcept -> HeaderView {
    if (bytes.size() < sizeof(header_t)) {
      return {};
    }
    return HeaderView{bytes.data()};
  }

  constexpr explicit operator bool() const noexcept { return p_ != nullptr; }
  constexpr auto get() const noexcept -> const header_t* { return p_; }

  constexpr auto operator->() const noexcept -> const header_t* { return p_; }
  constexpr auto operator*() const noexcept -> const header_t& { return *p_; }

  constexpr auto copy() const noexcept -> header_t {
    header_t out{};
    if (p_) {
      std::memcpy(&out, p_, sizeof(header_t));
    }
    return out;
  }

private:
  const header_t* p_{};
};

/** @brief A decoded value header and the number of wire bytes it used. */
template <typename H> struct Decoded {
  H header;
  std::size_t consumed;
};

/** @brief Append the raw bytes of a wire layout to @p out. */
template <WireHeader H> inline void append_wire(Bytes& out, const H& h) {
  const auto* p = reinterpret_cast<const uint8_t*>(&h);
  out.insert(out.end(), p, p + sizeof(H));
}

/** @brief Copy a wire layout out of @p bytes, or nullopt if too short. */
template <WireHeader H>
inline auto wire_copy(ByteSpan bytes) noexcept -> std::optional<H> {
  auto hv = HeaderView<H>::over(bytes);
  if (!hv) {
    return std::nullopt;
  }
  return hv.copy();
}

} // namespace pktstack
