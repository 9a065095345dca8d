#pragma once

#include <glog/logging.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "chain.hxx"
#include "header.hxx"

namespace pktstack {

/** @brief Layer the first byte of a raw packet belongs to. */
enum class FirstLayer : uint8_t { Ethernet, IPv6 };

struct ParseConfig {
  FirstLayer first_layer{FirstLayer::Ethernet};
  /** @brief Decoding fails once the chain would exceed this many headers. */
  std::size_t max_headers{32};
};

/**
 * @brief An ordered stack of headers, front of the wire first.
 *
 * Next-header fields are never rewritten by the stack: whoever inserts,
 * replaces or removes a header keeps the chain consistent.
 */
class Packet {
public:
  Packet() = default;
  explicit Packet(std::vector<Header> headers) : headers_{std::move(headers)} {}

  auto num_headers() const noexcept -> std::size_t { return headers_.size(); }
  bool empty() const noexcept { return headers_.empty(); }
  auto headers() const noexcept -> const std::vector<Header>& {
    return headers_;
  }

  auto begin() const noexcept { return headers_.begin(); }
  auto end() const noexcept { return headers_.end(); }

  auto add_header(Header h) -> Packet& {
    headers_.push_back(std::move(h));
    return *this;
  }

  auto operator+=(Header h) -> Packet& { return add_header(std::move(h)); }

  /** @brief Insert before the header at @p idx; @p idx == size appends. */
  auto insert_header(std::ptrdiff_t idx, Header h) -> Result<void> {
    if (idx < 0 || static_cast<std::size_t>(idx) > headers_.size()) {
      return fail(Errc::Range, "insert position " + std::to_string(idx) +
                                   " outside [0, " +
                                   std::to_string(headers_.size()) + "]");
    }
    headers_.insert(headers_.begin() + idx, std::move(h));
    return {};
  }

  /** @brief Index of the first header of kind T. */
  template <HeaderType T>
  auto get_header_index() const noexcept -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < headers_.size(); ++i) {
      if (std::holds_alternative<T>(headers_[i])) {
        return i;
      }
    }
    return std::nullopt;
  }

  template <HeaderType T> auto get_header() noexcept -> T* {
    auto i = get_header_index<T>();
    return i ? &std::get<T>(headers_[*i]) : nullptr;
  }

  template <HeaderType T> auto get_header() const noexcept -> const T* {
    auto i = get_header_index<T>();
    return i ? &std::get<T>(headers_[*i]) : nullptr;
  }

  auto at(std::ptrdiff_t idx) -> Result<Header*> {
    auto i = checked_index(idx, headers_.size());
    if (!i) {
      return std::unexpected(i.error());
    }
    return &headers_[*i];
  }

  auto at(std::ptrdiff_t idx) const -> Result<const Header*> {
    auto i = checked_index(idx, headers_.size());
    if (!i) {
      return std::unexpected(i.error());
    }
    return &headers_[*i];
  }

  auto at(const Slice& s) const -> Result<const Header*> {
    return slice_rejected(s);
  }

  /** @brief Typed access; Errc::TypeMismatch if another kind sits there. */
  template <HeaderType T> auto header_at(std::ptrdiff_t idx) -> Result<T*> {
    auto h = at(idx);
    if (!h) {
      return std::unexpected(h.error());
    }
    if (auto* p = std::get_if<T>(*h)) {
      return p;
    }
    return mismatch(idx, **h);
  }

  template <HeaderType T>
  auto header_at(std::ptrdiff_t idx) const -> Result<const T*> {
    auto h = at(idx);
    if (!h) {
      return std::unexpected(h.error());
    }
    if (const auto* p = std::get_if<T>(*h)) {
      return p;
    }
    return mismatch(idx, **h);
  }

  /** @brief Replace the header at @p idx. */
  auto set(std::ptrdiff_t idx, Header h) -> Result<void> {
    auto slot = at(idx);
    if (!slot) {
      return std::unexpected(slot.error());
    }
    **slot = std::move(h);
    return {};
  }

  auto remove(std::ptrdiff_t idx) -> Result<void> {
    auto i = checked_index(idx, headers_.size());
    if (!i) {
      return std::unexpected(i.error());
    }
    headers_.erase(headers_.begin() + static_cast<std::ptrdiff_t>(*i));
    return {};
  }

  auto remove(const Slice& s) -> Result<void> { return slice_rejected(s); }

  /** @brief Assign the next-header code of the header at @p idx. */
  auto set_next_header(std::ptrdiff_t idx, uint8_t code) -> Result<void> {
    auto h = at(idx);
    if (!h) {
      return std::unexpected(h.error());
    }
    return pktstack::set_next_header(**h, code);
  }

  auto set_next_header(std::ptrdiff_t idx, IpProtocol p) -> Result<void> {
    return set_next_header(idx, to_code(p));
  }

  auto wire_size() const -> std::size_t {
    std::size_t n = 0;
    for (const auto& h : headers_) {
      n += header_size(h);
    }
    return n;
  }

  /**
   * @brief Serialize front to back.
   *
   * Each IPv6 header gets the byte count of everything after it as its
   * payload length. Misaligned extension headers are logged and emitted
   * as they are.
   */
  auto to_bytes() const -> Bytes {
    Bytes out;
    std::size_t after = wire_size();
    out.reserve(after);
    for (const auto& h : headers_) {
      after -= header_size(h);
      std::visit(
          [&out, after](const auto& x) {
            if constexpr (std::is_same_v<std::decay_t<decltype(x)>, IPv6>) {
              x.encode(out, after);
            } else {
              x.encode(out);
            }
          },
          h);
    }
    return out;
  }

  /**
   * @brief Rebuild a stack from raw bytes.
   *
   * Follows next-header codes until code 59, a leaf header or an opaque
   * protocol, whose bytes become a trailing RawPayload. The IPv6 payload
   * length bounds what follows; a zero length with bytes present is read as
   * a jumbogram.
   */
  static auto from_bytes(ByteSpan raw, const ParseConfig& config = {})
      -> Result<Packet> {
    Packet pkt;
    ByteSpan rest = raw;
    auto kind = config.first_layer == FirstLayer::Ethernet ? HeaderKind::Ethernet
                                                           : HeaderKind::IPv6;
    for (;;) {
      if (kind == HeaderKind::NoNext) {
        if (!rest.empty()) {
          VLOG(2) << "ignoring " << rest.size()
                  << " bytes after no next header";
        }
        break;
      }
      if (rest.empty()) {
        if (kind == HeaderKind::Opaque) {
          break;
        }
        return fail(Errc::Format, "expected " + std::string{to_string(kind)} +
                                      " header at offset " +
                                      std::to_string(raw.size()) +
                                      ", no bytes left");
      }
      if (pkt.headers_.size() >= config.max_headers) {
        return fail(Errc::Format, "header chain longer than " +
                                      std::to_string(config.max_headers));
      }

      const auto offset = raw.size() - rest.size();
      auto d = decode_header(kind, rest);
      if (!d) {
        Error e = d.error();
        e.message = std::string{to_string(kind)} + " header at offset " +
                    std::to_string(offset) + ": " + e.message;
        return std::unexpected(std::move(e));
      }
      const auto here = rest;
      rest = rest.subspan(d->consumed);

      if (kind == HeaderKind::IPv6) {
        auto bounded = bound_payload(here, rest);
        if (!bounded) {
          return std::unexpected(bounded.error());
        }
        rest = *bounded;
      }

      kind = successor(d->header);
      pkt.headers_.push_back(std::move(d->header));
    }
    return pkt;
  }

  static auto from_bytes(const Bytes& raw, const ParseConfig& config = {})
      -> Result<Packet> {
    return from_bytes(ByteSpan{raw}, config);
  }

  bool operator==(const Packet&) const = default;

private:
  static auto mismatch(std::ptrdiff_t idx, const Header& h)
      -> std::unexpected<Error> {
    return fail(Errc::TypeMismatch, "header " + std::to_string(idx) + " is " +
                                        std::string{header_name(h)});
  }

  /** @brief Decoder for what follows @p h; leaves end the chain. */
  static auto successor(const Header& h) -> HeaderKind {
    if (const auto* eth = std::get_if<Ethernet>(&h)) {
      return eth->ethertype() == std::to_underlying(EtherType::IPv6)
                 ? HeaderKind::IPv6
                 : HeaderKind::Opaque;
    }
    if (auto nh = next_header_of(h)) {
      return kind_for(*nh);
    }
    return HeaderKind::NoNext;
  }

  /** @brief Clip @p rest to the payload length of the IPv6 header at @p hdr. */
  static auto bound_payload(ByteSpan hdr, ByteSpan rest) -> Result<ByteSpan> {
    const std::size_t declared = IPv6::declared_payload_length(hdr);
    if (declared == 0u) {
      if (!rest.empty()) {
        VLOG(2) << "IPv6 payload length 0 with " << rest.size()
                << " bytes following, reading as jumbogram";
      }
      return rest;
    }
    if (declared > rest.size()) {
      return fail(Errc::Format, "IPv6 payload length " +
                                    std::to_string(declared) + " exceeds " +
                                    std::to_string(rest.size()) +
                                    " available bytes");
    }
    if (declared < rest.size()) {
      VLOG(2) << "dropping " << rest.size() - declared
              << " bytes past the IPv6 payload";
    }
    return rest.first(declared);
  }

  std::vector<Header> headers_;
};

template <HeaderType A, HeaderType B> auto operator+(A a, B b) -> Packet {
  Packet p;
  p += std::move(a);
  p += std::move(b);
  return p;
}

template <HeaderType T> auto operator+(Packet p, T h) -> Packet {
  p += std::move(h);
  return p;
}

} // namespace pktstack
