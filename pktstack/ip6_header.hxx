#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>

#include "address.hxx"
#include "header_view.hxx"
#include "ip_protocol.hxx"
#include "utils.hxx"

namespace pktstack {

static constexpr uint32_t IPV6_FLOW_LABEL_MASK = 0x000FFFFFu;
static constexpr uint8_t IPV6_DEFAULT_HOP_LIMIT = 64u;

/**
 * @brief IPv6 header (40 bytes), wire layout.
 *
 * @see IANA IPv6 Parameters:
 *   https://www.iana.org/assignments/ipv6-parameters/ipv6-parameters.xhtml
 * @see IETF RFC 8200 (Internet Protocol, Version 6 (IPv6) Specification):
 *   https://datatracker.ietf.org/doc/html/rfc8200
 */
struct [[gnu::packed]] IPv6Header {
  uint32_t ver_tc_flow_be;
  uint16_t payload_length_be;
  uint8_t next_header;
  uint8_t hop_limit;
  uint8_t src_addr[16];
  uint8_t dst_addr[16];

  constexpr auto ver_tc_flow_host() const noexcept -> uint32_t {
    return autoswap(ver_tc_flow_be);
  }

  constexpr auto version() const noexcept -> uint8_t {
    return static_cast<uint8_t>((ver_tc_flow_host() >> 28) & 0x0Fu);
  }

  constexpr auto traffic_class() const noexcept -> uint8_t {
    return static_cast<uint8_t>((ver_tc_flow_host() >> 20) & 0xFFu);
  }

  constexpr auto flow_label() const noexcept -> uint32_t {
    return static_cast<uint32_t>(ver_tc_flow_host() & IPV6_FLOW_LABEL_MASK);
  }

  constexpr auto payload_length() const noexcept -> uint16_t {
    return autoswap(payload_length_be);
  }

  constexpr auto src_bytes() const noexcept -> std::span<const uint8_t, 16> {
    return std::span<const uint8_t, 16>{src_addr, 16};
  }

  constexpr auto dst_bytes() const noexcept -> std::span<const uint8_t, 16> {
    return std::span<const uint8_t, 16>{dst_addr, 16};
  }

  constexpr void set_ver_tc_flow(uint8_t ver, uint8_t tc, uint32_t flow) noexcept {
    ver_tc_flow_be = autoswap((static_cast<uint32_t>(ver) << 28) |
                              (static_cast<uint32_t>(tc) << 20) |
                              (flow & IPV6_FLOW_LABEL_MASK));
  }

  constexpr void set_payload_length(uint16_t v) noexcept {
    payload_length_be = autoswap(v);
  }
};

static_assert(sizeof(IPv6Header) == 40, "Wrong IPv6 header size");
static_assert(alignof(IPv6Header) == 1, "Wrong IPv6 header alignment");

/**
 * @brief Base IPv6 header as a value.
 *
 * The payload length is not a field here: it is written at encode time from
 * the size of whatever follows in the stack.
 */
class IPv6 {
public:
  IPv6() = default;
  IPv6(IPv6Address src, IPv6Address dst,
       IpProtocol next = IpProtocol::IPv6_NoNxt) noexcept
      : next_header_{to_code(next)}, src_{src}, dst_{dst} {}

  static constexpr auto protocol = IpProtocol::IPv6;

  auto traffic_class() const noexcept -> uint8_t { return traffic_class_; }
  auto flow_label() const noexcept -> uint32_t { return flow_label_; }
  auto hop_limit() const noexcept -> uint8_t { return hop_limit_; }
  auto next_header() const noexcept -> uint8_t { return next_header_; }
  auto src() const noexcept -> const IPv6Address& { return src_; }
  auto dst() const noexcept -> const IPv6Address& { return dst_; }

  void set_traffic_class(uint8_t tc) noexcept { traffic_class_ = tc; }
  void set_hop_limit(uint8_t h) noexcept { hop_limit_ = h; }

  auto set_flow_label(uint32_t fl) -> Result<void> {
    if (fl > IPV6_FLOW_LABEL_MASK) {
      return fail(Errc::Range,
                  "flow label " + std::to_string(fl) + " exceeds 20 bits");
    }
    flow_label_ = fl;
    return {};
  }

  void set_next_header(IpProtocol p) noexcept { next_header_ = to_code(p); }

  auto set_next_header(uint8_t c) -> Result<void> {
    auto p = to_protocol(c);
    if (!p) {
      return std::unexpected(p.error());
    }
    next_header_ = c;
    return {};
  }

  void set_src(IPv6Address a) noexcept { src_ = a; }
  void set_dst(IPv6Address a) noexcept { dst_ = a; }

  auto set_src(const IpAddress& a) -> Result<void> {
    auto v6 = a.as_v6();
    if (!v6) {
      return std::unexpected(v6.error());
    }
    src_ = *v6;
    return {};
  }

  auto set_dst(const IpAddress& a) -> Result<void> {
    auto v6 = a.as_v6();
    if (!v6) {
      return std::unexpected(v6.error());
    }
    dst_ = *v6;
    return {};
  }

  static constexpr auto size() noexcept -> std::size_t {
    return sizeof(IPv6Header);
  }

  /**
   * @brief Append the header for a payload of @p payload_len bytes.
   *
   * Payloads above 65535 bytes get a zero length field (RFC 2675); the
   * caller is expected to carry a Jumbo Payload option.
   */
  void encode(Bytes& out, std::size_t payload_len) const {
    IPv6Header h{};
    h.set_ver_tc_flow(6u, traffic_class_, flow_label_);
    h.set_payload_length(payload_len > 0xFFFFu
                             ? uint16_t{0}
                             : static_cast<uint16_t>(payload_len));
    h.next_header = next_header_;
    h.hop_limit = hop_limit_;
    std::copy(src_.bytes().begin(), src_.bytes().end(), h.src_addr);
    std::copy(dst_.bytes().begin(), dst_.bytes().end(), h.dst_addr);
    append_wire(out, h);
  }

  /** @brief Decode the fixed 40 bytes; the payload is left to the caller. */
  static auto decode(ByteSpan bytes) -> Result<Decoded<IPv6>> {
    auto h = wire_copy<IPv6Header>(bytes);
    if (!h) {
      return fail(Errc::Format, "IPv6 header needs 40 bytes, have " +
                                    std::to_string(bytes.size()));
    }
    if (h->version() != 6u) {
      return fail(Errc::Format, "IP version " + std::to_string(h->version()) +
                                    " in IPv6 header");
    }
    IPv6 ip;
    ip.traffic_class_ = h->traffic_class();
    ip.flow_label_ = h->flow_label();
    ip.next_header_ = h->next_header;
    ip.hop_limit_ = h->hop_limit;
    ip.src_ = IPv6Address{h->src_bytes()};
    ip.dst_ = IPv6Address{h->dst_bytes()};
    return Decoded<IPv6>{ip, sizeof(IPv6Header)};
  }

  /** @brief Payload length field of an encoded header at @p bytes. */
  static auto declared_payload_length(ByteSpan bytes) noexcept -> uint16_t {
    auto h = wire_copy<IPv6Header>(bytes);
    return h ? h->payload_length() : uint16_t{0};
  }

  bool operator==(const IPv6&) const = default;

private:
  uint8_t traffic_class_{0};
  uint32_t flow_label_{0};
  uint8_t next_header_{to_code(IpProtocol::IPv6_NoNxt)};
  uint8_t hop_limit_{IPV6_DEFAULT_HOP_LIMIT};
  IPv6Address src_{IPv6Address::unspecified()};
  IPv6Address dst_{IPv6Address::unspecified()};
};

} // namespace pktstack
