#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "header_view.hxx"
#include "ip_protocol.hxx"
#include "utils.hxx"

namespace pktstack {

/**
 * @brief ICMPv6 Type Numbers
 *
 * @see IANA "ICMPv6 Parameters" registry:
 *   https://www.iana.org/assignments/icmp-parameters/icmp-parameters.xhtml
 * @see RFC 4443:
 *   https://datatracker.ietf.org/doc/html/rfc4443
 */
enum class ICMPv6Type : uint8_t {
  DestinationUnreachable = 1,
  PacketTooBig = 2,
  TimeExceeded = 3,
  ParameterProblem = 4,

  EchoRequest = 128,
  EchoReply = 129,
  MulticastListenerQuery = 130,
  MulticastListenerReport = 131,
  MulticastListenerDone = 132,
  RouterSolicitation = 133,
  RouterAdvertisement = 134,
  NeighborSolicitation = 135,
  NeighborAdvertisement = 136,
  RedirectMessage = 137,
  Version2MulticastListenerReport = 143,
  HomeAgentAddressDiscoveryRequest = 144,
  HomeAgentAddressDiscoveryReply = 145,
  MobilePrefixSolicitation = 146,
  MobilePrefixAdvertisement = 147,
  ExtendedEchoRequest = 160,
  ExtendedEchoReply = 161,

  Reserved = 255
};

/**
 * @brief ICMPv6 header (type, code, checksum) (4 bytes), wire layout.
 *
 * @see RFC 4443:
 *   https://datatracker.ietf.org/doc/html/rfc4443
 */
struct [[gnu::packed]] ICMPv6Header {
  uint8_t type;
  uint8_t code;
  uint16_t checksum_be;

  constexpr auto checksum() const noexcept -> uint16_t {
    return autoswap(checksum_be);
  }

  constexpr void set_checksum(uint16_t v) noexcept {
    checksum_be = autoswap(v);
  }
};

static_assert(sizeof(ICMPv6Header) == 4, "Wrong ICMPv6 header size");
static_assert(alignof(ICMPv6Header) == 1, "Wrong ICMPv6 header alignment");

/**
 * @brief ICMPv6 message as an opaque leaf: the fixed four bytes plus the
 * message body, carried verbatim. The checksum is not recomputed.
 */
class ICMPv6 {
public:
  ICMPv6() = default;
  explicit ICMPv6(ICMPv6Type type, uint8_t code = 0, Bytes body = {})
      : type_{std::to_underlying(type)}, code_{code}, body_{std::move(body)} {}

  static constexpr auto protocol = IpProtocol::ICMPv6;

  auto type() const noexcept -> uint8_t { return type_; }
  auto code() const noexcept -> uint8_t { return code_; }
  auto checksum() const noexcept -> uint16_t { return checksum_; }
  auto body() const noexcept -> const Bytes& { return body_; }

  void set_type(ICMPv6Type t) noexcept { type_ = std::to_underlying(t); }
  void set_code(uint8_t c) noexcept { code_ = c; }
  void set_checksum(uint16_t c) noexcept { checksum_ = c; }
  void set_body(Bytes b) { body_ = std::move(b); }

  auto size() const noexcept -> std::size_t {
    return sizeof(ICMPv6Header) + body_.size();
  }

  void encode(Bytes& out) const {
    ICMPv6Header h{type_, code_, 0};
    h.set_checksum(checksum_);
    append_wire(out, h);
    out.insert(out.end(), body_.begin(), body_.end());
  }

  /** @brief Consumes all of @p bytes: the body runs to the end of payload. */
  static auto decode(ByteSpan bytes) -> Result<Decoded<ICMPv6>> {
    auto h = wire_copy<ICMPv6Header>(bytes);
    if (!h) {
      return fail(Errc::Format, "ICMPv6 header needs 4 bytes, have " +
                                    std::to_string(bytes.size()));
    }
    ICMPv6 m;
    m.type_ = h->type;
    m.code_ = h->code;
    m.checksum_ = h->checksum();
    m.body_.assign(bytes.begin() + sizeof(ICMPv6Header), bytes.end());
    return Decoded<ICMPv6>{std::move(m), bytes.size()};
  }

  bool operator==(const ICMPv6&) const = default;

private:
  uint8_t type_{std::to_underlying(ICMPv6Type::EchoRequest)};
  uint8_t code_{0};
  uint16_t checksum_{0};
  Bytes body_{};
};

/** @brief Bytes following a header whose protocol is not decoded further. */
struct RawPayload {
  Bytes data;

  auto size() const noexcept -> std::size_t { return data.size(); }

  void encode(Bytes& out) const {
    out.insert(out.end(), data.begin(), data.end());
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<RawPayload>> {
    return Decoded<RawPayload>{RawPayload{Bytes(bytes.begin(), bytes.end())},
                               bytes.size()};
  }

  bool operator==(const RawPayload&) const = default;
};

} // namespace pktstack
