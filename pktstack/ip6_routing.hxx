#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "address.hxx"
#include "ext_header.hxx"
#include "ip6_options.hxx"
#include "ip_protocol.hxx"

namespace pktstack {

/** @brief Routing types with a layout this library knows. */
enum class RoutingType : uint8_t {
  SourceRoute = 0u, // deprecated by RFC 5095, still decodable
  Type2 = 2u,       // Mobile IPv6 home address
  RPL = 3u,
  SegmentRouting = 4u
};

/** @brief SRv6 Segment Routing Header (SRH) TLV types. */
enum class SRv6TlvType : uint8_t { Pad1 = 0u, PadN = 4u, Hmac = 5u };

/**
 * @brief Fixed first 8 bytes of every routing header, wire layout.
 *
 * @see RFC 8200 section 4.4:
 *   https://datatracker.ietf.org/doc/html/rfc8200#section-4.4
 */
struct [[gnu::packed]] RoutingHeaderPrefix {
  uint8_t next_header;
  uint8_t hdr_ext_len;
  uint8_t routing_type;
  uint8_t segments_left;
  uint32_t type_data_be;

  constexpr auto header_length_bytes() const noexcept -> std::size_t {
    return (static_cast<std::size_t>(hdr_ext_len) + 1u) * 8u;
  }

  constexpr auto type_data() const noexcept -> uint32_t {
    return autoswap(type_data_be);
  }

  constexpr void set_type_data(uint32_t v) noexcept {
    type_data_be = autoswap(v);
  }
};

static_assert(sizeof(RoutingHeaderPrefix) == 8, "Wrong routing header size");
static_assert(alignof(RoutingHeaderPrefix) == 1,
              "Wrong routing header alignment");

/**
 * @brief IPv6 Routing extension header.
 *
 * Types 0 and 2 carry a list of addresses after the fixed part; an SRH
 * (type 4) carries last_entry + 1 segments followed by TLVs. Any bytes not
 * covered by the address list are kept verbatim in the trailer.
 *
 * @see RFC 6275 section 6.4 (type 2):
 *   https://datatracker.ietf.org/doc/html/rfc6275#section-6.4
 * @see RFC 8754 (type 4):
 *   https://datatracker.ietf.org/doc/rfc8754/
 */
class RoutingHeader {
public:
  static constexpr auto protocol = IpProtocol::IPv6_Route;
  static constexpr std::string_view name = "IPv6RouteOption";

  RoutingHeader() = default;

  /** @brief Type 2 routing header carrying one home address. */
  explicit RoutingHeader(IPv6Address home)
      : routing_type_{std::to_underlying(RoutingType::Type2)},
        segments_left_{1u}, addresses_{home} {}

  auto next_header() const noexcept -> uint8_t { return next_header_; }
  auto routing_type() const noexcept -> uint8_t { return routing_type_; }
  auto segments_left() const noexcept -> uint8_t { return segments_left_; }
  auto type_data() const noexcept -> uint32_t { return type_data_; }
  auto addresses() const noexcept -> const std::vector<IPv6Address>& {
    return addresses_;
  }
  auto trailer() const noexcept -> const Bytes& { return trailer_; }

  /** @brief First address, the only one for a type 2 header. */
  auto address() const -> Result<IPv6Address> {
    if (addresses_.empty()) {
      return fail(Errc::Range, "routing header carries no address");
    }
    return addresses_.front();
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

  auto set_routing_type(RoutingType t) -> Result<void> {
    return set_routing_type(std::to_underlying(t));
  }

  auto set_routing_type(uint8_t t) -> Result<void> {
    if (auto ok = check_trailer(t, trailer_.size()); !ok) {
      return ok;
    }
    routing_type_ = t;
    return {};
  }

  void set_segments_left(uint8_t s) noexcept { segments_left_ = s; }
  void set_type_data(uint32_t v) noexcept { type_data_ = v; }

  auto add_address(IPv6Address a) -> Result<void> {
    if (size() + 16u > EXT_HEADER_MAX_BYTES) {
      return too_large();
    }
    addresses_.push_back(a);
    return {};
  }

  auto set_trailer(Bytes t) -> Result<void> {
    if (sizeof(RoutingHeaderPrefix) + addresses_.size() * 16u + t.size() >
        EXT_HEADER_MAX_BYTES) {
      return too_large();
    }
    if (auto ok = check_trailer(routing_type_, t.size()); !ok) {
      return ok;
    }
    trailer_ = std::move(t);
    return {};
  }

  // SRH view of the type-specific word: last entry, flags, tag.
  auto last_entry() const noexcept -> uint8_t {
    return static_cast<uint8_t>(type_data_ >> 24);
  }

  auto flags() const noexcept -> uint8_t {
    return static_cast<uint8_t>(type_data_ >> 16);
  }

  auto tag() const noexcept -> uint16_t {
    return static_cast<uint16_t>(type_data_ & 0xFFFFu);
  }

  void set_srh_fields(uint8_t last_entry, uint8_t flags, uint16_t tag) noexcept {
    type_data_ = (static_cast<uint32_t>(last_entry) << 24) |
                 (static_cast<uint32_t>(flags) << 16) | tag;
  }

  bool is_srh() const noexcept {
    return routing_type_ == std::to_underlying(RoutingType::SegmentRouting);
  }

  /** @brief Walk the SRH TLV area held in the trailer. */
  auto srh_tlvs() const -> Result<std::vector<Tlv>> {
    if (!is_srh()) {
      return fail(Errc::TypeMismatch, "routing type " +
                                          std::to_string(routing_type_) +
                                          " has no TLV area");
    }
    std::vector<Tlv> out;
    TlvIterator it{trailer_, std::to_underlying(SRv6TlvType::Pad1)};
    Tlv t{};
    while (it.next(t)) {
      out.push_back(t);
    }
    if (it.truncated()) {
      return fail(Errc::Format, "SRH TLV truncated at offset " +
                                    std::to_string(it.offset()));
    }
    return out;
  }

  auto size() const noexcept -> std::size_t {
    return sizeof(RoutingHeaderPrefix) + addresses_.size() * 16u +
           trailer_.size();
  }

  void encode(Bytes& out) const {
    const auto total = size();
    check_alignment(name, total);
    RoutingHeaderPrefix h{};
    h.next_header = next_header_;
    h.hdr_ext_len = ext_len_units(total);
    h.routing_type = routing_type_;
    h.segments_left = segments_left_;
    h.set_type_data(type_data_);
    append_wire(out, h);
    for (const auto& a : addresses_) {
      out.insert(out.end(), a.bytes().begin(), a.bytes().end());
    }
    out.insert(out.end(), trailer_.begin(), trailer_.end());
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<RoutingHeader>> {
    auto hdr = ext_header_bytes(name, bytes);
    if (!hdr) {
      return std::unexpected(hdr.error());
    }
    auto p = wire_copy<RoutingHeaderPrefix>(*hdr);
    if (!p) {
      return fail(Errc::Format, "routing header shorter than 8 bytes");
    }

    RoutingHeader rh;
    rh.next_header_ = p->next_header;
    rh.routing_type_ = p->routing_type;
    rh.segments_left_ = p->segments_left;
    rh.type_data_ = p->type_data();

    ByteReader body{hdr->subspan(sizeof(RoutingHeaderPrefix))};
    std::size_t count = 0;
    switch (static_cast<RoutingType>(rh.routing_type_)) {
    case RoutingType::SourceRoute:
    case RoutingType::Type2:
      count = body.remaining() / 16u;
      break;
    case RoutingType::SegmentRouting:
      count = static_cast<std::size_t>(rh.last_entry()) + 1u;
      break;
    case RoutingType::RPL:
      break;
    }

    for (std::size_t i = 0; i < count; ++i) {
      auto seg = body.take(16u);
      if (!seg) {
        return fail(Errc::Format, "routing header segment " +
                                      std::to_string(i) + ": " +
                                      seg.error().message);
      }
      rh.addresses_.emplace_back(seg->first<16>());
    }
    auto rest = body.rest();
    rh.trailer_.assign(rest.begin(), rest.end());
    return Decoded<RoutingHeader>{std::move(rh), hdr->size()};
  }

  bool operator==(const RoutingHeader&) const = default;

private:
  static bool carries_address_list(uint8_t type) noexcept {
    return type == std::to_underlying(RoutingType::SourceRoute) ||
           type == std::to_underlying(RoutingType::Type2);
  }

  // Types 0 and 2 read every whole 16 bytes after the prefix as an address.
  static auto check_trailer(uint8_t type, std::size_t len) -> Result<void> {
    if (carries_address_list(type) && len >= 16u) {
      return fail(Errc::Range, "routing type " + std::to_string(type) +
                                   " cannot carry a trailer of " +
                                   std::to_string(len) + " bytes");
    }
    return {};
  }

  static auto too_large() -> std::unexpected<Error> {
    return fail(Errc::Range, std::string{name} + " would exceed " +
                                 std::to_string(EXT_HEADER_MAX_BYTES) +
                                 " bytes");
  }

  uint8_t next_header_{to_code(IpProtocol::IPv6_NoNxt)};
  uint8_t routing_type_{std::to_underlying(RoutingType::Type2)};
  uint8_t segments_left_{0u};
  uint32_t type_data_{0u};
  std::vector<IPv6Address> addresses_;
  Bytes trailer_;
};

} // namespace pktstack
