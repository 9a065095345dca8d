#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "ext_header.hxx"
#include "ip_protocol.hxx"

namespace pktstack {

/** @brief Mobility Header message types (RFC 6275 section 6.1.2). */
enum class MobilityType : uint8_t {
  BindingRefreshRequest = 0u,
  HomeTestInit = 1u,
  CareOfTestInit = 2u,
  HomeTest = 3u,
  CareOfTest = 4u,
  BindingUpdate = 5u,
  BindingAcknowledgement = 6u,
  BindingError = 7u
};

/**
 * @brief Mobility Header fixed part (6 bytes), wire layout.
 *
 * @see RFC 6275 section 6.1:
 *   https://datatracker.ietf.org/doc/html/rfc6275#section-6.1
 */
struct [[gnu::packed]] MobilityHeaderPrefix {
  uint8_t payload_proto;
  uint8_t header_len;
  uint8_t mh_type;
  uint8_t reserved;
  uint16_t checksum_be;

  constexpr auto checksum() const noexcept -> uint16_t {
    return autoswap(checksum_be);
  }

  constexpr void set_checksum(uint16_t v) noexcept {
    checksum_be = autoswap(v);
  }
};

static_assert(sizeof(MobilityHeaderPrefix) == 6, "Wrong mobility header size");
static_assert(alignof(MobilityHeaderPrefix) == 1,
              "Wrong mobility header alignment");

/**
 * @brief Mobility extension header. Message data is carried verbatim and the
 * checksum is stored, not computed. The default is an 8-byte Binding
 * Refresh Request.
 */
class Mobility {
public:
  static constexpr auto protocol = IpProtocol::MobilityHeader;
  static constexpr std::string_view name = "IPv6Mobility";

  Mobility() = default;

  static auto make(MobilityType type, Bytes data) -> Result<Mobility> {
    Mobility m;
    m.set_mh_type(type);
    if (auto ok = m.set_data(std::move(data)); !ok) {
      return std::unexpected(ok.error());
    }
    return m;
  }

  auto next_header() const noexcept -> uint8_t { return payload_proto_; }
  auto mh_type() const noexcept -> uint8_t { return mh_type_; }
  auto checksum() const noexcept -> uint16_t { return checksum_; }
  auto data() const noexcept -> const Bytes& { return data_; }

  void set_next_header(IpProtocol p) noexcept { payload_proto_ = to_code(p); }

  auto set_next_header(uint8_t c) -> Result<void> {
    auto p = to_protocol(c);
    if (!p) {
      return std::unexpected(p.error());
    }
    payload_proto_ = c;
    return {};
  }

  void set_mh_type(MobilityType t) noexcept { mh_type_ = std::to_underlying(t); }
  void set_checksum(uint16_t c) noexcept { checksum_ = c; }

  auto set_data(Bytes d) -> Result<void> {
    if (sizeof(MobilityHeaderPrefix) + d.size() > EXT_HEADER_MAX_BYTES) {
      return fail(Errc::Range, std::string{name} + " would exceed " +
                                   std::to_string(EXT_HEADER_MAX_BYTES) +
                                   " bytes");
    }
    data_ = std::move(d);
    return {};
  }

  auto size() const noexcept -> std::size_t {
    return sizeof(MobilityHeaderPrefix) + data_.size();
  }

  void encode(Bytes& out) const {
    const auto total = size();
    check_alignment(name, total);
    MobilityHeaderPrefix h{};
    h.payload_proto = payload_proto_;
    h.header_len = ext_len_units(total);
    h.mh_type = mh_type_;
    h.set_checksum(checksum_);
    append_wire(out, h);
    out.insert(out.end(), data_.begin(), data_.end());
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<Mobility>> {
    auto hdr = ext_header_bytes(name, bytes);
    if (!hdr) {
      return std::unexpected(hdr.error());
    }
    auto h = wire_copy<MobilityHeaderPrefix>(*hdr);
    if (!h) {
      return fail(Errc::Format, "mobility header shorter than 6 bytes");
    }
    Mobility m;
    m.payload_proto_ = h->payload_proto;
    m.mh_type_ = h->mh_type;
    m.checksum_ = h->checksum();
    m.data_.assign(hdr->begin() + sizeof(MobilityHeaderPrefix), hdr->end());
    return Decoded<Mobility>{std::move(m), hdr->size()};
  }

  bool operator==(const Mobility&) const = default;

private:
  uint8_t payload_proto_{to_code(IpProtocol::IPv6_NoNxt)};
  uint8_t mh_type_{std::to_underlying(MobilityType::BindingRefreshRequest)};
  uint16_t checksum_{0u};
  Bytes data_ = Bytes(2u, uint8_t{0});
};

/**
 * @brief Explicit "no next header" sentinel (code 59). Occupies no bytes;
 * decoding stops at the code instead of producing one.
 */
struct NoNextHeader {
  static constexpr auto protocol = IpProtocol::IPv6_NoNxt;

  static constexpr auto size() noexcept -> std::size_t { return 0u; }
  void encode(Bytes&) const {}

  static auto decode(ByteSpan) -> Result<Decoded<NoNextHeader>> {
    return Decoded<NoNextHeader>{NoNextHeader{}, 0u};
  }

  constexpr bool operator==(const NoNextHeader&) const = default;
};

} // namespace pktstack
