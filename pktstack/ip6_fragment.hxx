#pragma once

#include <cstdint>
#include <string>

#include "header_view.hxx"
#include "ip_protocol.hxx"
#include "utils.hxx"

namespace pktstack {

static constexpr uint16_t FRAG6_OFFSET_MASK = 0xFFF8u;
static constexpr uint16_t FRAG6_MF_MASK = 0x0001u;
static constexpr uint16_t FRAG6_OFFSET_MAX = 0x1FFFu;

/**
 * @brief IPv6 Fragment header (8 bytes), wire layout.
 *
 * @see RFC 8200 section 4.5:
 *   https://datatracker.ietf.org/doc/html/rfc8200#section-4.5
 */
struct [[gnu::packed]] FragmentHeader {
  uint8_t next_header;
  uint8_t reserved;
  uint16_t offlg_be;
  uint32_t ident_be;

  constexpr auto offlg() const noexcept -> uint16_t { return autoswap(offlg_be); }

  /** @brief Offset in 8-octet units. */
  constexpr auto offset() const noexcept -> uint16_t {
    return static_cast<uint16_t>((offlg() & FRAG6_OFFSET_MASK) >> 3);
  }

  constexpr bool more_fragments() const noexcept {
    return (offlg() & FRAG6_MF_MASK) != 0u;
  }

  constexpr auto identification() const noexcept -> uint32_t {
    return autoswap(ident_be);
  }

  constexpr void set_offlg(uint16_t offset, bool mf) noexcept {
    offlg_be = autoswap(static_cast<uint16_t>(
        ((offset & FRAG6_OFFSET_MAX) << 3) | (mf ? FRAG6_MF_MASK : 0u)));
  }

  constexpr void set_identification(uint32_t v) noexcept {
    ident_be = autoswap(v);
  }
};

static_assert(sizeof(FragmentHeader) == 8, "Wrong fragment header size");
static_assert(alignof(FragmentHeader) == 1, "Wrong fragment header alignment");

class Fragment {
public:
  static constexpr auto protocol = IpProtocol::IPv6_Frag;

  Fragment() = default;

  /** @brief @p offset is in 8-octet units; above 0x1FFF is Errc::Range. */
  static auto make(uint32_t id, uint16_t offset, bool more_fragments)
      -> Result<Fragment> {
    Fragment f;
    if (auto ok = f.set_offset(offset); !ok) {
      return std::unexpected(ok.error());
    }
    f.id_ = id;
    f.mf_ = more_fragments;
    return f;
  }

  auto next_header() const noexcept -> uint8_t { return next_header_; }
  auto id() const noexcept -> uint32_t { return id_; }
  auto offset() const noexcept -> uint16_t { return offset_; }
  auto mf() const noexcept -> bool { return mf_; }

  void set_next_header(IpProtocol p) noexcept { next_header_ = to_code(p); }

  auto set_next_header(uint8_t c) -> Result<void> {
    auto p = to_protocol(c);
    if (!p) {
      return std::unexpected(p.error());
    }
    next_header_ = c;
    return {};
  }

  void set_id(uint32_t id) noexcept { id_ = id; }
  void set_mf(bool mf) noexcept { mf_ = mf; }

  auto set_offset(uint16_t offset) -> Result<void> {
    if (offset > FRAG6_OFFSET_MAX) {
      return fail(Errc::Range, "fragment offset " + std::to_string(offset) +
                                   " exceeds 13 bits");
    }
    offset_ = offset;
    return {};
  }

  static constexpr auto size() noexcept -> std::size_t {
    return sizeof(FragmentHeader);
  }

  void encode(Bytes& out) const {
    FragmentHeader h{};
    h.next_header = next_header_;
    h.set_offlg(offset_, mf_);
    h.set_identification(id_);
    append_wire(out, h);
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<Fragment>> {
    auto h = wire_copy<FragmentHeader>(bytes);
    if (!h) {
      return fail(Errc::Format, "fragment header needs 8 bytes, have " +
                                    std::to_string(bytes.size()));
    }
    Fragment f;
    f.id_ = h->identification();
    f.offset_ = h->offset();
    f.mf_ = h->more_fragments();
    f.next_header_ = h->next_header;
    return Decoded<Fragment>{f, sizeof(FragmentHeader)};
  }

  bool operator==(const Fragment&) const = default;

private:
  uint8_t next_header_{to_code(IpProtocol::IPv6_NoNxt)};
  uint32_t id_{0u};
  uint16_t offset_{0u};
  bool mf_{false};
};

} // namespace pktstack
