#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <utility>

#include "address.hxx"
#include "header_view.hxx"
#include "utils.hxx"

namespace pktstack {

/**
 * @brief Ethernet frame EtherType values.
 *
 * @see IANA registry (EtherType / Ethernet Numbers):
 *   https://www.iana.org/assignments/ethernet-numbers/ethernet-numbers.xhtml
 * @see RFC894 (Ethernet encapsulation of IP datagrams):
 *   https://datatracker.ietf.org/doc/html/rfc894
 */
enum class EtherType : uint16_t {
  IPv4 = 0x0800,
  ARP = 0x0806,
  VLAN = 0x8100,
  IPv6 = 0x86DD
};

/**
 * @brief Ethernet frame header (14 bytes), wire layout.
 *
 * @see RFC894 (Ethernet encapsulation of IP datagrams):
 *   https://datatracker.ietf.org/doc/html/rfc894
 */
struct [[gnu::packed]] EtherHeader {
  uint8_t dst[6];
  uint8_t src[6];
  uint16_t type_be;

  constexpr auto dst_mac() const noexcept -> std::span<const uint8_t, 6> {
    return std::span<const uint8_t, 6>(dst, 6);
  }

  constexpr auto src_mac() const noexcept -> std::span<const uint8_t, 6> {
    return std::span<const uint8_t, 6>(src, 6);
  }

  constexpr auto type() const noexcept -> uint16_t { return autoswap(type_be); }
  constexpr void set_type(uint16_t type) noexcept { type_be = autoswap(type); }
};

static_assert(sizeof(EtherHeader) == 14, "Wrong Ethernet header size");
static_assert(alignof(EtherHeader) == 1, "Wrong Ethernet header alignment");

/**
 * @brief Ethernet II link header. A leaf for chaining purposes: the only
 * thing the stack reads from it is the ethertype.
 */
class Ethernet {
public:
  Ethernet() = default;
  Ethernet(MacAddress src, MacAddress dst,
           uint16_t ethertype = std::to_underlying(EtherType::IPv6)) noexcept
      : src_{src}, dst_{dst}, ethertype_{ethertype} {}

  auto src() const noexcept -> const MacAddress& { return src_; }
  auto dst() const noexcept -> const MacAddress& { return dst_; }
  auto ethertype() const noexcept -> uint16_t { return ethertype_; }

  void set_src(MacAddress m) noexcept { src_ = m; }
  void set_dst(MacAddress m) noexcept { dst_ = m; }
  void set_ethertype(EtherType t) noexcept { ethertype_ = std::to_underlying(t); }
  void set_ethertype(uint16_t t) noexcept { ethertype_ = t; }

  static constexpr auto size() noexcept -> std::size_t {
    return sizeof(EtherHeader);
  }

  void encode(Bytes& out) const {
    EtherHeader h{};
    std::copy(dst_.bytes().begin(), dst_.bytes().end(), h.dst);
    std::copy(src_.bytes().begin(), src_.bytes().end(), h.src);
    h.set_type(ethertype_);
    append_wire(out, h);
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<Ethernet>> {
    auto h = wire_copy<EtherHeader>(bytes);
    if (!h) {
      return fail(Errc::Format, "Ethernet header needs " +
                                    std::to_string(sizeof(EtherHeader)) +
                                    " bytes, have " +
                                    std::to_string(bytes.size()));
    }
    MacAddress::bytes_t src{}, dst{};
    std::copy(h->src, h->src + 6, src.begin());
    std::copy(h->dst, h->dst + 6, dst.begin());
    return Decoded<Ethernet>{
        Ethernet{MacAddress{src}, MacAddress{dst}, h->type()}, sizeof(EtherHeader)};
  }

  bool operator==(const Ethernet&) const = default;

private:
  MacAddress src_{};
  MacAddress dst_{};
  uint16_t ethertype_{std::to_underlying(EtherType::IPv6)};
};

} // namespace pktstack
