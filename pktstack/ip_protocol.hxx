#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "error.hxx"

namespace pktstack {

/**
 * @brief IP protocol / IPv6 next-header numbers understood by the library.
 *
 * Codes not listed here are rejected when assigned to a next-header field.
 *
 * @see IANA Assigned Internet Protocol Numbers:
 *   https://www.iana.org/assignments/protocol-numbers/protocol-numbers.xhtml
 */
enum class IpProtocol : uint8_t {
  HOPOPT = 0,
  ICMPv4 = 1,
  IGMP = 2,
  IPv4 = 4,
  TCP = 6,
  UDP = 17,
  IPv6 = 41,
  IPv6_Route = 43,
  IPv6_Frag = 44,
  RSVP = 46,
  GRE = 47,
  ESP = 50,
  AH = 51,
  ICMPv6 = 58,
  IPv6_NoNxt = 59,
  IPv6_Opts = 60,
  EIGRP = 88,
  OSPF = 89,
  EtherIP = 97,
  PIM = 103,
  VRRP = 112,
  L2TP = 115,
  SCTP = 132,
  MobilityHeader = 135,
  UDPLite = 136,
  MPLSinIP = 137,
  HIP = 139,
  Shim6 = 140,
  Experiment1 = 253,
  Experiment2 = 254
};

/** @brief Map a raw code onto IpProtocol if it is in the table. */
constexpr auto protocol_known(uint8_t code) noexcept
    -> std::optional<IpProtocol> {
  using enum IpProtocol;

  switch (code) {
  case 0: return HOPOPT;
  case 1: return ICMPv4;
  case 2: return IGMP;
  case 4: return IPv4;
  case 6: return TCP;
  case 17: return UDP;
  case 41: return IPv6;
  case 43: return IPv6_Route;
  case 44: return IPv6_Frag;
  case 46: return RSVP;
  case 47: return GRE;
  case 50: return ESP;
  case 51: return AH;
  case 58: return ICMPv6;
  case 59: return IPv6_NoNxt;
  case 60: return IPv6_Opts;
  case 88: return EIGRP;
  case 89: return OSPF;
  case 97: return EtherIP;
  case 103: return PIM;
  case 112: return VRRP;
  case 115: return L2TP;
  case 132: return SCTP;
  case 135: return MobilityHeader;
  case 136: return UDPLite;
  case 137: return MPLSinIP;
  case 139: return HIP;
  case 140: return Shim6;
  case 253: return Experiment1;
  case 254: return Experiment2;
  default: return std::nullopt;
  }
}

/** @brief Like protocol_known(), failing with Errc::EnumValue. */
inline auto to_protocol(uint8_t code) -> Result<IpProtocol> {
  if (auto p = protocol_known(code)) {
    return *p;
  }
  return fail(Errc::EnumValue,
              "next header " + std::to_string(code) + " is not a known protocol");
}

constexpr auto to_code(IpProtocol p) noexcept -> uint8_t {
  return std::to_underlying(p);
}

} // namespace pktstack
