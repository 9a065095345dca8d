#pragma once

#include <glog/logging.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "header.hxx"

namespace pktstack {

/** @brief Decoder selected for the bytes that follow a next-header code. */
enum class HeaderKind : uint8_t {
  Ethernet,
  IPv6,
  HopByHop,
  Routing,
  Fragment,
  DestinationOptions,
  Mobility,
  NoNext,
  ICMPv6,
  Opaque
};

constexpr auto to_string(HeaderKind k) noexcept -> std::string_view {
  switch (k) {
  case HeaderKind::Ethernet: return "Ethernet";
  case HeaderKind::IPv6: return "IPv6";
  case HeaderKind::HopByHop: return "HopByHop";
  case HeaderKind::Routing: return "Routing";
  case HeaderKind::Fragment: return "Fragment";
  case HeaderKind::DestinationOptions: return "DestinationOptions";
  case HeaderKind::Mobility: return "Mobility";
  case HeaderKind::NoNext: return "NoNext";
  case HeaderKind::ICMPv6: return "ICMPv6";
  case HeaderKind::Opaque: return "Opaque";
  }
  return "Unknown";
}

/** @brief Map a next-header code to the decoder for what follows it. */
constexpr auto kind_for(uint8_t code) noexcept -> HeaderKind {
  switch (code) {
  case to_code(IpProtocol::HOPOPT): return HeaderKind::HopByHop;
  case to_code(IpProtocol::IPv6): return HeaderKind::IPv6;
  case to_code(IpProtocol::IPv6_Route): return HeaderKind::Routing;
  case to_code(IpProtocol::IPv6_Frag): return HeaderKind::Fragment;
  case to_code(IpProtocol::ICMPv6): return HeaderKind::ICMPv6;
  case to_code(IpProtocol::IPv6_NoNxt): return HeaderKind::NoNext;
  case to_code(IpProtocol::IPv6_Opts): return HeaderKind::DestinationOptions;
  case to_code(IpProtocol::MobilityHeader): return HeaderKind::Mobility;
  default: return HeaderKind::Opaque;
  }
}

/** @brief True for kinds that continue the chain with a next-header code. */
constexpr bool is_extension(HeaderKind k) noexcept {
  switch (k) {
  case HeaderKind::HopByHop:
  case HeaderKind::Routing:
  case HeaderKind::Fragment:
  case HeaderKind::DestinationOptions:
  case HeaderKind::Mobility:
    return true;
  default:
    return false;
  }
}

namespace detail {

template <typename T>
inline auto lift(Result<Decoded<T>> r) -> Result<Decoded<Header>> {
  if (!r) {
    return std::unexpected(r.error());
  }
  return Decoded<Header>{Header{std::move(r->header)}, r->consumed};
}

} // namespace detail

/**
 * @brief Decode one header of kind @p k from the front of @p bytes.
 *
 * NoNext yields a zero-length NoNextHeader; Opaque keeps every byte as a
 * RawPayload.
 */
inline auto decode_header(HeaderKind k, ByteSpan bytes)
    -> Result<Decoded<Header>> {
  switch (k) {
  case HeaderKind::Ethernet: return detail::lift(Ethernet::decode(bytes));
  case HeaderKind::IPv6: return detail::lift(IPv6::decode(bytes));
  case HeaderKind::HopByHop: return detail::lift(HopByHopOptions::decode(bytes));
  case HeaderKind::Routing: return detail::lift(RoutingHeader::decode(bytes));
  case HeaderKind::Fragment: return detail::lift(Fragment::decode(bytes));
  case HeaderKind::DestinationOptions:
    return detail::lift(DestinationOptions::decode(bytes));
  case HeaderKind::Mobility: return detail::lift(Mobility::decode(bytes));
  case HeaderKind::NoNext: return detail::lift(NoNextHeader::decode(bytes));
  case HeaderKind::ICMPv6: return detail::lift(ICMPv6::decode(bytes));
  case HeaderKind::Opaque:
    VLOG(2) << "keeping " << bytes.size() << " bytes as opaque payload";
    return detail::lift(RawPayload::decode(bytes));
  }
  return fail(Errc::EnumValue, "header kind " +
                                   std::to_string(std::to_underlying(k)) +
                                   " has no decoder");
}

} // namespace pktstack
