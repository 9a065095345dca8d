#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

#include "ether.hxx"
#include "icmp6.hxx"
#include "ip6_fragment.hxx"
#include "ip6_header.hxx"
#include "ip6_mobility.hxx"
#include "ip6_option_header.hxx"
#include "ip6_routing.hxx"
#include "ip_protocol.hxx"

namespace pktstack {

/** @brief Every header kind a packet stack can hold. */
using Header = std::variant<Ethernet, IPv6, HopByHopOptions, RoutingHeader,
                            Fragment, DestinationOptions, Mobility,
                            NoNextHeader, ICMPv6, RawPayload>;

template <typename T>
concept HeaderType = VariantMember<T, Header>;

/** @brief Headers that carry a next-header (or payload proto) field. */
template <typename T>
concept ChainingHeader = HeaderType<T> && requires(T& h, IpProtocol p) {
  { h.next_header() } -> std::same_as<uint8_t>;
  h.set_next_header(p);
};

template <typename T>
concept ProtocolHeader = requires { T::protocol; };

/** @brief Protocol number identifying @p h, if it has one. */
inline auto protocol_of(const Header& h) -> std::optional<uint8_t> {
  return std::visit(
      [](const auto& x) -> std::optional<uint8_t> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (ProtocolHeader<T>) {
          return to_code(T::protocol);
        } else {
          return std::nullopt;
        }
      },
      h);
}

/** @brief Code @p h declares for the header after it, if it chains. */
inline auto next_header_of(const Header& h) -> std::optional<uint8_t> {
  return std::visit(
      [](const auto& x) -> std::optional<uint8_t> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (ChainingHeader<T>) {
          return x.next_header();
        } else {
          return std::nullopt;
        }
      },
      h);
}

/**
 * @brief Assign the next-header code of @p h.
 *
 * Errc::EnumValue for codes outside the protocol table, Errc::TypeMismatch
 * for leaf headers.
 */
inline auto set_next_header(Header& h, uint8_t code) -> Result<void> {
  return std::visit(
      [code](auto& x) -> Result<void> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (ChainingHeader<T>) {
          return x.set_next_header(code);
        } else {
          return fail(Errc::TypeMismatch, "header at this position has no "
                                          "next header field");
        }
      },
      h);
}

inline auto header_size(const Header& h) -> std::size_t {
  return std::visit([](const auto& x) -> std::size_t { return x.size(); }, h);
}

/** @brief Short name of the header kind, for log lines and messages. */
inline auto header_name(const Header& h) -> std::string_view {
  struct Names {
    auto operator()(const Ethernet&) const { return "Ethernet"; }
    auto operator()(const IPv6&) const { return "IPv6"; }
    auto operator()(const HopByHopOptions&) const { return "IPv6HopOption"; }
    auto operator()(const RoutingHeader&) const { return "IPv6RouteOption"; }
    auto operator()(const Fragment&) const { return "IPv6Fragment"; }
    auto operator()(const DestinationOptions&) const {
      return "IPv6DestinationOption";
    }
    auto operator()(const Mobility&) const { return "IPv6Mobility"; }
    auto operator()(const NoNextHeader&) const { return "IPv6NoNext"; }
    auto operator()(const ICMPv6&) const { return "ICMPv6"; }
    auto operator()(const RawPayload&) const { return "RawPayload"; }
  };
  return std::visit(Names{}, h);
}

} // namespace pktstack
