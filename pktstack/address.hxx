#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

#include "error.hxx"

namespace pktstack {

/** @brief IPv6 address in its canonical 16-byte network order form. */
class IPv6Address {
public:
  using bytes_t = std::array<uint8_t, 16>;

  constexpr IPv6Address() noexcept = default;
  constexpr explicit IPv6Address(const bytes_t& b) noexcept : bytes_{b} {}

  constexpr explicit IPv6Address(std::span<const uint8_t, 16> b) noexcept {
    std::copy(b.begin(), b.end(), bytes_.begin());
  }

  /** @brief The unspecified address "::". */
  static constexpr auto unspecified() noexcept -> IPv6Address { return {}; }

  static auto parse(std::string_view text) -> Result<IPv6Address> {
    const std::string s{text};
    bytes_t b{};
    if (inet_pton(AF_INET6, s.c_str(), b.data()) != 1) {
      return fail(Errc::Format, "not an IPv6 address: '" + s + "'");
    }
    return IPv6Address{b};
  }

  constexpr auto bytes() const noexcept -> const bytes_t& { return bytes_; }

  constexpr bool is_unspecified() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0u; });
  }

  auto to_string() const -> std::string {
    char buf[INET6_ADDRSTRLEN]{};
    inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf));
    return buf;
  }

  constexpr bool operator==(const IPv6Address&) const = default;

private:
  bytes_t bytes_{};
};

/** @brief IPv4 address, network order. */
class IPv4Address {
public:
  using bytes_t = std::array<uint8_t, 4>;

  constexpr IPv4Address() noexcept = default;
  constexpr explicit IPv4Address(const bytes_t& b) noexcept : bytes_{b} {}

  static auto parse(std::string_view text) -> Result<IPv4Address> {
    const std::string s{text};
    bytes_t b{};
    if (inet_pton(AF_INET, s.c_str(), b.data()) != 1) {
      return fail(Errc::Format, "not an IPv4 address: '" + s + "'");
    }
    return IPv4Address{b};
  }

  constexpr auto bytes() const noexcept -> const bytes_t& { return bytes_; }

  auto to_string() const -> std::string {
    char buf[INET_ADDRSTRLEN]{};
    inet_ntop(AF_INET, bytes_.data(), buf, sizeof(buf));
    return buf;
  }

  constexpr bool operator==(const IPv4Address&) const = default;

private:
  bytes_t bytes_{};
};

enum class AddressFamily : uint8_t { IPv4, IPv6 };

/**
 * @brief An address of either family, as produced by parsing user input.
 *
 * Typed header fields accept it only when the family matches.
 */
class IpAddress {
public:
  IpAddress(IPv4Address a) noexcept : family_{AddressFamily::IPv4}, v4_{a} {}
  IpAddress(IPv6Address a) noexcept : family_{AddressFamily::IPv6}, v6_{a} {}

  /** @brief Parse either textual family. */
  static auto parse(std::string_view text) -> Result<IpAddress> {
    if (text.find(':') != std::string_view::npos) {
      auto a = IPv6Address::parse(text);
      if (!a) {
        return std::unexpected(a.error());
      }
      return IpAddress{*a};
    }
    auto a = IPv4Address::parse(text);
    if (!a) {
      return std::unexpected(a.error());
    }
    return IpAddress{*a};
  }

  auto family() const noexcept -> AddressFamily { return family_; }

  auto as_v6() const -> Result<IPv6Address> {
    if (family_ != AddressFamily::IPv6) {
      return fail(Errc::TypeMismatch,
                  "IPv4 address " + v4_.to_string() +
                      " cannot be stored in an IPv6 address field");
    }
    return v6_;
  }

  auto as_v4() const -> Result<IPv4Address> {
    if (family_ != AddressFamily::IPv4) {
      return fail(Errc::TypeMismatch,
                  "IPv6 address " + v6_.to_string() +
                      " cannot be stored in an IPv4 address field");
    }
    return v4_;
  }

  bool operator==(const IpAddress&) const = default;

private:
  AddressFamily family_;
  IPv4Address v4_{};
  IPv6Address v6_{};
};

/** @brief Ethernet MAC address. */
class MacAddress {
public:
  using bytes_t = std::array<uint8_t, 6>;

  constexpr MacAddress() noexcept = default;
  constexpr explicit MacAddress(const bytes_t& b) noexcept : bytes_{b} {}

  /** @brief Parse "aa:bb:cc:dd:ee:ff". */
  static auto parse(std::string_view text) -> Result<MacAddress> {
    const std::string s{text};
    unsigned v[6]{};
    char tail = 0;
    if (std::sscanf(s.c_str(), "%2x:%2x:%2x:%2x:%2x:%2x%c", &v[0], &v[1],
                    &v[2], &v[3], &v[4], &v[5], &tail) != 6) {
      return fail(Errc::Format, "not a MAC address: '" + s + "'");
    }
    bytes_t b{};
    for (size_t i = 0; i < b.size(); ++i) {
      b[i] = static_cast<uint8_t>(v[i]);
    }
    return MacAddress{b};
  }

  constexpr auto bytes() const noexcept -> const bytes_t& { return bytes_; }

  auto to_string() const -> std::string {
    char buf[18]{};
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4],
                  bytes_[5]);
    return buf;
  }

  constexpr bool operator==(const MacAddress&) const = default;

private:
  bytes_t bytes_{};
};

} // namespace pktstack
