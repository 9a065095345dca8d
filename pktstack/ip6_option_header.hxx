#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "ext_header.hxx"
#include "ip6_options.hxx"
#include "ip_protocol.hxx"

namespace pktstack {

/**
 * @brief Hop-by-Hop or Destination Options extension header.
 *
 * The 2-byte prefix plus the options must add up to a multiple of 8 octets.
 * Padding is the caller's responsibility: encode() logs a warning for a
 * misaligned header and still writes exactly the options it holds.
 *
 * @see RFC 8200 sections 4.3 and 4.6:
 *   https://datatracker.ietf.org/doc/html/rfc8200#section-4.3
 */
template <IpProtocol Proto> class OptionHeader {
  static_assert(Proto == IpProtocol::HOPOPT || Proto == IpProtocol::IPv6_Opts,
                "OptionHeader is only defined for Hop-by-Hop and Destination "
                "Options");

public:
  static constexpr auto protocol = Proto;
  static constexpr std::string_view name =
      Proto == IpProtocol::HOPOPT ? "IPv6HopOption" : "IPv6DestinationOption";

  OptionHeader() = default;
  explicit OptionHeader(IpProtocol next) noexcept : next_header_{to_code(next)} {}

  auto next_header() const noexcept -> uint8_t { return next_header_; }

  void set_next_header(IpProtocol p) noexcept { next_header_ = to_code(p); }

  auto set_next_header(uint8_t c) -> Result<void> {
    auto p = to_protocol(c);
    if (!p) {
      return std::unexpected(p.error());
    }
    next_header_ = c;
    return {};
  }

  /**
   * @brief Append an option. Fails with Errc::Range only when the header
   * could no longer be described by its 8-bit length field.
   */
  auto add_option(Option o) -> Result<void> {
    if (size() + option_size(o) > EXT_HEADER_MAX_BYTES) {
      return fail(Errc::Range, std::string{name} + " would exceed " +
                                   std::to_string(EXT_HEADER_MAX_BYTES) +
                                   " bytes");
    }
    options_.push_back(std::move(o));
    return {};
  }

  auto remove_option(std::ptrdiff_t idx) -> Result<void> {
    return options_.remove(idx);
  }

  auto options() const noexcept -> const OptionList& { return options_; }

  /** @brief Number of options; not the byte size. */
  auto length() const noexcept -> std::size_t { return options_.size(); }

  auto at(std::ptrdiff_t idx) const -> Result<const Option*> {
    return options_.at(idx);
  }

  auto at(const Slice& s) const -> Result<const Option*> {
    return options_.at(s);
  }

  template <OptionKind T>
  auto option_at(std::ptrdiff_t idx) const -> Result<const T*> {
    return options_.get<T>(idx);
  }

  /** @brief Encoded length: prefix plus options, no implicit padding. */
  auto size() const -> std::size_t {
    return sizeof(ExtHeaderPrefix) + options_.wire_size();
  }

  bool aligned() const { return size() % 8u == 0u; }

  void encode(Bytes& out) const {
    const auto total = size();
    check_alignment(name, total);
    ExtHeaderPrefix prefix{next_header_, ext_len_units(total)};
    append_wire(out, prefix);
    encode_options(options_.items(), out);
  }

  static auto decode(ByteSpan bytes) -> Result<Decoded<OptionHeader>> {
    auto hdr = ext_header_bytes(name, bytes);
    if (!hdr) {
      return std::unexpected(hdr.error());
    }
    auto opts = decode_options(hdr->subspan(sizeof(ExtHeaderPrefix)));
    if (!opts) {
      return fail(Errc::Format, std::string{name} + ": " + opts.error().message);
    }
    OptionHeader h;
    h.next_header_ = (*hdr)[0];
    h.options_ = OptionList{std::move(*opts)};
    return Decoded<OptionHeader>{std::move(h), hdr->size()};
  }

  bool operator==(const OptionHeader&) const = default;

private:
  uint8_t next_header_{to_code(IpProtocol::IPv6_NoNxt)};
  OptionList options_;
};

using HopByHopOptions = OptionHeader<IpProtocol::HOPOPT>;
using DestinationOptions = OptionHeader<IpProtocol::IPv6_Opts>;

} // namespace pktstack
