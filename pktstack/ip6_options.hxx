#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "address.hxx"
#include "error.hxx"
#include "utils.hxx"

namespace pktstack {

/**
 * @brief Option types carried in Hop-by-Hop and Destination Options headers.
 *
 * The two high-order bits encode the action for unrecognized options and the
 * third bit whether the option data may change en route.
 *
 * @see IANA IPv6 Parameters, Destination Options and Hop-by-Hop Options:
 *   https://www.iana.org/assignments/ipv6-parameters/ipv6-parameters.xhtml
 */
enum class OptionType : uint8_t {
  Pad1 = 0x00u,
  PadN = 0x01u,
  TunnelEncapsulationLimit = 0x04u,
  RouterAlert = 0x05u,
  JumboPayload = 0xC2u,
  HomeAddress = 0xC9u
};

/** @brief Pad1: a single zero octet with no length field. */
struct Pad1 {
  static constexpr auto type = OptionType::Pad1;

  constexpr auto wire_size() const noexcept -> std::size_t { return 1u; }
  void encode(Bytes& out) const { out.push_back(std::to_underlying(type)); }

  constexpr bool operator==(const Pad1&) const = default;
};

/**
 * @brief PadN covering @c octets() bytes in total (type and length included).
 *
 * Between 2 and 257 octets fit in a single option. A single octet of
 * padding is Pad1.
 */
class PadN {
public:
  static constexpr auto type = OptionType::PadN;
  static constexpr uint16_t min_octets = 2u;
  static constexpr uint16_t max_octets = 2u + 255u;

  constexpr PadN() noexcept = default;

  static auto make(uint16_t n) -> Result<PadN> {
    if (n < min_octets || n > max_octets) {
      return fail(Errc::Range, "PadN of " + std::to_string(n) +
                                   " octets not in [2, 257]");
    }
    return PadN{n};
  }

  constexpr auto octets() const noexcept -> uint16_t { return octets_; }
  constexpr auto wire_size() const noexcept -> std::size_t { return octets_; }

  void encode(Bytes& out) const {
    out.push_back(std::to_underlying(type));
    out.push_back(static_cast<uint8_t>(octets_ - 2u));
    out.insert(out.end(), octets_ - 2u, uint8_t{0});
  }

  constexpr bool operator==(const PadN&) const = default;

private:
  constexpr explicit PadN(uint16_t n) noexcept : octets_{n} {}

  uint16_t octets_{min_octets};
};

namespace detail {

/** @brief Type, length and a big-endian value of O::data_len bytes. */
template <typename O>
inline void encode_fixed(Bytes& out, uint64_t value) {
  auto field = encode_uint(value, O::data_len).value();
  out.push_back(std::to_underlying(O::type));
  out.push_back(O::data_len);
  out.insert(out.end(), field.begin(), field.end());
}

} // namespace detail

/**
 * @brief Router Alert (RFC 2711), 2-byte value.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc2711
 */
struct RouterAlert {
  static constexpr auto type = OptionType::RouterAlert;
  static constexpr uint8_t data_len = 2u;

  constexpr explicit RouterAlert(uint16_t v = 0u) noexcept : value{v} {}

  uint16_t value;

  constexpr auto wire_size() const noexcept -> std::size_t {
    return 2u + data_len;
  }

  void encode(Bytes& out) const {
    detail::encode_fixed<RouterAlert>(out, value);
  }

  constexpr bool operator==(const RouterAlert&) const = default;
};

/**
 * @brief Tunnel Encapsulation Limit (RFC 2473), 1-byte value.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc2473#section-5.1
 */
struct TunnelEncapsulationLimit {
  static constexpr auto type = OptionType::TunnelEncapsulationLimit;
  static constexpr uint8_t data_len = 1u;

  constexpr explicit TunnelEncapsulationLimit(uint8_t l = 4u) noexcept
      : limit{l} {}

  uint8_t limit;

  constexpr auto wire_size() const noexcept -> std::size_t {
    return 2u + data_len;
  }

  void encode(Bytes& out) const {
    detail::encode_fixed<TunnelEncapsulationLimit>(out, limit);
  }

  constexpr bool operator==(const TunnelEncapsulationLimit&) const = default;
};

/**
 * @brief Home Address (RFC 6275), a 16-byte IPv6 address.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc6275#section-6.3
 */
struct HomeAddress {
  static constexpr auto type = OptionType::HomeAddress;
  static constexpr uint8_t data_len = 16u;

  constexpr explicit HomeAddress(IPv6Address a = {}) noexcept : address{a} {}

  IPv6Address address;

  constexpr auto wire_size() const noexcept -> std::size_t {
    return 2u + data_len;
  }

  void encode(Bytes& out) const {
    out.push_back(std::to_underlying(type));
    out.push_back(data_len);
    out.insert(out.end(), address.bytes().begin(), address.bytes().end());
  }

  constexpr bool operator==(const HomeAddress&) const = default;
};

/**
 * @brief Jumbo Payload (RFC 2675), 4-byte payload length.
 *
 * @see https://datatracker.ietf.org/doc/html/rfc2675
 */
struct JumboPayload {
  static constexpr auto type = OptionType::JumboPayload;
  static constexpr uint8_t data_len = 4u;

  constexpr explicit JumboPayload(uint32_t l = 0u) noexcept : len{l} {}

  uint32_t len;

  constexpr auto wire_size() const noexcept -> std::size_t {
    return 2u + data_len;
  }

  void encode(Bytes& out) const {
    detail::encode_fixed<JumboPayload>(out, len);
  }

  constexpr bool operator==(const JumboPayload&) const = default;
};

/** @brief An option whose type this library does not interpret. */
class RawOption {
public:
  static auto make(uint8_t type, Bytes data) -> Result<RawOption> {
    if (data.size() > 255u) {
      return fail(Errc::Range, "option data of " + std::to_string(data.size()) +
                                   " bytes exceeds 255");
    }
    return RawOption{type, std::move(data)};
  }

  auto type() const noexcept -> uint8_t { return type_; }
  auto data() const noexcept -> const Bytes& { return data_; }

  auto wire_size() const noexcept -> std::size_t { return 2u + data_.size(); }

  void encode(Bytes& out) const {
    out.push_back(type_);
    out.push_back(static_cast<uint8_t>(data_.size()));
    out.insert(out.end(), data_.begin(), data_.end());
  }

  bool operator==(const RawOption&) const = default;

private:
  RawOption(uint8_t type, Bytes data) : type_{type}, data_{std::move(data)} {}

  uint8_t type_;
  Bytes data_;
};

using Option = std::variant<Pad1, PadN, RouterAlert, TunnelEncapsulationLimit,
                            HomeAddress, JumboPayload, RawOption>;

/** @brief Wire type code of @p opt. */
inline auto option_type(const Option& opt) -> uint8_t {
  return std::visit(
      [](const auto& o) -> uint8_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(o)>, RawOption>) {
          return o.type();
        } else {
          return std::to_underlying(o.type);
        }
      },
      opt);
}

inline auto option_size(const Option& opt) -> std::size_t {
  return std::visit([](const auto& o) { return o.wire_size(); }, opt);
}

/** @brief One raw type-length-value record as found on the wire. */
struct Tlv {
  uint8_t type;
  uint8_t length;
  ByteSpan value;
  std::size_t total_len;
};

/**
 * @brief Iterator over a run of TLVs. Does not allocate.
 *
 * The @p pad1 type has no length octet. next() returns false at the end of
 * the run and also when a record is cut short; truncated() tells them apart.
 */
class TlvIterator {
public:
  constexpr TlvIterator(ByteSpan data, uint8_t pad1 = 0u) noexcept
      : data_{data}, pad1_{pad1} {}

  constexpr bool next(Tlv& out) noexcept {
    if (pos_ >= data_.size()) {
      return false;
    }

    const uint8_t t = data_[pos_];
    if (t == pad1_) {
      out = Tlv{t, 0u, {}, 1u};
      pos_ += 1u;
      return true;
    }

    // Need at least type + length
    if (pos_ + 2u > data_.size()) {
      truncated_ = true;
      return false;
    }

    const uint8_t len = data_[pos_ + 1u];
    if (pos_ + 2u + static_cast<std::size_t>(len) > data_.size()) {
      truncated_ = true;
      return false;
    }

    out = Tlv{t, len, data_.subspan(pos_ + 2u, len),
              2u + static_cast<std::size_t>(len)};
    pos_ += out.total_len;
    return true;
  }

  constexpr auto offset() const noexcept -> std::size_t { return pos_; }
  constexpr bool truncated() const noexcept { return truncated_; }

private:
  ByteSpan data_;
  uint8_t pad1_;
  std::size_t pos_{0};
  bool truncated_{false};
};

namespace detail {

template <typename O>
inline auto expect_len(const Tlv& t) -> Result<void> {
  if (t.length != O::data_len) {
    return fail(Errc::Format,
                "option type " + std::to_string(t.type) + " has length " +
                    std::to_string(t.length) + ", expected " +
                    std::to_string(O::data_len));
  }
  return {};
}

} // namespace detail

/** @brief Interpret one wire TLV as an Option. */
inline auto decode_option(const Tlv& t) -> Result<Option> {
  switch (static_cast<OptionType>(t.type)) {
  case OptionType::Pad1:
    return Pad1{};
  case OptionType::PadN: {
    auto pad = PadN::make(static_cast<uint16_t>(t.total_len));
    if (!pad) {
      return std::unexpected(pad.error());
    }
    return *pad;
  }
  case OptionType::RouterAlert: {
    if (auto ok = detail::expect_len<RouterAlert>(t); !ok) {
      return std::unexpected(ok.error());
    }
    auto [v, rest] = *decode_uint(t.value, RouterAlert::data_len);
    return RouterAlert{static_cast<uint16_t>(v)};
  }
  case OptionType::TunnelEncapsulationLimit: {
    if (auto ok = detail::expect_len<TunnelEncapsulationLimit>(t); !ok) {
      return std::unexpected(ok.error());
    }
    return TunnelEncapsulationLimit{t.value[0]};
  }
  case OptionType::HomeAddress: {
    if (auto ok = detail::expect_len<HomeAddress>(t); !ok) {
      return std::unexpected(ok.error());
    }
    return HomeAddress{IPv6Address{t.value.first<16>()}};
  }
  case OptionType::JumboPayload: {
    if (auto ok = detail::expect_len<JumboPayload>(t); !ok) {
      return std::unexpected(ok.error());
    }
    auto [v, rest] = *decode_uint(t.value, JumboPayload::data_len);
    return JumboPayload{static_cast<uint32_t>(v)};
  }
  }
  auto raw = RawOption::make(t.type, Bytes(t.value.begin(), t.value.end()));
  if (!raw) {
    return std::unexpected(raw.error());
  }
  return std::move(*raw);
}

/** @brief Append the TLV encoding of each option, in order, without padding. */
inline void encode_options(std::span<const Option> options, Bytes& out) {
  for (const auto& opt : options) {
    std::visit([&out](const auto& o) { o.encode(out); }, opt);
  }
}

/**
 * @brief Decode an option area until it is exhausted.
 *
 * Unknown option types are kept as RawOption.
 */
inline auto decode_options(ByteSpan area) -> Result<std::vector<Option>> {
  std::vector<Option> out;
  TlvIterator it{area, std::to_underlying(OptionType::Pad1)};
  Tlv t{};
  while (it.next(t)) {
    auto opt = decode_option(t);
    if (!opt) {
      return std::unexpected(opt.error());
    }
    out.push_back(std::move(*opt));
  }
  if (it.truncated()) {
    return fail(Errc::Format, "option truncated at offset " +
                                  std::to_string(it.offset()) + " of " +
                                  std::to_string(area.size()));
  }
  return out;
}

template <typename T>
concept OptionKind = VariantMember<T, Option>;

/**
 * @brief Ordered options owned by one extension header.
 *
 * size() counts options, not bytes. Indexing is strictly 0-based.
 */
class OptionList {
public:
  OptionList() = default;
  explicit OptionList(std::vector<Option> options)
      : options_{std::move(options)} {}

  auto size() const noexcept -> std::size_t { return options_.size(); }
  bool empty() const noexcept { return options_.empty(); }

  void push_back(Option o) { options_.push_back(std::move(o)); }

  auto at(std::ptrdiff_t idx) const -> Result<const Option*> {
    auto i = checked_index(idx, options_.size());
    if (!i) {
      return std::unexpected(i.error());
    }
    return &options_[*i];
  }

  auto at(const Slice& s) const -> Result<const Option*> {
    return slice_rejected(s);
  }

  template <OptionKind T>
  auto get(std::ptrdiff_t idx) const -> Result<const T*> {
    auto o = at(idx);
    if (!o) {
      return std::unexpected(o.error());
    }
    if (const auto* p = std::get_if<T>(*o)) {
      return p;
    }
    return fail(Errc::TypeMismatch,
                "option " + std::to_string(idx) + " has type " +
                    std::to_string(option_type(**o)));
  }

  auto remove(std::ptrdiff_t idx) -> Result<void> {
    auto i = checked_index(idx, options_.size());
    if (!i) {
      return std::unexpected(i.error());
    }
    options_.erase(options_.begin() + static_cast<std::ptrdiff_t>(*i));
    return {};
  }

  auto remove(const Slice& s) -> Result<void> { return slice_rejected(s); }

  /** @brief Bytes the options occupy on the wire. */
  auto wire_size() const -> std::size_t {
    std::size_t n = 0;
    for (const auto& o : options_) {
      n += option_size(o);
    }
    return n;
  }

  auto begin() const noexcept { return options_.begin(); }
  auto end() const noexcept { return options_.end(); }
  auto items() const noexcept -> std::span<const Option> { return options_; }

  bool operator==(const OptionList&) const = default;

private:
  std::vector<Option> options_;
};

} // namespace pktstack
