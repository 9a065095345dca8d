#pragma once

#include <glog/logging.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "header_view.hxx"
#include "utils.hxx"

namespace pktstack {

/** @brief Largest extension header expressible: (255 + 1) * 8 octets. */
static constexpr std::size_t EXT_HEADER_MAX_BYTES = 2048u;

/**
 * @brief The two octets every IPv6 extension header (and the Mobility
 * header) starts with.
 *
 * @see RFC 8200 section 4:
 *   https://datatracker.ietf.org/doc/html/rfc8200#section-4
 */
struct [[gnu::packed]] ExtHeaderPrefix {
  uint8_t next_header;
  uint8_t hdr_ext_len;

  /** @brief Total header length in bytes, including these two. */
  constexpr auto header_length_bytes() const noexcept -> std::size_t {
    return (static_cast<std::size_t>(hdr_ext_len) + 1u) * 8u;
  }
};

static_assert(sizeof(ExtHeaderPrefix) == 2, "Wrong extension prefix size");
static_assert(alignof(ExtHeaderPrefix) == 1, "Wrong extension prefix alignment");

/**
 * @brief Length field for a header of @p total bytes, rounded up to whole
 * 8-octet units so a misaligned header still advertises every byte it has.
 */
constexpr auto ext_len_units(std::size_t total) noexcept -> uint8_t {
  if (total <= 8u) {
    return 0u;
  }
  return static_cast<uint8_t>((total + 7u) / 8u - 1u);
}

/**
 * @brief Emit the alignment warning for a header of @p total bytes.
 *
 * Misaligned bytes are still produced; padding is the caller's job.
 * Returns true when the header was aligned.
 */
inline bool check_alignment(std::string_view header_name, std::size_t total) {
  if (total % 8u == 0u) {
    return true;
  }
  LOG(WARNING) << "Size of " << header_name << " header (" << total
               << " bytes) is not an even multiple of 8";
  return false;
}

/**
 * @brief Split off one extension header from @p bytes according to its
 * length field. Fails if the buffer is shorter than declared.
 */
inline auto ext_header_bytes(std::string_view header_name, ByteSpan bytes)
    -> Result<ByteSpan> {
  auto prefix = wire_copy<ExtHeaderPrefix>(bytes);
  if (!prefix) {
    return fail(Errc::Format, std::string{header_name} +
                                  " header truncated before its length field");
  }
  const auto total = prefix->header_length_bytes();
  if (bytes.size() < total) {
    return fail(Errc::Format, std::string{header_name} + " header declares " +
                                  std::to_string(total) + " bytes, have " +
                                  std::to_string(bytes.size()));
  }
  return bytes.first(total);
}

} // namespace pktstack
