#include <gtest/gtest.h>

#include "pktstack/ether.hxx"
#include "pktstack/ext_header.hxx"
#include "pktstack/header_view.hxx"
#include "pktstack/ip6_header.hxx"

#include <array>
#include <cstring>
#include <string>
#include <utility>

using namespace pktstack;

static_assert(WireHeader<EtherHeader>);
static_assert(WireHeader<IPv6Header>);
static_assert(WireHeader<ExtHeaderPrefix>);
static_assert(!WireHeader<std::string>);

TEST(HeaderViewTest, DefaultConstructedReturnsFalseAndCopyZeroed) {
  HeaderView<EtherHeader> hv;
  EXPECT_FALSE(hv);
  EXPECT_EQ(hv.get(), nullptr);

  auto copy = hv.copy();
  EXPECT_EQ(copy.type(), 0u);
  for (auto b : copy.dst_mac()) {
    EXPECT_EQ(b, 0u);
  }
}

TEST(HeaderViewTest, ConstructFromTypedPointerAndAccessors) {
  EtherHeader eth{};
  eth.type_be = autoswap(std::to_underlying(EtherType::IPv6));
  const uint8_t mac[6] = {1, 2, 3, 4, 5, 6};
  std::memcpy(eth.dst, mac, 6);

  HeaderView<EtherHeader> hv(&eth);
  ASSERT_TRUE(hv);
  EXPECT_EQ(hv->type(), std::to_underlying(EtherType::IPv6));
  EXPECT_EQ(hv.get(), &eth);

  auto d = hv->dst_mac();
  EXPECT_EQ(d[0], 1u);
  EXPECT_EQ(d[5], 6u);
}

TEST(HeaderViewTest, OverRejectsShortBuffers) {
  std::array<uint8_t, sizeof(EtherHeader) - 1> short_buf{};
  EXPECT_FALSE(HeaderView<EtherHeader>::over(short_buf));

  std::array<uint8_t, sizeof(EtherHeader)> exact{};
  EXPECT_TRUE(HeaderView<EtherHeader>::over(exact));
}

TEST(HeaderViewTest, CopyReflectsUnderlyingMemoryAtTimeOfCall) {
  std::array<uint8_t, sizeof(EtherHeader)> data{};

  EtherHeader tmp{};
  tmp.set_type(std::to_underlying(EtherType::IPv6));
  std::memcpy(data.data(), &tmp, sizeof(tmp));

  HeaderView<EtherHeader> hv(data.data());
  EXPECT_EQ(hv.copy().type(), std::to_underlying(EtherType::IPv6));

  tmp.set_type(std::to_underlying(EtherType::IPv4));
  std::memcpy(data.data(), &tmp, sizeof(tmp));
  EXPECT_EQ(hv.copy().type(), std::to_underlying(EtherType::IPv4));
}

TEST(HeaderViewTest, AppendWireThenWireCopy) {
  ExtHeaderPrefix p{58u, 1u};
  Bytes out{0xEEu};
  append_wire(out, p);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[1], 58u);
  EXPECT_EQ(out[2], 1u);

  auto back = wire_copy<ExtHeaderPrefix>(ByteSpan{out}.subspan(1));
  ASSERT_TRUE(back);
  EXPECT_EQ(back->next_header, 58u);
  EXPECT_EQ(back->header_length_bytes(), 16u);

  EXPECT_FALSE(wire_copy<ExtHeaderPrefix>(ByteSpan{out}.subspan(2)));
}
