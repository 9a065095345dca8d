#include <gtest/gtest.h>

#include "pktstack/ip6_mobility.hxx"
#include "warning_sink.hxx"

#include <string>

using namespace pktstack;
using pktstack::test_support::WarningSink;

TEST(MobilityTest, DefaultIsBindingRefreshRequest) {
  Mobility m;
  EXPECT_EQ(m.next_header(), 59u);
  EXPECT_EQ(m.mh_type(), 0u);
  EXPECT_EQ(m.size(), 8u);

  WarningSink sink;
  Bytes out;
  m.encode(out);
  EXPECT_TRUE(sink.warnings().empty());
  EXPECT_EQ(out, (Bytes{59u, 0u, 0u, 0u, 0u, 0u, 0u, 0u}));
}

TEST(MobilityTest, RoundTripWithData) {
  auto m = *Mobility::make(
      MobilityType::BindingUpdate,
      Bytes{0x00u, 0x01u, 0x80u, 0x00u, 0x00u, 0x10u, 0u, 0u, 0u, 0u});
  m.set_checksum(0xBEEFu);
  EXPECT_EQ(m.size(), 16u);

  Bytes out;
  m.encode(out);
  ASSERT_EQ(out.size(), 16u);
  EXPECT_EQ(out[1], 1u);
  EXPECT_EQ(out[2], 5u);
  EXPECT_EQ(out[4], 0xBEu);
  EXPECT_EQ(out[5], 0xEFu);

  auto d = Mobility::decode(out);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->consumed, 16u);
  EXPECT_EQ(d->header, m);
}

TEST(MobilityTest, MisalignedDataWarns) {
  Mobility m;
  ASSERT_TRUE(m.set_data(Bytes{1u, 2u, 3u}));

  WarningSink sink;
  Bytes out;
  m.encode(out);
  ASSERT_EQ(sink.warnings().size(), 1u);
  EXPECT_NE(sink.warnings()[0].find("IPv6Mobility"), std::string::npos);
  EXPECT_EQ(out.size(), 9u);
}

TEST(MobilityTest, DataCapAndNextHeader) {
  Mobility m;
  EXPECT_EQ(m.set_data(Bytes(2043u, 0u)).error().code, Errc::Range);
  EXPECT_TRUE(m.set_data(Bytes(2042u, 0u)));
  EXPECT_EQ(m.set_next_header(uint8_t{0xFF}).error().code, Errc::EnumValue);
}

TEST(MobilityTest, MakeRejectsOversizeData) {
  auto m = Mobility::make(MobilityType::BindingUpdate, Bytes(2050u, 0u));
  ASSERT_FALSE(m);
  EXPECT_EQ(m.error().code, Errc::Range);

  auto fits = Mobility::make(MobilityType::BindingUpdate, Bytes(2042u, 0u));
  ASSERT_TRUE(fits);
  Bytes out;
  fits->encode(out);
  ASSERT_EQ(out.size(), 2048u);
  EXPECT_EQ(out[1], 255u);
}

TEST(NoNextHeaderTest, EncodesToNothing) {
  NoNextHeader n;
  Bytes out;
  n.encode(out);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(n.size(), 0u);
  EXPECT_EQ(NoNextHeader::protocol, IpProtocol::IPv6_NoNxt);
}
