#include <gtest/gtest.h>

#include "pktstack/packet.hxx"
#include "warning_sink.hxx"

#include <string>
#include <variant>

using namespace pktstack;
using pktstack::test_support::WarningSink;

class PacketTest : public ::testing::Test {
protected:
  void SetUp() override {
    Ethernet e;
    e.set_ethertype(EtherType::IPv6);
    IPv6 ip;
    ip.set_next_header(IpProtocol::ICMPv6);
    pkt_ = e + ip + ICMPv6{};
  }

  auto ip_index() const -> std::ptrdiff_t {
    auto idx = pkt_.get_header_index<IPv6>();
    EXPECT_TRUE(idx);
    return static_cast<std::ptrdiff_t>(idx.value_or(0));
  }

  static auto reparse(const Packet& p) -> Packet {
    auto r = Packet::from_bytes(p.to_bytes());
    EXPECT_TRUE(r) << (r ? "" : r.error().what());
    return r ? *r : Packet{};
  }

  static auto addr(const char* text) -> IPv6Address {
    return *IPv6Address::parse(text);
  }

  Packet pkt_;
};

TEST_F(PacketTest, Reconstruct) {
  EXPECT_EQ(pkt_.num_headers(), 3u);
  const auto raw = pkt_.to_bytes();
  EXPECT_EQ(raw.size(), 14u + 40u + 4u);
  EXPECT_EQ(IPv6::declared_payload_length(ByteSpan{raw}.subspan(14)), 4u);
  EXPECT_EQ(reparse(pkt_), pkt_);
}

TEST_F(PacketTest, BlankAddresses) {
  auto ip = pkt_.header_at<IPv6>(ip_index());
  ASSERT_TRUE(ip);
  EXPECT_EQ((*ip)->src(), IPv6Address::unspecified());
  EXPECT_EQ((*ip)->dst(), IPv6Address::unspecified());
}

TEST_F(PacketTest, IPv4AddressIntoIPv6FieldFails) {
  auto ip = pkt_.header_at<IPv6>(ip_index());
  ASSERT_TRUE(ip);
  auto r = (*ip)->set_dst(IpAddress{*IPv4Address::parse("10.0.0.1")});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, Errc::TypeMismatch);
}

TEST_F(PacketTest, UndefinedNextHeaderFails) {
  auto r = pkt_.set_next_header(ip_index(), uint8_t{0xFF});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, Errc::EnumValue);
  EXPECT_EQ(std::get<IPv6>(pkt_.headers()[1]).next_header(), 58u);
}

TEST_F(PacketTest, RoutingHeaderRoundTrip) {
  const auto idx = ip_index();
  ASSERT_TRUE(pkt_.insert_header(idx + 1, RoutingHeader{addr("fd00::1")}));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::IPv6_Route));
  auto rh = pkt_.header_at<RoutingHeader>(idx + 1);
  ASSERT_TRUE(rh);
  (*rh)->set_next_header(IpProtocol::ICMPv6);

  EXPECT_EQ(reparse(pkt_), pkt_);
}

TEST_F(PacketTest, FragmentRoundTrip) {
  const auto idx = ip_index();
  auto frag = *Fragment::make(42u, 1000u, false);
  frag.set_next_header(IpProtocol::ICMPv6);
  ASSERT_TRUE(pkt_.insert_header(idx + 1, frag));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::IPv6_Frag));

  const auto p = reparse(pkt_);
  EXPECT_EQ(p, pkt_);

  const auto* f = p.get_header<Fragment>();
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->id(), 42u);
  EXPECT_EQ(f->offset(), 1000u);
  EXPECT_FALSE(f->mf());
}

TEST_F(PacketTest, DestinationOptionsTunnelLimit) {
  const auto idx = ip_index();
  DestinationOptions dst;
  ASSERT_TRUE(dst.add_option(TunnelEncapsulationLimit{0x13u}));
  ASSERT_TRUE(dst.add_option(*PadN::make(3u)));
  dst.set_next_header(IpProtocol::ICMPv6);
  ASSERT_TRUE(pkt_.insert_header(idx + 1, dst));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::IPv6_Opts));

  const auto p = reparse(pkt_);
  EXPECT_EQ(p, pkt_);

  auto hdr = p.header_at<DestinationOptions>(idx + 1);
  ASSERT_TRUE(hdr);
  auto limit = (*hdr)->option_at<TunnelEncapsulationLimit>(0);
  ASSERT_TRUE(limit);
  EXPECT_EQ((*limit)->limit, 0x13u);
}

TEST_F(PacketTest, HopByHopRouterAlert) {
  const auto idx = ip_index();
  HopByHopOptions hbh;
  ASSERT_TRUE(hbh.add_option(RouterAlert{0x13u}));
  ASSERT_TRUE(hbh.add_option(*PadN::make(2u)));
  hbh.set_next_header(IpProtocol::ICMPv6);
  ASSERT_TRUE(pkt_.insert_header(idx + 1, hbh));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::HOPOPT));

  EXPECT_EQ(reparse(pkt_), pkt_);
  auto alert = hbh.option_at<RouterAlert>(0);
  ASSERT_TRUE(alert);
  EXPECT_EQ((*alert)->value, 0x13u);
}

TEST_F(PacketTest, SingleOctetPaddingIsPad1) {
  EXPECT_EQ(PadN::make(1u).error().code, Errc::Range);

  const auto idx = ip_index();
  HopByHopOptions hbh{IpProtocol::ICMPv6};
  ASSERT_TRUE(hbh.add_option(RouterAlert{1u}));
  ASSERT_TRUE(hbh.add_option(Pad1{}));
  ASSERT_TRUE(hbh.add_option(Pad1{}));
  ASSERT_TRUE(pkt_.insert_header(idx + 1, hbh));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::HOPOPT));

  WarningSink sink;
  const auto p = reparse(pkt_);
  EXPECT_TRUE(sink.warnings().empty());
  EXPECT_EQ(p, pkt_);
  const auto* back = p.get_header<HopByHopOptions>();
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(back->length(), 3u);
}

TEST_F(PacketTest, HopByHopHomeAddress) {
  const auto idx = ip_index();
  HopByHopOptions hbh{IpProtocol::ICMPv6};
  ASSERT_TRUE(hbh.add_option(HomeAddress{addr("fc00::2")}));
  ASSERT_TRUE(hbh.add_option(*PadN::make(4u)));
  ASSERT_TRUE(pkt_.insert_header(idx + 1, hbh));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::HOPOPT));

  EXPECT_EQ(reparse(pkt_), pkt_);
}

TEST_F(PacketTest, BadPaddingWarnsThenRoundTrips) {
  const auto idx = ip_index();
  HopByHopOptions hbh{IpProtocol::ICMPv6};
  ASSERT_TRUE(hbh.add_option(HomeAddress{addr("fc00::2")}));
  ASSERT_TRUE(pkt_.insert_header(idx + 1, hbh));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::HOPOPT));

  {
    WarningSink sink;
    pkt_.to_bytes();
    ASSERT_EQ(sink.warnings().size(), 1u);
    EXPECT_NE(sink.warnings()[0].find("not an even multiple of 8"),
              std::string::npos);
  }

  auto slot = pkt_.header_at<HopByHopOptions>(idx + 1);
  ASSERT_TRUE(slot);
  ASSERT_TRUE((*slot)->add_option(*PadN::make(4u)));

  WarningSink sink;
  const auto p = reparse(pkt_);
  EXPECT_TRUE(sink.warnings().empty());
  EXPECT_EQ(p, pkt_);

  const auto& opts = **slot;
  EXPECT_EQ(opts.length(), 2u);
  auto home = opts.option_at<HomeAddress>(0);
  ASSERT_TRUE(home);
  EXPECT_EQ((*home)->address, addr("fc00::2"));

  EXPECT_EQ(opts.at(Slice{0, 1}).error().code, Errc::Shape);
  EXPECT_EQ(opts.at(2).error().code, Errc::Range);
  EXPECT_EQ(opts.at(-1).error().code, Errc::Range);
}

TEST_F(PacketTest, JumboPayloadOption) {
  const auto idx = ip_index();
  DestinationOptions dst{IpProtocol::ICMPv6};
  ASSERT_TRUE(dst.add_option(JumboPayload{10000u}));
  ASSERT_TRUE(pkt_.insert_header(idx + 1, dst));
  ASSERT_TRUE(pkt_.set_next_header(idx, IpProtocol::IPv6_Opts));

  const auto p = reparse(pkt_);
  EXPECT_EQ(p, pkt_);
  EXPECT_EQ(dst.length(), 1u);
  auto jumbo = dst.option_at<JumboPayload>(0);
  ASSERT_TRUE(jumbo);
  EXPECT_EQ((*jumbo)->len, 10000u);
}

TEST_F(PacketTest, NoNextHeaderLeavesTwoHeaders) {
  const auto idx = ip_index();
  auto ip = pkt_.header_at<IPv6>(idx);
  ASSERT_TRUE(ip);
  (*ip)->set_next_header(IpProtocol::IPv6_NoNxt);
  (*ip)->set_src(addr("fc00::a"));
  (*ip)->set_dst(addr("fc00::b"));
  ASSERT_TRUE(pkt_.remove(idx + 1));
  EXPECT_EQ(pkt_.num_headers(), 2u);

  EXPECT_EQ(reparse(pkt_), pkt_);
}

TEST_F(PacketTest, MobilityHeaderLeavesThreeHeaders) {
  const auto idx = ip_index();
  auto ip = pkt_.header_at<IPv6>(idx);
  ASSERT_TRUE(ip);
  (*ip)->set_next_header(IpProtocol::MobilityHeader);
  (*ip)->set_src(addr("fc00::a"));
  (*ip)->set_dst(addr("fc00::b"));
  ASSERT_TRUE(pkt_.set(idx + 1, Mobility{}));
  EXPECT_EQ(pkt_.num_headers(), 3u);

  const auto p = reparse(pkt_);
  EXPECT_EQ(p, pkt_);
  EXPECT_EQ(p.to_bytes(), pkt_.to_bytes());
}

TEST_F(PacketTest, IndexErrors) {
  EXPECT_EQ(pkt_.at(3).error().code, Errc::Range);
  EXPECT_EQ(pkt_.at(-1).error().code, Errc::Range);
  EXPECT_EQ(pkt_.at(Slice{0, 2}).error().code, Errc::Shape);
  EXPECT_EQ(pkt_.remove(Slice{1, 2}).error().code, Errc::Shape);
  EXPECT_EQ(pkt_.remove(3).error().code, Errc::Range);
  EXPECT_EQ(pkt_.set(3, RawPayload{}).error().code, Errc::Range);
  EXPECT_EQ(pkt_.insert_header(4, RawPayload{}).error().code, Errc::Range);
  EXPECT_EQ(pkt_.insert_header(-1, RawPayload{}).error().code, Errc::Range);
  EXPECT_EQ(pkt_.header_at<Fragment>(1).error().code, Errc::TypeMismatch);
  EXPECT_EQ(pkt_.set_next_header(2, uint8_t{6}).error().code,
            Errc::TypeMismatch);
  EXPECT_EQ(pkt_.num_headers(), 3u);
}

TEST_F(PacketTest, InsertAtEndAppends) {
  ASSERT_TRUE(pkt_.insert_header(3, RawPayload{Bytes{1u}}));
  EXPECT_TRUE(std::holds_alternative<RawPayload>(pkt_.headers().back()));
  EXPECT_FALSE(pkt_.get_header_index<Fragment>());
  EXPECT_EQ(pkt_.get_header_index<ICMPv6>(), 2u);
}

TEST_F(PacketTest, ChainingIsNotRewritten) {
  const auto idx = ip_index();
  ASSERT_TRUE(pkt_.insert_header(idx + 1, Fragment{}));
  EXPECT_EQ(std::get<IPv6>(pkt_.headers()[1]).next_header(), 58u);
}

TEST_F(PacketTest, ExplicitNoNextHeaderEncodesToNothing) {
  Packet with = Ethernet{} + IPv6{};
  with += NoNextHeader{};
  const Packet without = Ethernet{} + IPv6{};
  EXPECT_EQ(with.to_bytes(), without.to_bytes());
  EXPECT_EQ(reparse(with), without);
}

TEST_F(PacketTest, TrailingBytesPastPayloadAreDropped) {
  auto raw = pkt_.to_bytes();
  raw.insert(raw.end(), 6u, 0u);
  auto p = Packet::from_bytes(raw);
  ASSERT_TRUE(p);
  EXPECT_EQ(*p, pkt_);
}

TEST_F(PacketTest, PayloadShorterThanDeclaredIsFormatError) {
  auto raw = pkt_.to_bytes();
  raw.resize(raw.size() - 2u);
  auto p = Packet::from_bytes(raw);
  ASSERT_FALSE(p);
  EXPECT_EQ(p.error().code, Errc::Format);
}

TEST_F(PacketTest, MissingExtensionBytesIsFormatError) {
  const Packet cut = Ethernet{} + IPv6{addr("::1"), addr("::2"),
                                       IpProtocol::IPv6_Frag};
  auto p = Packet::from_bytes(cut.to_bytes());
  ASSERT_FALSE(p);
  EXPECT_EQ(p.error().code, Errc::Format);

  EXPECT_EQ(Packet::from_bytes(Bytes{}).error().code, Errc::Format);
}

TEST_F(PacketTest, OpaqueProtocolBecomesRawPayload) {
  IPv6 ip{addr("2001:db8::1"), addr("2001:db8::2"), IpProtocol::UDP};
  const Packet p = ip + RawPayload{Bytes{0x12u, 0x34u, 0x00u, 0x35u}};

  auto r = Packet::from_bytes(p.to_bytes(),
                              ParseConfig{.first_layer = FirstLayer::IPv6});
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, p);
}

TEST_F(PacketTest, NonIPv6EthertypeIsOpaque) {
  Ethernet e;
  e.set_ethertype(EtherType::IPv4);
  const Packet p = e + RawPayload{Bytes{0x45u, 0x00u, 0x00u, 0x14u}};
  EXPECT_EQ(reparse(p), p);
}

TEST_F(PacketTest, JumbogramPayloadLengthIsZero) {
  HopByHopOptions hbh{IpProtocol::UDP};
  ASSERT_TRUE(hbh.add_option(JumboPayload{70008u}));
  IPv6 ip{addr("fc00::1"), addr("fc00::2"), IpProtocol::HOPOPT};
  const Packet p = ip + hbh + RawPayload{Bytes(70000u, 0xABu)};

  const auto raw = p.to_bytes();
  EXPECT_EQ(IPv6::declared_payload_length(raw), 0u);

  auto r = Packet::from_bytes(raw, ParseConfig{.first_layer = FirstLayer::IPv6});
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, p);
}

TEST_F(PacketTest, HeaderLimitIsEnforced) {
  auto r = Packet::from_bytes(pkt_.to_bytes(), ParseConfig{.max_headers = 2});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, Errc::Format);
}

TEST_F(PacketTest, CopiesAreIndependent) {
  Packet copy = pkt_;
  ASSERT_TRUE(copy.remove(2));
  EXPECT_NE(copy, pkt_);
  EXPECT_EQ(pkt_.num_headers(), 3u);
}
