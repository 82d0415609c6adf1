#include <gtest/gtest.h>
#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/buffer.hpp>
#include <parsers/parsers.hpp>
#include <proto/proto.hpp>
#include <string_view>
#include <vector>

namespace socks5chain::parsers {

namespace {

template <size_t N>
utils::StaticBuffer<N> MakeBuffer(const std::vector<uint8_t>& data) {
  utils::StaticBuffer<N> buf;
  buf.Append(data.data(), data.size());
  return buf;
}

unsigned short ToHostPort(uint16_t port) {
  return asio::detail::socket_ops::network_to_host_short(port);
}

}  // namespace

TEST(ParsersTest, ParseClientGreeting) {
  auto buf = MakeBuffer<16>({0x05, 0x03, 0x00, 0x01, 0x02});
  const auto greeting = ParseClientGreeting(buf);

  EXPECT_EQ(greeting.ver, proto::kVersionVer5);
  EXPECT_EQ(greeting.nmethods, 3);
  EXPECT_EQ(greeting.methods[0], 0x00);
  EXPECT_EQ(greeting.methods[1], 0x01);
  EXPECT_EQ(greeting.methods[2], 0x02);
}

TEST(ParsersTest, ParseRequestIPv4) {
  std::vector<uint8_t> data = {
      0x05,             // VER
      0x01,             // CMD (CONNECT)
      0x00,             // RSV
      0x01,             // ATYP (IPv4)
      10,   0,    0, 7,  // IP
      0x1F, 0x90        // PORT (8080)
  };

  auto buf = MakeBuffer<64>(data);
  const auto request = ParseRequest(buf);

  EXPECT_EQ(request.ver, proto::kVersionVer5);
  EXPECT_EQ(request.cmd, proto::kRequestCmdConnect);
  EXPECT_EQ(request.dst_addr.atyp, proto::kAddrTypeIPv4);
  EXPECT_EQ(request.dst_addr.addr.ipv4.addr,
            (std::array<uint8_t, 4>{10, 0, 0, 7}));
  EXPECT_EQ(ToHostPort(request.dst_addr.addr.ipv4.port), 8080);
}

TEST(ParsersTest, ParseRequestIPv6) {
  std::vector<uint8_t> data = {
      0x05, 0x01, 0x00, 0x04,                                     // header
      0,    1,    2,    3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15,  // IP
      0x01, 0xBB                                                  // PORT (443)
  };

  auto buf = MakeBuffer<64>(data);
  const auto request = ParseRequest(buf);

  EXPECT_EQ(request.dst_addr.atyp, proto::kAddrTypeIPv6);
  EXPECT_EQ(request.dst_addr.addr.ipv6.addr,
            (std::array<uint8_t, 16>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12,
                                     13, 14, 15}));
  EXPECT_EQ(ToHostPort(request.dst_addr.addr.ipv6.port), 443);
}

TEST(ParsersTest, ParseRequestDomain) {
  std::vector<uint8_t> data = {
      0x05, 0x01, 0x00, 0x03,                          // header
      0x0B,                                            // LEN
      'e',  'x',  'a',  'm', 'p', 'l', 'e', '.', 'c', 'o', 'm',  // NAME
      0x00, 0x50                                       // PORT (80)
  };

  auto buf = MakeBuffer<300>(data);
  const auto request = ParseRequest(buf);

  EXPECT_EQ(request.dst_addr.atyp, proto::kAddrTypeDomainName);
  EXPECT_EQ(request.dst_addr.addr.domain.length, 11);
  EXPECT_EQ((std::string_view{reinterpret_cast<const char*>(
                                  request.dst_addr.addr.domain.addr.data()),
                              request.dst_addr.addr.domain.length}),
            "example.com");
  EXPECT_EQ(ToHostPort(request.dst_addr.addr.domain.port), 80);
}

TEST(ParsersTest, ParseServerChoice) {
  auto buf = MakeBuffer<2>({0x05, 0x02});
  const auto choice = ParseServerChoice(buf);

  EXPECT_EQ(choice.ver, proto::kVersionVer5);
  EXPECT_EQ(choice.method, proto::kAuthMethodUser);
}

TEST(ParsersTest, ParseReplyWithBoundAddress) {
  auto buf = MakeBuffer<64>(
      {0x05, 0x05, 0x00, 0x01, 127, 0, 0, 1, 0x04, 0x38});
  const auto reply = ParseReply(buf);

  EXPECT_EQ(reply.ver, proto::kVersionVer5);
  EXPECT_EQ(reply.rep, proto::kReplyRepConnectionRefused);
  EXPECT_EQ(reply.bnd_addr.atyp, proto::kAddrTypeIPv4);
  EXPECT_EQ(reply.bnd_addr.addr.ipv4.addr,
            (std::array<uint8_t, 4>{127, 0, 0, 1}));
  EXPECT_EQ(ToHostPort(reply.bnd_addr.addr.ipv4.port), 1080);
}

TEST(ParsersTest, ParseUserAuthRequest) {
  auto buf = MakeBuffer<520>({0x01, 0x04, 'u', 's', 'e', 'r', 0x03, 'p', 'w',
                              'd'});
  const auto request = ParseUserAuthRequest(buf);

  EXPECT_EQ(request.ver, proto::kUserAuthVersionVer);
  EXPECT_EQ(request.ulen, 4);
  EXPECT_EQ((std::string_view{reinterpret_cast<const char*>(
                                  request.uname.data()),
                              request.ulen}),
            "user");
  EXPECT_EQ(request.plen, 3);
  EXPECT_EQ((std::string_view{reinterpret_cast<const char*>(
                                  request.passwd.data()),
                              request.plen}),
            "pwd");
}

TEST(ParsersTest, ParseUserAuthResponse) {
  auto buf = MakeBuffer<2>({0x01, 0x01});
  const auto response = ParseUserAuthResponse(buf);

  EXPECT_EQ(response.ver, proto::kUserAuthVersionVer);
  EXPECT_EQ(response.status, proto::kUserAuthStatusFailure);
}

TEST(ParsersTest, ParseRereadsFromBeginning) {
  auto buf = MakeBuffer<2>({0x05, 0x00});
  buf.Seek(1);
  const auto choice = ParseServerChoice(buf);

  EXPECT_EQ(choice.ver, proto::kVersionVer5);
  EXPECT_EQ(choice.method, proto::kAuthMethodNone);
}

}  // namespace socks5chain::parsers
