#include <server/handshake.hpp>
#include <socks5chain/error/error.hpp>
#include <proto/proto.hpp>
#include <common/defs.hpp>
#include <common/proto_builders.hpp>
#include <net/io.hpp>
#include <net/utils.hpp>
#include <parsers/parsers.hpp>
#include <serializers/serializers.hpp>
#include <utils/logger.hpp>

namespace socks5chain::server {

namespace {

// VER and NMETHODS of a greeting.
constexpr size_t kGreetingHeaderSize{2};
// VER, CMD, RSV and ATYP of a request.
constexpr size_t kRequestHeaderSize{4};

// Consume the VER byte at the read position.
bool IsVersion5(utils::Buffer& buf) noexcept {
  return buf.Read<uint8_t>() == proto::Version::kVersionVer5;
}

}  // namespace

Handshake::Handshake(tcp::socket& socket) noexcept : socket_{socket} {}

TargetOrErrorAwait Handshake::Run() noexcept {
  try {
    if (const auto err = co_await Auth()) {
      co_return std::make_pair(err, std::nullopt);
    }
    co_return co_await ReadRequest();
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Inbound handshake exception. Client: {}. {}",
                    net::ToString(socket_), ex.what());
    co_return std::make_pair(make_error_code(error::Error::kGeneralFailure),
                             std::nullopt);
  }
}

// Whatever methods the client offers, "no authentication" is selected.
// https://datatracker.ietf.org/doc/html/rfc1928#section-3
ErrorAwait Handshake::Auth() noexcept {
  ClientGreetingBuf greeting;
  if (const auto err =
          co_await net::Read(socket_, greeting, kGreetingHeaderSize)) {
    co_return err;
  }
  if (!IsVersion5(greeting)) {
    co_return error::Error::kVersionMismatch;
  }
  const auto nmethods = greeting.Read<uint8_t>();
  if (const auto err = co_await net::Read(socket_, greeting, nmethods)) {
    co_return err;
  }
  const auto choice = common::MakeServerChoice(proto::kAuthMethodNone);
  co_return co_await net::Send(socket_, serializers::Serialize(choice));
}

// The success reply goes out before the upstream is contacted.
// https://datatracker.ietf.org/doc/html/rfc1928#section-4
TargetOrErrorAwait Handshake::ReadRequest() noexcept {
  RequestBuf request_buf;
  auto err = co_await net::Read(socket_, request_buf, kRequestHeaderSize);
  if (!err && !IsVersion5(request_buf)) {
    err = error::Error::kVersionMismatch;
  }
  if (!err) {
    err = co_await net::ReadAddrBody(socket_, request_buf);
  }
  if (err) {
    co_return std::make_pair(err, std::nullopt);
  }
  const auto request = parsers::ParseRequest(request_buf);
  const auto reply = common::MakeReply(proto::kReplyRepSuccess);
  if (const auto send_err =
          co_await net::Send(socket_, serializers::Serialize(reply))) {
    co_return std::make_pair(send_err, std::nullopt);
  }
  co_return std::make_pair(boost::system::error_code{},
                           common::MakeTarget(request.dst_addr));
}

}  // namespace socks5chain::server
