#include <client/connect_handshake.hpp>
#include <socks5chain/error/error.hpp>
#include <proto/proto.hpp>
#include <auth/client/user_auth.hpp>
#include <common/defs.hpp>
#include <common/proto_builders.hpp>
#include <net/io.hpp>
#include <parsers/parsers.hpp>
#include <serializers/serializers.hpp>
#include <utils/logger.hpp>

namespace socks5chain::client {

namespace {

// VER, REP, RSV and ATYP of a reply.
constexpr size_t kReplyHeaderSize{4};

}  // namespace

ConnectHandshake::ConnectHandshake(
    tcp::socket& socket, const common::Target& target,
    const config::ConnectionParams& params) noexcept
    : socket_{socket}, target_{target}, params_{params} {}

ErrorAwait ConnectHandshake::Run() noexcept {
  if (const auto err = co_await Negotiate()) {
    co_return err;
  }
  co_return co_await Connect();
}

// https://datatracker.ietf.org/doc/html/rfc1928#section-3
ErrorAwait ConnectHandshake::Negotiate() noexcept {
  if (const auto err = co_await net::Send(
          socket_, serializers::Serialize(common::MakeClientGreeting(
                       proto::AuthMethod::kAuthMethodUser)))) {
    co_return err;
  }
  ServerChoiceBuf choice_buf;
  if (const auto err =
          co_await net::Read(socket_, choice_buf, choice_buf.Size())) {
    co_return err;
  }
  const auto choice = parsers::ParseServerChoice(choice_buf);
  if (choice.ver != proto::Version::kVersionVer5 ||
      choice.method != proto::AuthMethod::kAuthMethodUser) {
    SOCKS5CHAIN_LOG(debug, "Upstream selected method {:#04x}, version {}",
                    choice.method, choice.ver);
    co_return error::Error::kAuthMethodRejected;
  }
  auth::client::UserAuth user_auth{socket_, params_.username,
                                   params_.password};
  co_return co_await user_auth.Run();
}

// https://datatracker.ietf.org/doc/html/rfc1928#section-4
ErrorAwait ConnectHandshake::Connect() noexcept {
  const auto request =
      common::MakeRequest(proto::RequestCmd::kRequestCmdConnect,
                          common::MakeAddr(target_.host, target_.port));
  if (const auto err =
          co_await net::Send(socket_, serializers::Serialize(request))) {
    co_return err;
  }

  // A refusal may carry a bogus bound address, so REP is checked before the
  // address is read. On success the relay starts right after it.
  ReplyBuf buf;
  if (const auto err = co_await net::Read(socket_, buf, kReplyHeaderSize)) {
    co_return err;
  }
  if (buf.Read<decltype(proto::Reply::ver)>() !=
      proto::Version::kVersionVer5) {
    co_return error::Error::kVersionMismatch;
  }
  const auto rep = buf.Read<decltype(proto::Reply::rep)>();
  if (rep != proto::ReplyRep::kReplyRepSuccess) {
    SOCKS5CHAIN_LOG(debug, "Upstream refused CONNECT to {}. rep={:#04x}",
                    common::ToString(target_), rep);
    co_return error::MakeError(rep);
  }
  co_return co_await net::ReadAddrBody(socket_, buf);
}

}  // namespace socks5chain::client
