#include <socks5chain/error/error.hpp>
#include <array>
#include <proto/proto.hpp>

namespace socks5chain::error {

namespace {

// Indexed by Error.
constexpr std::array<const char*, 13> kMessages{
    "Succeeded",
    "General SOCKS5 failure",
    "Connection not allowed by ruleset",
    "Network unreachable",
    "Host unreachable",
    "Connection refused",
    "TTL expired",
    "Command not supported",
    "Unsupported address type",
    "SOCKS version mismatch",
    "Upstream rejected username/password authentication method",
    "Upstream authentication failed",
    "Server cannot be started in its current state",
};

static_assert(kMessages.size() ==
              static_cast<size_t>(Error::kInvalidServerState) + 1);

class ErrorCategory final : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "socks5chain_error"; }

  std::string message(int ev) const override {
    if (ev < 0 || static_cast<size_t>(ev) >= kMessages.size()) {
      return "Unrecognized error";
    }
    return kMessages[ev];
  }
};

const ErrorCategory kErrorCategory{};

}  // namespace

boost::system::error_code make_error_code(Error err) noexcept {
  return {static_cast<int>(err), kErrorCategory};
}

// Reply codes defined by RFC 1928 share their values with Error. Anything
// above them is reported as a general failure.
boost::system::error_code MakeError(uint8_t reply_rep) noexcept {
  if (reply_rep > proto::ReplyRep::kReplyRepAddrTypeNotSupported) {
    return Error::kGeneralFailure;
  }
  return static_cast<Error>(reply_rep);
}

}  // namespace socks5chain::error
