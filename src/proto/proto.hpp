#pragma once

#include <array>
#include <cstdint>

// In-memory layout of the SOCKS5 messages exchanged on both sides of the
// relay. RFC 1928 covers method selection, requests and replies; RFC 1929
// covers the username/password sub-negotiation. Variable-length fields get
// their maximum size; only the used prefix goes on the wire. Ports are kept
// in network byte order.
namespace socks5chain::proto {

enum Version : uint8_t {
  kVersionVer5 = 0x05,
};

// Only the methods the relay uses on either side.
enum AuthMethod : uint8_t {
  kAuthMethodNone = 0x00,
  kAuthMethodUser = 0x02,
};

enum RequestCmd : uint8_t {
  kRequestCmdConnect = 0x01,
};

// REP field of a reply, RFC 1928 section 6.
enum ReplyRep : uint8_t {
  kReplyRepSuccess = 0x00,
  kReplyRepFail = 0x01,
  kReplyRepNotAllowed = 0x02,
  kReplyRepNetworkUnreachable = 0x03,
  kReplyRepHostUnreachable = 0x04,
  kReplyRepConnectionRefused = 0x05,
  kReplyRepTTLExpired = 0x06,
  kReplyRepCommandNotSupported = 0x07,
  kReplyRepAddrTypeNotSupported = 0x08,
};

enum AddrType : uint8_t {
  kAddrTypeIPv4 = 0x01,
  kAddrTypeDomainName = 0x03,
  kAddrTypeIPv6 = 0x04,
};

// Version of the username/password sub-negotiation, not of SOCKS.
enum UserAuthVersion : uint8_t {
  kUserAuthVersionVer = 0x01,
};

enum UserAuthStatus : uint8_t {
  kUserAuthStatusSuccess = 0x00,
  kUserAuthStatusFailure = 0x01,
};

struct IPv4 final {
  std::array<uint8_t, 4> addr;
  uint16_t port;
};

struct IPv6 final {
  std::array<uint8_t, 16> addr;
  uint16_t port;
};

struct Domain final {
  uint8_t length;
  std::array<uint8_t, 256> addr;
  uint16_t port;
};

// ATYP selects the active member.
struct Addr final {
  uint8_t atyp;
  union {
    IPv4 ipv4;
    IPv6 ipv6;
    Domain domain;
  } addr;
};

struct ClientGreeting final {
  uint8_t ver;
  uint8_t nmethods;
  std::array<uint8_t, 256> methods;
};

struct ServerChoice final {
  uint8_t ver;
  uint8_t method;
};

struct Request final {
  uint8_t ver;
  uint8_t cmd;
  uint8_t rsv;
  Addr dst_addr;
};

struct Reply final {
  uint8_t ver;
  uint8_t rep;
  uint8_t rsv;
  Addr bnd_addr;
};

struct UserAuthRequest final {
  uint8_t ver;
  uint8_t ulen;
  std::array<uint8_t, 255> uname;
  uint8_t plen;
  std::array<uint8_t, 255> passwd;
};

struct UserAuthResponse final {
  uint8_t ver;
  uint8_t status;
};

}  // namespace socks5chain::proto
