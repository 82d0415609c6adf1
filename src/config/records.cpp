#include <config/records.hpp>
#include <charconv>
#include <limits>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <utils/logger.hpp>

namespace socks5chain::config {

namespace {

namespace pt = boost::property_tree;

constexpr const char* kUsernameKey{"username"};
constexpr const char* kPasswordKey{"password"};
constexpr const char* kUpstreamHostKey{"upstream_host"};
constexpr const char* kUpstreamPortKey{"upstream_port"};

std::string ToJson(const pt::ptree& tree) {
  std::ostringstream out;
  pt::write_json(out, tree, false);
  return out.str();
}

std::optional<pt::ptree> FromJson(std::string_view json) {
  try {
    std::istringstream in{std::string{json}};
    pt::ptree tree;
    pt::read_json(in, tree);
    return tree;
  } catch (const pt::ptree_error& ex) {
    SOCKS5CHAIN_LOG(debug, "Invalid JSON record. {}", ex.what());
    return std::nullopt;
  }
}

// The port is written as a string, a record written by hand may carry a
// number. Both read back the same.
bool ReadPort(const pt::ptree& tree, unsigned short& port) {
  const auto value = tree.get_optional<std::string>(kUpstreamPortKey);
  if (!value || value->empty()) {
    return true;
  }
  unsigned int parsed{};
  const auto* end = value->data() + value->size();
  const auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
  if (ec != std::errc{} || ptr != end ||
      parsed > std::numeric_limits<unsigned short>::max()) {
    return false;
  }
  port = static_cast<unsigned short>(parsed);
  return true;
}

std::string GetString(const pt::ptree& tree, const char* key) {
  return tree.get<std::string>(key, std::string{});
}

void WriteAddr(pt::ptree& tree, const std::string& host, unsigned short port) {
  tree.put(kUpstreamHostKey, host);
  tree.put(kUpstreamPortKey, std::to_string(port));
}

}  // namespace

std::string Serialize(const HostRecord& record) {
  pt::ptree tree;
  WriteAddr(tree, record.upstream_host, record.upstream_port);
  return ToJson(tree);
}

std::string Serialize(const CredentialRecord& record) {
  pt::ptree tree;
  tree.put(kUsernameKey, record.username);
  tree.put(kPasswordKey, record.password);
  WriteAddr(tree, record.upstream_host, record.upstream_port);
  return ToJson(tree);
}

std::optional<HostRecord> ParseHostRecord(std::string_view json) {
  const auto tree = FromJson(json);
  if (!tree) {
    return std::nullopt;
  }
  HostRecord record;
  record.upstream_host = GetString(*tree, kUpstreamHostKey);
  if (!ReadPort(*tree, record.upstream_port)) {
    return std::nullopt;
  }
  return record;
}

std::optional<CredentialRecord> ParseCredentialRecord(std::string_view json) {
  const auto tree = FromJson(json);
  if (!tree) {
    return std::nullopt;
  }
  CredentialRecord record;
  record.username = GetString(*tree, kUsernameKey);
  record.password = GetString(*tree, kPasswordKey);
  record.upstream_host = GetString(*tree, kUpstreamHostKey);
  if (!ReadPort(*tree, record.upstream_port)) {
    return std::nullopt;
  }
  return record;
}

}  // namespace socks5chain::config
