#include <gtest/gtest.h>
#include <cli/options.hpp>
#include <boost/program_options/errors.hpp>
#include <map>
#include <string>
#include <vector>

namespace socks5chain::cli {

namespace {

class OptionsTest : public ::testing::Test {
 protected:
  Options Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "socks5chain");
    return ParseOptions(static_cast<int>(args.size()), args.data(),
                        [this](const char* name) -> const char* {
                          const auto it = env_.find(name);
                          return it == env_.end() ? nullptr
                                                  : it->second.c_str();
                        });
  }

  std::map<std::string, std::string> env_;
};

}  // namespace

TEST_F(OptionsTest, Defaults) {
  const auto options = Parse({});

  EXPECT_FALSE(options.show_help);
  EXPECT_FALSE(options.show_version);
  EXPECT_FALSE(options.configure);
  EXPECT_FALSE(options.console_log);
  EXPECT_TRUE(options.log_file.empty());
  EXPECT_EQ(options.log_level, logger::Level::info);
  EXPECT_TRUE(options.passphrase.empty());
  EXPECT_TRUE(options.overrides.username.empty());
  EXPECT_TRUE(options.overrides.password.empty());
  EXPECT_TRUE(options.overrides.upstream_host.empty());
  EXPECT_EQ(options.overrides.upstream_port, 0);
  EXPECT_EQ(options.overrides.local_host, "127.0.0.1");
  EXPECT_EQ(options.overrides.local_port, 1080);
  EXPECT_EQ(options.config_dir.filename().string(), ".socks5-chain");
  EXPECT_GE(options.server_config.threads_num, 1);
}

TEST_F(OptionsTest, AllFlags) {
  const auto options = Parse(
      {"--username", "alice", "--password", "secret", "--encpass", "key",
       "--upstream-host", "proxy.example.com", "--upstream-port", "1081",
       "--local-host", "0.0.0.0", "--local-port", "9050", "--log-file",
       "/tmp/relay.log", "--console-log", "--log-level", "debug", "--threads",
       "3", "--config-dir", "/tmp/relay-config", "--configure"});

  EXPECT_EQ(options.overrides.username, "alice");
  EXPECT_EQ(options.overrides.password, "secret");
  EXPECT_EQ(options.passphrase, "key");
  EXPECT_EQ(options.overrides.upstream_host, "proxy.example.com");
  EXPECT_EQ(options.overrides.upstream_port, 1081);
  EXPECT_EQ(options.overrides.local_host, "0.0.0.0");
  EXPECT_EQ(options.overrides.local_port, 9050);
  EXPECT_EQ(options.log_file, "/tmp/relay.log");
  EXPECT_TRUE(options.console_log);
  EXPECT_EQ(options.log_level, logger::Level::debug);
  EXPECT_EQ(options.server_config.threads_num, 3);
  EXPECT_EQ(options.config_dir.string(), "/tmp/relay-config");
  EXPECT_TRUE(options.configure);
}

TEST_F(OptionsTest, HelpAndVersion) {
  EXPECT_TRUE(Parse({"-h"}).show_help);
  EXPECT_TRUE(Parse({"--help"}).show_help);
  EXPECT_TRUE(Parse({"--version"}).show_version);
}

TEST_F(OptionsTest, EnvironmentDefaults) {
  env_[kUsernameEnv] = "env-user";
  env_[kPasswordEnv] = "env-password";
  env_[kPassphraseEnv] = "env-key";

  const auto options = Parse({});
  EXPECT_EQ(options.overrides.username, "env-user");
  EXPECT_EQ(options.overrides.password, "env-password");
  EXPECT_EQ(options.passphrase, "env-key");
}

TEST_F(OptionsTest, FlagsOverrideEnvironment) {
  env_[kUsernameEnv] = "env-user";
  env_[kPassphraseEnv] = "env-key";

  const auto options = Parse({"--username", "flag-user", "--encpass", "k"});
  EXPECT_EQ(options.overrides.username, "flag-user");
  EXPECT_EQ(options.passphrase, "k");
}

TEST_F(OptionsTest, InvalidLogLevel) {
  EXPECT_THROW(Parse({"--log-level", "verbose"}),
               boost::program_options::error);
}

TEST_F(OptionsTest, ZeroThreads) {
  EXPECT_THROW(Parse({"--threads", "0"}), boost::program_options::error);
}

TEST_F(OptionsTest, InvalidPort) {
  EXPECT_THROW(Parse({"--upstream-port", "http"}),
               boost::program_options::error);
}

TEST_F(OptionsTest, NegativePort) {
  EXPECT_THROW(Parse({"--upstream-port", "-1"}),
               boost::program_options::error);
  EXPECT_THROW(Parse({"--local-port=-1"}), boost::program_options::error);
}

TEST_F(OptionsTest, PortOutOfRange) {
  EXPECT_THROW(Parse({"--upstream-port", "70000"}),
               boost::program_options::error);
  EXPECT_THROW(Parse({"--local-port", "65536"}),
               boost::program_options::error);
  EXPECT_EQ(Parse({"--upstream-port", "65535"}).overrides.upstream_port,
            65535);
}

TEST_F(OptionsTest, UnknownOption) {
  EXPECT_THROW(Parse({"--socks4"}), boost::program_options::error);
}

TEST_F(OptionsTest, MissingValue) {
  EXPECT_THROW(Parse({"--upstream-host"}), boost::program_options::error);
}

TEST(UsageTest, ListsOptions) {
  const auto usage = Usage();
  EXPECT_NE(usage.find("--upstream-host"), std::string::npos);
  EXPECT_NE(usage.find("--configure"), std::string::npos);
  EXPECT_NE(usage.find("--encpass"), std::string::npos);
}

}  // namespace socks5chain::cli
