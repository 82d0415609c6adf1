#include <socks5chain/server/server.hpp>
#include <socks5chain/error/error.hpp>
#include <socks5chain/common/asio.hpp>
#include <utils/thread_pool.hpp>
#include <utils/wait_group.hpp>
#include <utils/logger.hpp>
#include <server/listener.hpp>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace socks5chain::server {

namespace {

// Longest username or password the RFC 1929 request can carry.
constexpr size_t kMaxCredentialSize{255};

const config::ConnectionParams& Validate(
    const config::ConnectionParamsPtr& params) {
  if (!params) {
    throw std::invalid_argument{"Connection parameters are required"};
  }
  if (params->username.size() > kMaxCredentialSize ||
      params->password.size() > kMaxCredentialSize) {
    throw std::invalid_argument{
        "Upstream username and password must not exceed 255 bytes"};
  }
  return *params;
}

utils::ErrorOr<TcpEndpointOpt> ResolveListenEndpoint(
    asio::io_context& io_context, const config::ConnectionParams& params) {
  boost::system::error_code err;
  tcp::resolver resolver{io_context};
  const auto endpoints =
      resolver.resolve(params.local_host, std::to_string(params.local_port),
                       tcp::resolver::passive, err);
  if (err) {
    return {err, std::nullopt};
  }
  if (endpoints.empty()) {
    return {asio::error::host_not_found, std::nullopt};
  }
  return {err, endpoints.begin()->endpoint()};
}

}  // namespace

struct Server::Impl {
  config::ConnectionParamsPtr params;
  Config config;
  utils::WaitGroup wait_group;
  asio::io_context io_context;
  ListenerPtr listener;
  utils::ThreadPool thread_pool;
  std::atomic<State> state{State::kCreated};
  std::mutex mtx;
  std::condition_variable state_cv;

  Impl(config::ConnectionParamsPtr p, Config c)
      : params{std::move(p)},
        config{std::move(c)},
        io_context{static_cast<int>(config.threads_num)},
        thread_pool{config.threads_num} {}

  // Must be called with mtx held.
  void SetState(State new_state) {
    state = new_state;
    state_cv.notify_all();
  }
};

Server::Server(config::ConnectionParamsPtr params, Config config) {
  Validate(params);
  impl_ = std::make_unique<Impl>(std::move(params), std::move(config));
}

Server::~Server() { Stop(); }

boost::system::error_code Server::Run() {
  std::lock_guard lk{impl_->mtx};
  if (impl_->state != State::kCreated) {
    return error::Error::kInvalidServerState;
  }
  const auto [resolve_err, endpoint] =
      ResolveListenEndpoint(impl_->io_context, *impl_->params);
  if (resolve_err) {
    SOCKS5CHAIN_LOG(error, "Failed to resolve listen address {}:{}. {}",
                    impl_->params->local_host, impl_->params->local_port,
                    resolve_err.message());
    impl_->SetState(State::kStopped);
    return resolve_err;
  }
  impl_->listener = std::make_shared<Listener>(
      impl_->io_context, impl_->params, impl_->config, impl_->wait_group);
  if (const auto err = impl_->listener->Bind(*endpoint)) {
    SOCKS5CHAIN_LOG(error, "Failed to listen on {}:{}. {}",
                    impl_->params->local_host, impl_->params->local_port,
                    err.message());
    impl_->listener.reset();
    impl_->SetState(State::kStopped);
    return err;
  }
  impl_->listener->Run();
  impl_->SetState(State::kListening);
  impl_->thread_pool.Run([this] {
    for (;;) {
      try {
        impl_->io_context.run();
        return;
      } catch (const std::exception& ex) {
        SOCKS5CHAIN_LOG(error, "Unhandled exception: {}", ex.what());
      }
    }
  });
  SOCKS5CHAIN_LOG(info, "Socks5 relay started. Upstream: {}:{}",
                  impl_->params->upstream_host, impl_->params->upstream_port);
  return {};
}

boost::system::error_code Server::Start() {
  if (const auto err = Run()) {
    return err;
  }
  Wait();
  return {};
}

void Server::Wait() {
  std::unique_lock lk{impl_->mtx};
  impl_->state_cv.wait(lk, [this] {
    const auto state = impl_->state.load();
    return state == State::kCreated || state == State::kStopped;
  });
}

void Server::Stop() noexcept {
  try {
    {
      std::lock_guard lk{impl_->mtx};
      const auto state = impl_->state.load();
      if (state == State::kCreated) {
        impl_->SetState(State::kStopped);
        return;
      }
      if (state != State::kListening) {
        return;
      }
      impl_->SetState(State::kShuttingDown);
    }
    SOCKS5CHAIN_LOG(info, "Socks5 relay shutting down");
    impl_->listener->Close();
    if (!impl_->wait_group.WaitFor(
            std::chrono::seconds{impl_->config.shutdown_timeout})) {
      SOCKS5CHAIN_LOG(warn,
                      "Shutdown timeout expired, dropping {} active "
                      "connection(s)",
                      impl_->wait_group.Count());
    }
    impl_->io_context.stop();
    impl_->thread_pool.JoinAll();
    {
      std::lock_guard lk{impl_->mtx};
      impl_->SetState(State::kStopped);
    }
    SOCKS5CHAIN_LOG(info, "Socks5 relay stopped");
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Server stop exception. {}", ex.what());
  }
}

State Server::GetState() const noexcept { return impl_->state; }

unsigned short Server::Port() const noexcept {
  std::lock_guard lk{impl_->mtx};
  if (!impl_->listener || impl_->state != State::kListening) {
    return 0;
  }
  return impl_->listener->Port();
}

}  // namespace socks5chain::server
