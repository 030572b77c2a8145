/*
 * 설명: 게이트키퍼 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#include "gatekeeper/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

namespace gatekeeper {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const Gatekeeper> gatekeeper, std::shared_ptr<LoginRateLimiter> rate_limiter,
           std::shared_ptr<Observability> observability, DownstreamHandler downstream)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), gatekeeper_(std::move(gatekeeper)),
        rate_limiter_(std::move(rate_limiter)), observability_(std::move(observability)),
        downstream_(std::move(downstream)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->gatekeeper_, self->rate_limiter_,
                                          self->observability_, self->downstream_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const Gatekeeper> gatekeeper_;
  std::shared_ptr<LoginRateLimiter> rate_limiter_;
  std::shared_ptr<Observability> observability_;
  DownstreamHandler downstream_;
};

GatekeeperApp::GatekeeperApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM),
      downstream_(DefaultDownstream) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<const LocaleRegistry>(config.supported_locales, config.default_locale);

  GatekeeperOptions options;
  options.production = config.IsProduction();
  options.cookie_max_age_seconds = config.locale_cookie_max_age_seconds;
  gatekeeper_ = std::make_shared<const Gatekeeper>(registry_, options, observability_);

  RateLimiterConfig limiter_config;
  limiter_config.max_attempts = config.login_rate_limit_max;
  limiter_config.window = std::chrono::seconds(config.login_rate_window_seconds);
  limiter_config.capacity = config.login_rate_capacity;
  rate_limiter_ = std::make_shared<LoginRateLimiter>(limiter_config, observability_);
}

GatekeeperApp::~GatekeeperApp() { Stop(); }

void GatekeeperApp::SetDownstream(DownstreamHandler downstream) {
  downstream_ = downstream ? std::move(downstream) : DownstreamHandler(DefaultDownstream);
}

void GatekeeperApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, gatekeeper_, rate_limiter_, observability_,
                                           downstream_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->LogEvent(LogLevel::kInfo, "shutdown_signal", {{"signal", signal_number}});
      work_guard_.reset();
      if (listener_) {
        listener_->Stop();
      }
      ioc_.stop();
    });
    observability_->LogEvent(LogLevel::kInfo, "server_started",
                             {{"port", config_.port}, {"environment", config_.environment}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->LogEvent(LogLevel::kError, "server_failure", {{"error", ex.what()}});
  }
}

void GatekeeperApp::RunWorkers() {
  const unsigned int thread_count =
      config_.threads > 0 ? static_cast<unsigned int>(config_.threads) : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void GatekeeperApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

}  // namespace gatekeeper
