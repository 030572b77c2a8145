/*
 * 설명: 게이트키퍼 서버 전체 수명주기(리스너, 워커 스레드, 공유 서비스)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "gatekeeper/config.hpp"
#include "gatekeeper/gatekeeper.hpp"
#include "gatekeeper/http_session.hpp"
#include "gatekeeper/locale_registry.hpp"
#include "gatekeeper/observability.hpp"
#include "gatekeeper/rate_limiter.hpp"

namespace gatekeeper {

class Listener;

class GatekeeperApp {
 public:
  explicit GatekeeperApp(const AppConfig& config);
  ~GatekeeperApp();

  // Run() 이전에만 호출한다.
  void SetDownstream(DownstreamHandler downstream);

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<const Gatekeeper> GetGatekeeper() const { return gatekeeper_; }
  std::shared_ptr<LoginRateLimiter> GetLoginRateLimiter() { return rate_limiter_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<const LocaleRegistry> registry_;
  std::shared_ptr<const Gatekeeper> gatekeeper_;
  std::shared_ptr<LoginRateLimiter> rate_limiter_;
  DownstreamHandler downstream_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace gatekeeper
