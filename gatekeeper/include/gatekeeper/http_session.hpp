/*
 * 설명: HTTP 연결을 처리하고 모든 요청을 게이트키퍼 파이프라인에 통과시킨 뒤 리다이렉트 또는 다운스트림 응답을 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "gatekeeper/config.hpp"
#include "gatekeeper/gatekeeper.hpp"
#include "gatekeeper/observability.hpp"
#include "gatekeeper/rate_limiter.hpp"
#include "gatekeeper/request.hpp"

namespace gatekeeper {

// 통과된 요청의 본문을 만드는 외부 라우터/페이지 핸들러 자리
struct DownstreamResult {
  int status{200};
  std::string content_type{"application/json; charset=utf-8"};
  std::string body;
};

using DownstreamHandler = std::function<DownstreamResult(const RequestDescriptor&, const std::string& locale)>;

DownstreamResult DefaultDownstream(const RequestDescriptor& req, const std::string& locale);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const Gatekeeper> gatekeeper,
              std::shared_ptr<LoginRateLimiter> rate_limiter,
              std::shared_ptr<Observability> observability,
              DownstreamHandler downstream);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  DownstreamResult Route(const RequestDescriptor& descriptor, const std::string& locale);
  DownstreamResult MetricsResult(const RequestDescriptor& descriptor);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<const Gatekeeper> gatekeeper_;
  std::shared_ptr<LoginRateLimiter> rate_limiter_;
  std::shared_ptr<Observability> observability_;
  DownstreamHandler downstream_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace gatekeeper
