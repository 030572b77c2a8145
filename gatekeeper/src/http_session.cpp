/*
 * 설명: HTTP 요청을 게이트키퍼 결정에 따라 리다이렉트, 정적 자산 통과, 다운스트림 응답으로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#include "gatekeeper/http_session.hpp"

#include <utility>
#include <vector>

#include <openssl/crypto.h>

#include "gatekeeper/api_response.hpp"

namespace gatekeeper {

namespace {
constexpr char kServerName[] = "edge-gatekeeper";
constexpr char kJsonContentType[] = "application/json; charset=utf-8";

bool TokenMatches(const std::string& expected, const std::string& provided) {
  if (expected.empty() || expected.size() != provided.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), provided.data(), expected.size()) == 0;
}

DownstreamResult JsonResult(int status, const nlohmann::json& envelope) {
  DownstreamResult result;
  result.status = status;
  result.content_type = kJsonContentType;
  result.body = envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return result;
}
}  // namespace

DownstreamResult DefaultDownstream(const RequestDescriptor& req, const std::string& locale) {
  nlohmann::json data{{"path", req.path}};
  data["locale"] = locale.empty() ? nlohmann::json(nullptr) : nlohmann::json(locale);
  return JsonResult(200, MakeSuccessEnvelope(data));
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const Gatekeeper> gatekeeper,
                         std::shared_ptr<LoginRateLimiter> rate_limiter,
                         std::shared_ptr<Observability> observability,
                         DownstreamHandler downstream)
    : stream_(std::move(socket)), config_(config), gatekeeper_(std::move(gatekeeper)),
      rate_limiter_(std::move(rate_limiter)), observability_(std::move(observability)),
      downstream_(std::move(downstream)) {
  if (!downstream_) {
    downstream_ = DefaultDownstream;
  }
}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::vector<std::pair<std::string, std::string>> headers;
  for (const auto& field : req_.base()) {
    headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
  }
  auto descriptor = MakeRequestDescriptor(std::string(req_.method_string()), std::string(req_.target()), headers);
  auto decision = gatekeeper_->Process(descriptor, trace_id_);

  auto res = std::make_shared<Response>();
  res->version(req_.version());

  if (decision.action == GateAction::kStaticBypass) {
    // 정적 자산은 게이트키퍼 헤더 없이 그대로 통과한다.
    auto result = downstream_(descriptor, std::string{});
    res->result(static_cast<unsigned>(result.status));
    res->set(http::field::content_type, result.content_type);
    res->body() = std::move(result.body);
    res->prepare_payload();
    return SendResponse(res);
  }

  res->set(http::field::server, kServerName);
  if (decision.action == GateAction::kRedirect) {
    res->result(static_cast<unsigned>(decision.response.status));
    res->content_length(0);
  } else {
    auto result = Route(descriptor, decision.locale);
    res->result(static_cast<unsigned>(result.status));
    res->set(http::field::content_type, result.content_type);
    res->body() = std::move(result.body);
    res->prepare_payload();
  }
  for (const auto& [name, value] : decision.response.headers) {
    res->insert(name, value);
  }
  SendResponse(res);
}

DownstreamResult HttpSession::Route(const RequestDescriptor& descriptor, const std::string& locale) {
  if (descriptor.method == "GET" && descriptor.path == "/api/gatekeeper/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return JsonResult(200, MakeSuccessEnvelope(payload));
  }
  if (descriptor.method == "GET" && descriptor.path == "/api/gatekeeper/metrics") {
    return MetricsResult(descriptor);
  }
  return downstream_(descriptor, locale);
}

DownstreamResult HttpSession::MetricsResult(const RequestDescriptor& descriptor) {
  auto provided = descriptor.Header("X-Ops-Token");
  if (!provided || !TokenMatches(config_.ops_token, *provided)) {
    return JsonResult(401, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
  }
  auto snapshot = observability_->Snapshot();
  nlohmann::json data{
      {"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
      {"gate",
       {{"redirects", snapshot.redirects},
        {"authErrorRedirects", snapshot.auth_error_redirects},
        {"rejectedCandidates", snapshot.rejected_candidates},
        {"staticBypass", snapshot.static_bypass}}},
      {"rateLimiter",
       {{"trackedKeys", rate_limiter_->TrackedKeys()},
        {"denied", snapshot.rate_limit_denied},
        {"storeErrors", snapshot.rate_limit_store_errors},
        {"maxAttempts", rate_limiter_->GetConfig().max_attempts},
        {"windowSeconds", rate_limiter_->GetConfig().window.count()}}}};
  return JsonResult(200, MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, "http_request", std::string(req_.target()),
                                   static_cast<int>(res->result_int()), static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace gatekeeper
