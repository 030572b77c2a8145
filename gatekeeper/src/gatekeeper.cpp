/*
 * 설명: 게이트키퍼 파이프라인 오케스트레이션을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/gatekeeper_test.cpp, gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#include "gatekeeper/gatekeeper.hpp"

#include <array>

#include "gatekeeper/sanitizer.hpp"

namespace gatekeeper {

namespace {
constexpr std::array<std::string_view, 4> kStaticPrefixes = {"/_next/", "/favicon.ico", "/robots.txt",
                                                             "/sitemap.xml"};
constexpr std::array<std::string_view, 15> kStaticExtensions = {
    "jpg", "jpeg", "png", "gif", "svg", "ico", "webp", "css", "js", "woff", "woff2", "ttf", "otf", "txt", "map"};

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}
}  // namespace

Gatekeeper::Gatekeeper(std::shared_ptr<const LocaleRegistry> registry, const GatekeeperOptions& options,
                       std::shared_ptr<Observability> observability)
    : registry_(registry),
      options_(options),
      observability_(std::move(observability)),
      resolver_(registry),
      detector_(LocaleResolver(registry)),
      decorator_(options.cookie_max_age_seconds) {}

bool Gatekeeper::IsStaticAsset(std::string_view path) {
  for (auto prefix : kStaticPrefixes) {
    if (StartsWith(path, prefix)) {
      return true;
    }
  }
  auto slash = path.rfind('/');
  auto last = slash == std::string_view::npos ? path : path.substr(slash + 1);
  auto dot = last.rfind('.');
  if (dot == std::string_view::npos || dot + 1 >= last.size()) {
    return false;
  }
  auto ext = last.substr(dot + 1);
  for (auto candidate : kStaticExtensions) {
    if (EqualsIgnoreCase(ext, candidate)) {
      return true;
    }
  }
  return false;
}

bool Gatekeeper::IsApiPath(std::string_view path) { return path == "/api" || StartsWith(path, "/api/"); }

GateDecision Gatekeeper::Process(const RequestDescriptor& req, const std::string& trace_id) const {
  try {
    return Evaluate(req, trace_id);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementError();
      observability_->LogEvent(LogLevel::kError, "gatekeeper_fault", {{"reason", ex.what()}}, trace_id);
    }
  }
  return Fallback(req);
}

GateDecision Gatekeeper::Evaluate(const RequestDescriptor& req, const std::string& trace_id) const {
  if (IsStaticAsset(req.path)) {
    if (observability_) {
      observability_->IncrementStaticBypass();
    }
    GateDecision decision;
    decision.action = GateAction::kStaticBypass;
    return decision;
  }

  // 인증 오류는 일반 로케일 리다이렉트보다 우선한다.
  if (auto auth = detector_.Detect(req)) {
    if (observability_) {
      observability_->IncrementAuthErrorRedirect();
      observability_->LogEvent(LogLevel::kInfo, "auth_error_redirect",
                               {{"error", auth->error}, {"locale", auth->locale}, {"path", auth->path}}, trace_id);
    }
    return Redirect(req, auth->target, auth->locale);
  }

  auto resolution = resolver_.Resolve(req);
  ReportResolution(resolution, trace_id);

  // "/en/../admin"처럼 점 세그먼트가 있으면 로케일 경로라도 정규화된 경로로 보낸다.
  bool localized = resolution.source == LocaleSource::kPath && !HasDotSegment(req.path);
  if (!localized && !IsApiPath(NormalizeDotSegments(req.path))) {
    auto locale = resolution.locale;
    auto clean_path = CleanRedirectPath(req.path, *registry_);
    std::string target;
    if (auto normalized_locale = resolver_.PathLocale(clean_path)) {
      // 정규화 후 이미 유효한 로케일로 시작하면 다시 접두사를 붙이지 않는다.
      locale = *normalized_locale;
      target = clean_path;
    } else {
      target = "/" + locale + clean_path;
    }
    if (!req.query.empty()) {
      target += "?" + EscapeForLocation(req.query);
    }
    if (!req.fragment.empty()) {
      target += "#" + EscapeForLocation(req.fragment);
    }
    return Redirect(req, target, locale);
  }

  GateDecision decision;
  decision.action = GateAction::kPassThrough;
  decision.locale = resolution.locale;
  decision.response.status = 200;
  decorator_.Decorate(decision.response, req, decision.locale);
  return decision;
}

GateDecision Gatekeeper::Redirect(const RequestDescriptor& req, const std::string& target,
                                  const std::string& locale) const {
  if (observability_) {
    observability_->IncrementRedirect();
  }
  GateDecision decision;
  decision.action = GateAction::kRedirect;
  decision.locale = locale;
  decision.response.status = 307;
  decision.response.redirect_to = target;
  decision.response.SetHeader("Location", target);
  decorator_.Decorate(decision.response, req, locale);
  return decision;
}

GateDecision Gatekeeper::Fallback(const RequestDescriptor& req) const {
  try {
    GateDecision decision;
    decision.action = GateAction::kPassThrough;
    decision.locale = registry_->DefaultLocale();
    decorator_.Decorate(decision.response, req, decision.locale);
    return decision;
  } catch (const std::exception&) {
    // 메모리 부족 등으로 장식조차 실패하면 헤더 없는 통과 결정을 돌려준다.
    return GateDecision{};
  }
}

void Gatekeeper::ReportResolution(const LocaleResolution& resolution, const std::string& trace_id) const {
  if (!observability_) {
    return;
  }
  for (auto source : resolution.rejected_sources) {
    observability_->IncrementRejectedCandidate();
    if (options_.production) {
      // 로그 주입을 막기 위해 원문 값은 남기지 않는다.
      observability_->LogEvent(LogLevel::kWarn, "locale_candidate_rejected", {{"source", std::string(ToString(source))}},
                               trace_id);
    }
  }
  if (options_.production && resolution.invalid_path_locale) {
    observability_->LogEvent(LogLevel::kWarn, "invalid_path_locale", {{"source", "path"}}, trace_id);
  }
}

}  // namespace gatekeeper
