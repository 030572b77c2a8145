/*
 * 설명: 모든 수신 요청에 고정 순서의 검사(정적 자산 우회 -> 인증 오류 -> 로케일 결정 -> 응답 장식)를 적용한다.
 *       요청 단위로 순수하며 공유 가변 상태가 없다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/gatekeeper_test.cpp, gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "gatekeeper/auth_error.hpp"
#include "gatekeeper/locale_registry.hpp"
#include "gatekeeper/locale_resolver.hpp"
#include "gatekeeper/observability.hpp"
#include "gatekeeper/request.hpp"
#include "gatekeeper/response_decorator.hpp"

namespace gatekeeper {

struct GatekeeperOptions {
  // production이면 잘못된 로케일 시도를 보안 이벤트로 기록한다.
  bool production{false};
  std::int64_t cookie_max_age_seconds{kDefaultLocaleCookieMaxAgeSeconds};
};

enum class GateAction { kStaticBypass, kRedirect, kPassThrough };

struct GateDecision {
  GateAction action{GateAction::kPassThrough};
  ResponseDescriptor response;
  std::string locale;
};

class Gatekeeper {
 public:
  Gatekeeper(std::shared_ptr<const LocaleRegistry> registry, const GatekeeperOptions& options,
             std::shared_ptr<Observability> observability = nullptr);

  // 어떤 입력에도 예외를 던지지 않고 올바른 형태의 결정을 돌려준다.
  GateDecision Process(const RequestDescriptor& req, const std::string& trace_id = std::string{}) const;

  static bool IsStaticAsset(std::string_view path);
  static bool IsApiPath(std::string_view path);

  const LocaleResolver& Resolver() const { return resolver_; }
  const LocaleRegistry& Registry() const { return *registry_; }

 private:
  GateDecision Evaluate(const RequestDescriptor& req, const std::string& trace_id) const;
  GateDecision Redirect(const RequestDescriptor& req, const std::string& target, const std::string& locale) const;
  GateDecision Fallback(const RequestDescriptor& req) const;
  void ReportResolution(const LocaleResolution& resolution, const std::string& trace_id) const;

  std::shared_ptr<const LocaleRegistry> registry_;
  GatekeeperOptions options_;
  std::shared_ptr<Observability> observability_;
  LocaleResolver resolver_;
  AuthErrorDetector detector_;
  ResponseDecorator decorator_;
};

}  // namespace gatekeeper
