/*
 * 설명: 게이트키퍼 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/config_test.cpp, gatekeeper/tests/e2e/gatekeeper_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatekeeper {

struct AppConfig {
  unsigned short port{8080};
  std::size_t threads{0};
  std::string log_level{"info"};
  std::string environment{"development"};
  std::vector<std::string> supported_locales{"en", "es", "fr", "it", "de"};
  std::string default_locale{"en"};
  std::size_t login_rate_limit_max{10};
  std::size_t login_rate_window_seconds{60};
  std::size_t login_rate_capacity{1000};
  std::int64_t locale_cookie_max_age_seconds{63072000};
  std::string ops_token;

  bool IsProduction() const { return environment == "production"; }
};

// 잘못된 숫자, 빈 로케일 목록, 목록에 없는 기본 로케일이면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

std::vector<std::string> ParseLocaleList(std::string_view text);

}  // namespace gatekeeper
