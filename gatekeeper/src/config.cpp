/*
 * 설명: 환경 변수에서 게이트키퍼 설정을 읽고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/config_test.cpp
 */
#include "gatekeeper/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace gatekeeper {

namespace {
std::string GetEnv(const char* key, const std::string& def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : def;
}

std::uint64_t ParseUnsigned(const char* key, const std::string& value, std::uint64_t min, std::uint64_t max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || value.front() == '-' || parsed < min || parsed > max) {
    throw std::invalid_argument(std::string(key) + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return parsed;
}
}  // namespace

std::vector<std::string> ParseLocaleList(std::string_view text) {
  std::vector<std::string> locales;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto comma = text.find(',', pos);
    auto item = text.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (!item.empty() && std::find(locales.begin(), locales.end(), item) == locales.end()) {
      locales.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }
  return locales;
}

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseUnsigned("SERVER_PORT", GetEnv("SERVER_PORT", "8080"), 1, 65535));
  cfg.threads = static_cast<std::size_t>(ParseUnsigned("SERVER_THREADS", GetEnv("SERVER_THREADS", "0"), 0, 256));
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.environment = GetEnv("APP_ENV", "development");
  cfg.supported_locales = ParseLocaleList(GetEnv("SUPPORTED_LOCALES", "en,es,fr,it,de"));
  cfg.default_locale = GetEnv("DEFAULT_LOCALE", "en");
  cfg.login_rate_limit_max =
      static_cast<std::size_t>(ParseUnsigned("AUTH_RATE_LIMIT", GetEnv("AUTH_RATE_LIMIT", "10"), 1, 1000000));
  cfg.login_rate_window_seconds = static_cast<std::size_t>(
      ParseUnsigned("AUTH_RATE_LIMIT_WINDOW", GetEnv("AUTH_RATE_LIMIT_WINDOW", "60"), 1, 86400));
  cfg.login_rate_capacity = static_cast<std::size_t>(
      ParseUnsigned("AUTH_RATE_LIMIT_CAPACITY", GetEnv("AUTH_RATE_LIMIT_CAPACITY", "1000"), 1, 10000000));
  cfg.locale_cookie_max_age_seconds = static_cast<std::int64_t>(
      ParseUnsigned("LOCALE_COOKIE_MAX_AGE", GetEnv("LOCALE_COOKIE_MAX_AGE", "63072000"), 0, 315360000));
  cfg.ops_token = GetEnv("OPS_TOKEN", "");

  if (cfg.supported_locales.empty()) {
    throw std::invalid_argument("SUPPORTED_LOCALES가 비어 있습니다");
  }
  if (std::find(cfg.supported_locales.begin(), cfg.supported_locales.end(), cfg.default_locale) ==
      cfg.supported_locales.end()) {
    throw std::invalid_argument("DEFAULT_LOCALE이 SUPPORTED_LOCALES에 없습니다: " + cfg.default_locale);
  }
  return cfg;
}

}  // namespace gatekeeper
