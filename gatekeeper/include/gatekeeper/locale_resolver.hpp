/*
 * 설명: 경로 세그먼트 -> 쿠키 -> Accept-Language -> 기본값 순서로 로케일을 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/locale_resolver_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gatekeeper/locale_registry.hpp"
#include "gatekeeper/request.hpp"

namespace gatekeeper {

enum class LocaleSource { kPath, kCookie, kHeader, kDefault };

std::string_view ToString(LocaleSource source);

struct LocaleResolution {
  std::string locale;
  LocaleSource source{LocaleSource::kDefault};
  // 새니타이저가 거부한 후보의 출처. 값 자체는 보관하지 않는다.
  std::vector<LocaleSource> rejected_sources;
  // 경로 첫 세그먼트가 두 글자 로케일 형태였지만 허용 목록에 없던 경우
  bool invalid_path_locale{false};
};

constexpr std::size_t kMaxAcceptLanguageLength = 1024;
constexpr std::size_t kMaxAcceptLanguageTags = 32;
constexpr char kLocaleCookieName[] = "locale";

// q 값 내림차순(동순위는 원래 순서)으로 기본 서브태그 목록을 돌려준다.
// 형식이 잘못된 헤더나 너무 긴 헤더는 빈 목록으로 취급한다.
std::vector<std::string> ParseAcceptLanguage(std::string_view header);

class LocaleResolver {
 public:
  explicit LocaleResolver(std::shared_ptr<const LocaleRegistry> registry);

  // 항상 허용 목록에 있는 로케일을 돌려주며 같은 입력에 대해 결정적이다.
  // 경로 세그먼트는 "."/".."를 해석한 실제 경로에서 읽는다.
  LocaleResolution Resolve(const RequestDescriptor& req) const;

  // 경로가 "/{locale}" 또는 "/{locale}/..." 형태이고 locale이 유효하면 그 값을 돌려준다.
  std::optional<std::string> PathLocale(std::string_view path) const;

  const LocaleRegistry& Registry() const { return *registry_; }

 private:
  std::optional<std::string> Accept(std::string_view candidate, LocaleSource source,
                                    LocaleResolution& resolution) const;

  std::shared_ptr<const LocaleRegistry> registry_;
};

}  // namespace gatekeeper
