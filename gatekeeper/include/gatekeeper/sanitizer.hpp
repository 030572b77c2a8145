/*
 * 설명: 응답 헤더(Location, Set-Cookie)나 로케일 후보로 쓰일 신뢰할 수 없는 문자열을 검사한다.
 *       경로 순회, 마크업 주입, 제어 문자를 포함한 입력은 조용히 거부된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/sanitizer_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gatekeeper {

class LocaleRegistry;

struct SanitizationVerdict {
  std::string cleaned;
  bool was_modified{false};
  bool rejected{false};

  bool accepted() const { return !rejected; }
};

constexpr std::size_t kMaxLocaleCandidateLength = 10;

// "..", '<', '>', '"', '\'', '\\', NUL, 기타 제어 문자 중 하나라도 있으면 true
bool ContainsHostileMarker(std::string_view text);

// 한 번 퍼센트 디코딩한 값과 원문 모두를 검사한다. 예외를 던지지 않고 항상 판정을 돌려준다.
SanitizationVerdict SanitizeLocaleCandidate(std::string_view raw);

// 한 번 디코딩했을 때 "." 또는 ".."인 세그먼트가 하나라도 있으면 true
bool HasDotSegment(std::string_view raw_path);

// "."/".." 세그먼트만 해석한 실제 경로. 나머지 세그먼트는 원문 그대로 두며 결과는 항상 '/'로 시작한다.
std::string NormalizeDotSegments(std::string_view raw_path);

// 리다이렉트 대상 경로를 정규화한다. 결과는 "" 또는 '/'로 시작하는 재인코딩된 경로다.
std::string CleanRedirectPath(std::string_view raw_path, const LocaleRegistry& registry);

// Location 값에 넣을 쿼리/프래그먼트를 이스케이프한다. 이미 인코딩된 %XX 는 유지한다.
std::string EscapeForLocation(std::string_view raw);

}  // namespace gatekeeper
