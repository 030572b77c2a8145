/*
 * 설명: URL 퍼센트 인코딩/디코딩 유틸리티를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/sanitizer_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace gatekeeper {

// 한 번만 디코딩한다. 잘못된 %XX 시퀀스는 그대로 둔다.
std::string PercentDecodeOnce(std::string_view raw);

// application/x-www-form-urlencoded 값 디코딩 ('+' -> 공백 포함)
std::string FormDecode(std::string_view raw);

// 영숫자와 '-', '_', '~' 외에는 모두 %XX로 인코딩한다. '.' 도 인코딩된다.
std::string UrlEncodeComponent(std::string_view value);

// 경로 세그먼트용 인코딩. '/'와 위험 문자는 인코딩하고 안전한 sub-delims는 유지한다.
std::string EncodePathSegment(std::string_view segment);

bool IsHexDigit(char c);

}  // namespace gatekeeper
