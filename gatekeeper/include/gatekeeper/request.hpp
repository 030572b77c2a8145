/*
 * 설명: 게이트키퍼 파이프라인이 다루는 요청/응답 기술자를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/request_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gatekeeper {

struct CaseInsensitiveLess {
  bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// 파이프라인 한 번의 처리 동안 변경되지 않는다.
struct RequestDescriptor {
  std::string method{"GET"};
  std::string path{"/"};
  std::string query;
  std::string fragment;
  std::map<std::string, std::string> query_params;
  HeaderMap headers;
  std::map<std::string, std::string> cookies;

  std::optional<std::string> Header(const std::string& name) const;
  std::optional<std::string> Cookie(const std::string& name) const;
  std::optional<std::string> QueryParam(const std::string& name) const;
};

struct ResponseDescriptor {
  int status{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::optional<std::string> redirect_to;

  void AddHeader(const std::string& name, const std::string& value);
  void SetHeader(const std::string& name, const std::string& value);
  std::vector<std::string> HeaderValues(const std::string& name) const;
  std::optional<std::string> FirstHeader(const std::string& name) const;
};

// 요청 타깃("/path?query#fragment")과 헤더 목록으로 기술자를 만든다.
RequestDescriptor MakeRequestDescriptor(std::string method, std::string_view target,
                                        const std::vector<std::pair<std::string, std::string>>& headers);

std::map<std::string, std::string> ParseQueryParams(std::string_view query);
std::map<std::string, std::string> ParseCookieHeader(std::string_view header_value);

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

}  // namespace gatekeeper
