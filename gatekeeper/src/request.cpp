/*
 * 설명: 요청 타깃, 쿼리, 쿠키 파싱과 응답 헤더 조작을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/request_test.cpp
 */
#include "gatekeeper/request.hpp"

#include <algorithm>

#include "gatekeeper/url_codec.hpp"

namespace gatekeeper {

namespace {
char LowerAscii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string_view TrimSpaces(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}
}  // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
  return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                      [](char a, char b) { return LowerAscii(a) < LowerAscii(b); });
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (LowerAscii(lhs[i]) != LowerAscii(rhs[i])) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> RequestDescriptor::Header(const std::string& name) const {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> RequestDescriptor::Cookie(const std::string& name) const {
  auto it = cookies.find(name);
  if (it == cookies.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> RequestDescriptor::QueryParam(const std::string& name) const {
  auto it = query_params.find(name);
  if (it == query_params.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ResponseDescriptor::AddHeader(const std::string& name, const std::string& value) {
  headers.emplace_back(name, value);
}

void ResponseDescriptor::SetHeader(const std::string& name, const std::string& value) {
  headers.erase(std::remove_if(headers.begin(), headers.end(),
                               [&](const auto& entry) { return EqualsIgnoreCase(entry.first, name); }),
                headers.end());
  headers.emplace_back(name, value);
}

std::vector<std::string> ResponseDescriptor::HeaderValues(const std::string& name) const {
  std::vector<std::string> values;
  for (const auto& entry : headers) {
    if (EqualsIgnoreCase(entry.first, name)) {
      values.push_back(entry.second);
    }
  }
  return values;
}

std::optional<std::string> ResponseDescriptor::FirstHeader(const std::string& name) const {
  for (const auto& entry : headers) {
    if (EqualsIgnoreCase(entry.first, name)) {
      return entry.second;
    }
  }
  return std::nullopt;
}

std::map<std::string, std::string> ParseQueryParams(std::string_view query) {
  std::map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos <= query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = FormDecode(pair.substr(0, eq));
      auto value = eq == std::string_view::npos ? std::string{} : FormDecode(pair.substr(eq + 1));
      // 같은 키가 반복되면 첫 번째 값을 사용한다.
      params.emplace(std::move(key), std::move(value));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::map<std::string, std::string> ParseCookieHeader(std::string_view header_value) {
  std::map<std::string, std::string> cookies;
  std::size_t pos = 0;
  while (pos <= header_value.size()) {
    auto semi = header_value.find(';', pos);
    auto pair = TrimSpaces(
        header_value.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && eq > 0) {
      auto name = TrimSpaces(pair.substr(0, eq));
      auto value = TrimSpaces(pair.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      cookies.emplace(std::string(name), std::string(value));
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return cookies;
}

RequestDescriptor MakeRequestDescriptor(std::string method, std::string_view target,
                                        const std::vector<std::pair<std::string, std::string>>& headers) {
  RequestDescriptor req;
  req.method = std::move(method);

  auto hash = target.find('#');
  if (hash != std::string_view::npos) {
    req.fragment = std::string(target.substr(hash + 1));
    target = target.substr(0, hash);
  }
  auto qpos = target.find('?');
  if (qpos != std::string_view::npos) {
    req.query = std::string(target.substr(qpos + 1));
    target = target.substr(0, qpos);
  }
  req.path = target.empty() ? std::string{"/"} : std::string(target);
  req.query_params = ParseQueryParams(req.query);

  std::string cookie_header;
  for (const auto& [name, value] : headers) {
    if (EqualsIgnoreCase(name, "Cookie")) {
      if (!cookie_header.empty()) {
        cookie_header += "; ";
      }
      cookie_header += value;
      continue;
    }
    auto it = req.headers.find(name);
    if (it == req.headers.end()) {
      req.headers.emplace(name, value);
    } else {
      it->second += ", " + value;
    }
  }
  if (!cookie_header.empty()) {
    req.headers.emplace("Cookie", cookie_header);
    req.cookies = ParseCookieHeader(cookie_header);
  }
  return req;
}

}  // namespace gatekeeper
