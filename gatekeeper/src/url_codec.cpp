/*
 * 설명: URL 퍼센트 인코딩/디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/sanitizer_test.cpp
 */
#include "gatekeeper/url_codec.hpp"

namespace gatekeeper {

namespace {
constexpr char kHexUpper[] = "0123456789ABCDEF";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

void AppendEscaped(std::string& out, unsigned char c) {
  out.push_back('%');
  out.push_back(kHexUpper[c >> 4]);
  out.push_back(kHexUpper[c & 0x0F]);
}

std::string Decode(std::string_view raw, bool plus_as_space) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '%' && i + 2 < raw.size() && IsHexDigit(raw[i + 1]) && IsHexDigit(raw[i + 2])) {
      out.push_back(static_cast<char>(HexValue(raw[i + 1]) * 16 + HexValue(raw[i + 2])));
      i += 2;
    } else if (plus_as_space && c == '+') {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}
}  // namespace

bool IsHexDigit(char c) { return HexValue(c) >= 0; }

std::string PercentDecodeOnce(std::string_view raw) { return Decode(raw, false); }

std::string FormDecode(std::string_view raw) { return Decode(raw, true); }

std::string UrlEncodeComponent(std::string_view value) {
  std::string out;
  out.reserve(value.size() * 3);
  for (char ch : value) {
    auto c = static_cast<unsigned char>(ch);
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                      c == '_' || c == '~';
    if (unreserved) {
      out.push_back(ch);
    } else {
      AppendEscaped(out, c);
    }
  }
  return out;
}

std::string EncodePathSegment(std::string_view segment) {
  std::string out;
  out.reserve(segment.size() * 3);
  for (char ch : segment) {
    auto c = static_cast<unsigned char>(ch);
    bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    switch (c) {
      case '-': case '_': case '.': case '~': case '!': case '$': case '&': case '(':
      case ')': case '*': case '+': case ',': case ';': case '=': case ':': case '@':
        allowed = true;
        break;
      default:
        break;
    }
    if (allowed) {
      out.push_back(ch);
    } else {
      AppendEscaped(out, c);
    }
  }
  return out;
}

}  // namespace gatekeeper
