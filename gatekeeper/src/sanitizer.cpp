/*
 * 설명: 로케일 후보 검사, 리다이렉트 경로 정규화, Location 이스케이프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/sanitizer_test.cpp
 */
#include "gatekeeper/sanitizer.hpp"

#include <vector>

#include "gatekeeper/locale_registry.hpp"
#include "gatekeeper/url_codec.hpp"

namespace gatekeeper {

namespace {
constexpr char kHexUpper[] = "0123456789ABCDEF";

bool IsControl(unsigned char c) { return c < 0x20 || c == 0x7F; }

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> parts;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto part = path.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos);
    if (!part.empty()) {
      parts.push_back(part);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pos = slash + 1;
  }
  return parts;
}

enum class DotSegment { kNone, kCurrent, kParent };

DotSegment ClassifyDotSegment(std::string_view decoded) {
  if (decoded == ".") {
    return DotSegment::kCurrent;
  }
  if (decoded == "..") {
    return DotSegment::kParent;
  }
  return DotSegment::kNone;
}

// 두 글자이지만 허용되지 않은 로케일은 잘못된 로케일 시도로 본다.
bool LooksLikeFailedLocale(const std::string& segment, const LocaleRegistry& registry) {
  return segment.size() == 2 && !registry.IsValid(segment);
}
}  // namespace

bool ContainsHostileMarker(std::string_view text) {
  if (text.find("..") != std::string_view::npos) {
    return true;
  }
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if (c == '<' || c == '>' || c == '"' || c == '\'' || c == '\\' || IsControl(c)) {
      return true;
    }
  }
  return false;
}

SanitizationVerdict SanitizeLocaleCandidate(std::string_view raw) {
  SanitizationVerdict verdict;
  if (raw.empty() || raw.size() > kMaxLocaleCandidateLength) {
    verdict.rejected = true;
    return verdict;
  }
  auto decoded = PercentDecodeOnce(raw);
  if (ContainsHostileMarker(raw) || ContainsHostileMarker(decoded)) {
    verdict.rejected = true;
    return verdict;
  }
  verdict.cleaned = std::string(raw);
  return verdict;
}

bool HasDotSegment(std::string_view raw_path) {
  for (auto part : SplitPath(raw_path)) {
    if (ClassifyDotSegment(PercentDecodeOnce(part)) != DotSegment::kNone) {
      return true;
    }
  }
  return false;
}

std::string NormalizeDotSegments(std::string_view raw_path) {
  std::vector<std::string_view> segments;
  for (auto part : SplitPath(raw_path)) {
    auto kind = ClassifyDotSegment(PercentDecodeOnce(part));
    if (kind == DotSegment::kCurrent) {
      continue;
    }
    if (kind == DotSegment::kParent) {
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    segments.push_back(part);
  }

  std::string normalized;
  for (auto segment : segments) {
    normalized.push_back('/');
    normalized.append(segment.data(), segment.size());
  }
  if (normalized.empty()) {
    return "/";
  }
  if (raw_path.back() == '/') {
    normalized.push_back('/');
  }
  return normalized;
}

std::string CleanRedirectPath(std::string_view raw_path, const LocaleRegistry& registry) {
  std::vector<std::string> segments;
  auto parts = SplitPath(raw_path);
  for (auto part : parts) {
    auto decoded = PercentDecodeOnce(part);
    auto kind = ClassifyDotSegment(decoded);
    if (kind == DotSegment::kCurrent) {
      continue;
    }
    if (kind == DotSegment::kParent) {
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    if (ContainsHostileMarker(part) || ContainsHostileMarker(decoded)) {
      continue;
    }
    segments.push_back(std::move(decoded));
  }

  if (segments.size() > 1 && LooksLikeFailedLocale(segments.front(), registry)) {
    segments.erase(segments.begin());
  }
  if (segments.empty()) {
    return {};
  }

  std::string cleaned;
  for (const auto& segment : segments) {
    cleaned.push_back('/');
    cleaned += EncodePathSegment(segment);
  }
  if (!raw_path.empty() && raw_path.back() == '/') {
    cleaned.push_back('/');
  }
  return cleaned;
}

std::string EscapeForLocation(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  char previous = '\0';
  for (char ch : raw) {
    auto c = static_cast<unsigned char>(ch);
    bool escape = c == '<' || c == '>' || c == '"' || c == '\'' || c == '\\' || c == ' ' || c == '#' ||
                  IsControl(c) || c >= 0x80 || (c == '.' && previous == '.');
    if (escape) {
      out.push_back('%');
      out.push_back(kHexUpper[c >> 4]);
      out.push_back(kHexUpper[c & 0x0F]);
    } else {
      out.push_back(ch);
    }
    previous = ch;
  }
  return out;
}

}  // namespace gatekeeper
