/*
 * 설명: 다중 출처 로케일 결정 정책과 Accept-Language 파싱을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gatekeeper/tests/unit/locale_resolver_test.cpp
 */
#include "gatekeeper/locale_resolver.hpp"

#include <algorithm>

#include "gatekeeper/sanitizer.hpp"
#include "gatekeeper/url_codec.hpp"

namespace gatekeeper {

namespace {
std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

// RFC 9110 qvalue: 0(.ddd) 또는 1(.000), 천분율 정수로 돌려준다.
std::optional<int> ParseQuality(std::string_view text) {
  if (text.empty() || text.size() > 5) {
    return std::nullopt;
  }
  if (text[0] != '0' && text[0] != '1') {
    return std::nullopt;
  }
  int value = (text[0] - '0') * 1000;
  if (text.size() == 1) {
    return value;
  }
  if (text[1] != '.') {
    return std::nullopt;
  }
  int scale = 100;
  for (std::size_t i = 2; i < text.size(); ++i) {
    char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value += (c - '0') * scale;
    scale /= 10;
  }
  if (value > 1000) {
    return std::nullopt;
  }
  return value;
}

struct WeightedTag {
  std::string primary;
  int quality;
};
}  // namespace

std::string_view ToString(LocaleSource source) {
  switch (source) {
    case LocaleSource::kPath:
      return "path";
    case LocaleSource::kCookie:
      return "cookie";
    case LocaleSource::kHeader:
      return "header";
    case LocaleSource::kDefault:
      return "default";
  }
  return "default";
}

std::vector<std::string> ParseAcceptLanguage(std::string_view header) {
  std::vector<std::string> primaries;
  if (header.size() > kMaxAcceptLanguageLength) {
    return primaries;
  }

  std::vector<WeightedTag> tags;
  std::size_t pos = 0;
  while (pos <= header.size() && tags.size() < kMaxAcceptLanguageTags) {
    auto comma = header.find(',', pos);
    auto item = Trim(header.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
    if (!item.empty()) {
      auto semi = item.find(';');
      auto range = Trim(item.substr(0, semi));
      int quality = 1000;
      bool valid = true;
      if (semi != std::string_view::npos) {
        auto param = Trim(item.substr(semi + 1));
        if (param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
          auto parsed = ParseQuality(Trim(param.substr(2)));
          if (parsed) {
            quality = *parsed;
          } else {
            valid = false;
          }
        }
      }
      auto dash = range.find('-');
      auto primary = range.substr(0, dash);
      if (valid && quality > 0 && !primary.empty() && primary != "*") {
        std::string lowered(primary);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
          return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
        });
        tags.push_back(WeightedTag{std::move(lowered), quality});
      }
    }
    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }

  std::stable_sort(tags.begin(), tags.end(),
                   [](const WeightedTag& a, const WeightedTag& b) { return a.quality > b.quality; });
  primaries.reserve(tags.size());
  for (auto& tag : tags) {
    primaries.push_back(std::move(tag.primary));
  }
  return primaries;
}

LocaleResolver::LocaleResolver(std::shared_ptr<const LocaleRegistry> registry) : registry_(std::move(registry)) {}

std::optional<std::string> LocaleResolver::PathLocale(std::string_view path) const {
  if (path.size() < 2 || path.front() != '/') {
    return std::nullopt;
  }
  auto rest = path.substr(1);
  auto slash = rest.find('/');
  auto segment = rest.substr(0, slash);
  auto verdict = SanitizeLocaleCandidate(segment);
  if (verdict.rejected || !registry_->IsValid(verdict.cleaned)) {
    return std::nullopt;
  }
  return verdict.cleaned;
}

std::optional<std::string> LocaleResolver::Accept(std::string_view candidate, LocaleSource source,
                                                  LocaleResolution& resolution) const {
  auto verdict = SanitizeLocaleCandidate(candidate);
  if (verdict.rejected) {
    // 경로 세그먼트는 길이만 긴 정상 경로일 수 있으므로 공격 표식이 있을 때만 기록한다.
    bool record = source != LocaleSource::kPath || ContainsHostileMarker(PercentDecodeOnce(candidate));
    if (record && !candidate.empty()) {
      resolution.rejected_sources.push_back(source);
    }
    return std::nullopt;
  }
  if (!registry_->IsValid(verdict.cleaned)) {
    return std::nullopt;
  }
  return verdict.cleaned;
}

LocaleResolution LocaleResolver::Resolve(const RequestDescriptor& req) const {
  LocaleResolution resolution;

  auto effective_path = NormalizeDotSegments(req.path);
  auto rest = std::string_view(effective_path).substr(1);
  auto segment = rest.substr(0, rest.find('/'));
  if (!segment.empty()) {
    if (auto locale = Accept(segment, LocaleSource::kPath, resolution)) {
      resolution.locale = *locale;
      resolution.source = LocaleSource::kPath;
      return resolution;
    }
    resolution.invalid_path_locale = segment.size() == 2;
  }

  if (auto cookie = req.Cookie(kLocaleCookieName)) {
    if (auto locale = Accept(*cookie, LocaleSource::kCookie, resolution)) {
      resolution.locale = *locale;
      resolution.source = LocaleSource::kCookie;
      return resolution;
    }
  }

  if (auto header = req.Header("Accept-Language")) {
    for (const auto& primary : ParseAcceptLanguage(*header)) {
      if (auto locale = Accept(primary, LocaleSource::kHeader, resolution)) {
        resolution.locale = *locale;
        resolution.source = LocaleSource::kHeader;
        return resolution;
      }
    }
  }

  resolution.locale = registry_->DefaultLocale();
  resolution.source = LocaleSource::kDefault;
  return resolution;
}

}  // namespace gatekeeper
