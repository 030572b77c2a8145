#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "gatekeeper/gatekeeper.hpp"

namespace {

using Headers = std::vector<std::pair<std::string, std::string>>;

class GatekeeperTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<const gatekeeper::LocaleRegistry>(
        std::vector<std::string>{"en", "es", "fr", "it", "de"}, "en");
    observability_ = std::make_shared<gatekeeper::Observability>(gatekeeper::LogLevel::kDebug, &log_);
    gatekeeper::GatekeeperOptions options;
    options.production = true;
    gatekeeper_ = std::make_unique<gatekeeper::Gatekeeper>(registry_, options, observability_);
  }

  gatekeeper::GateDecision Process(const std::string& target, const Headers& headers = {}) {
    return gatekeeper_->Process(gatekeeper::MakeRequestDescriptor("GET", target, headers), "trace-1");
  }

  static std::string Location(const gatekeeper::GateDecision& decision) {
    return decision.response.FirstHeader("Location").value_or("");
  }

  std::ostringstream log_;
  std::shared_ptr<const gatekeeper::LocaleRegistry> registry_;
  std::shared_ptr<gatekeeper::Observability> observability_;
  std::unique_ptr<gatekeeper::Gatekeeper> gatekeeper_;
};

}  // namespace

TEST_F(GatekeeperTest, InvalidLocaleSegmentRedirectsToDefault) {
  auto decision = Process("/xx/dashboard");
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(decision.response.status, 307);
  EXPECT_EQ(Location(decision), "/en/dashboard");
  ASSERT_TRUE(decision.response.redirect_to.has_value());
  EXPECT_EQ(*decision.response.redirect_to, "/en/dashboard");
  auto cookie = decision.response.FirstHeader("Set-Cookie").value_or("");
  EXPECT_NE(cookie.find("locale=en; HttpOnly; SameSite=Lax"), std::string::npos);
  EXPECT_EQ(decision.response.FirstHeader("X-Locale"), "en");
  auto log = log_.str();
  auto event = log.find("\"eventName\":\"invalid_path_locale\"");
  ASSERT_NE(event, std::string::npos);
  EXPECT_EQ(log.find("xx"), std::string::npos);
}

TEST_F(GatekeeperTest, AuthErrorUsesLocaleOfNormalizedPath) {
  auto decision = Process("/xx/../fr/auth/signin?error=X");
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(Location(decision), "/fr/auth/error?error=X");
  EXPECT_EQ(decision.locale, "fr");
}

TEST_F(GatekeeperTest, AuthErrorRedirectTakesPrecedence) {
  auto decision = Process("/en/auth/signin?error=OAuthAccountNotLinked");
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(decision.response.status, 307);
  EXPECT_EQ(Location(decision), "/en/auth/error?error=OAuthAccountNotLinked");
  EXPECT_EQ(observability_->Snapshot().auth_error_redirects, 1u);

  auto log = log_.str();
  EXPECT_NE(log.find("\"eventName\":\"auth_error_redirect\""), std::string::npos);
  EXPECT_NE(log.find("\"locale\":\"en\""), std::string::npos);
  EXPECT_NE(log.find("\"path\":\"/en/auth/signin\""), std::string::npos);
}

TEST_F(GatekeeperTest, TraversalIsRemovedFromLocation) {
  auto decision = Process("/../../../etc/passwd");
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(Location(decision), "/en/etc/passwd");
  EXPECT_EQ(Location(decision).find(".."), std::string::npos);
}

TEST_F(GatekeeperTest, AttackPathsProduceSafeRedirects) {
  struct Case {
    std::string target;
    std::string expected;
  };
  const std::vector<Case> cases = {
      {"/%2e%2e%2f%2e%2e", "/en"},
      {"/%2e%2e/%2e%2e/secret", "/en/secret"},
      {"/<script>alert(1)</script>", "/en"},
      {"/\"; DROP TABLE users; --/dashboard", "/en/dashboard"},
      {"/%3Cimg%20src=x%3E/profile", "/en/profile"},
  };
  for (const auto& c : cases) {
    auto decision = Process(c.target);
    EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect) << c.target;
    EXPECT_EQ(Location(decision), c.expected) << c.target;
  }
}

TEST_F(GatekeeperTest, DotSegmentsAfterLocaleAreRedirected) {
  struct Case {
    std::string target;
    std::string expected;
  };
  const std::vector<Case> cases = {
      {"/en/../../../secret", "/en/secret"},
      {"/en/../admin", "/en/admin"},
      {"/en/%2e%2e/admin", "/en/admin"},
      {"/en/%2E%2E/%2e%2e/admin?x=1", "/en/admin?x=1"},
      {"/en/./dashboard", "/en/dashboard"},
      {"/en/..", "/en"},
      {"/fr/../de/page", "/de/page"},
  };
  for (const auto& c : cases) {
    auto decision = Process(c.target);
    EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect) << c.target;
    EXPECT_EQ(decision.response.status, 307) << c.target;
    EXPECT_EQ(Location(decision), c.expected) << c.target;
    EXPECT_EQ(Location(decision).find(".."), std::string::npos) << c.target;
  }

  // 정규화 후 도착한 경로가 로케일 경로이면 더 이상 리다이렉트하지 않는다.
  EXPECT_EQ(Process("/en/admin").action, gatekeeper::GateAction::kPassThrough);
  EXPECT_EQ(Process("/en").action, gatekeeper::GateAction::kPassThrough);
}

TEST_F(GatekeeperTest, ValidLocalePrefixPassesThroughUnchanged) {
  auto plain = Process("/fr/dashboard", {{"Cookie", "locale=fr"}});
  EXPECT_EQ(plain.action, gatekeeper::GateAction::kPassThrough);
  EXPECT_EQ(plain.response.status, 200);
  EXPECT_FALSE(plain.response.FirstHeader("Location").has_value());
  EXPECT_EQ(plain.response.FirstHeader("X-Locale"), "fr");
  EXPECT_TRUE(plain.response.HeaderValues("Set-Cookie").empty());
  EXPECT_EQ(plain.response.FirstHeader("X-Frame-Options"), "DENY");
}

TEST_F(GatekeeperTest, PathLocaleOverridesStaleCookie) {
  auto decision = Process("/it/page", {{"Cookie", "locale=es"}});
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kPassThrough);
  EXPECT_EQ(decision.response.FirstHeader("Set-Cookie"),
            "locale=it; HttpOnly; SameSite=Lax; Path=/; Max-Age=63072000");
}

TEST_F(GatekeeperTest, RootRedirectsWithoutTrailingSegment) {
  EXPECT_EQ(Location(Process("/")), "/en");
  EXPECT_EQ(Location(Process("/", {{"Accept-Language", "es-ES,es;q=0.9"}})), "/es");
  EXPECT_EQ(Location(Process("/", {{"Cookie", "locale=de"}})), "/de");
}

TEST_F(GatekeeperTest, PreservesQueryAndFragment) {
  auto decision = Process("/dashboard?tab=a%20b&x=1#section-2", {{"Cookie", "locale=fr"}});
  EXPECT_EQ(Location(decision), "/fr/dashboard?tab=a%20b&x=1#section-2");
  EXPECT_TRUE(decision.response.HeaderValues("Set-Cookie").empty());

  auto trailing = Process("/docs/?q=1");
  EXPECT_EQ(Location(trailing), "/en/docs/?q=1");
}

TEST_F(GatekeeperTest, EscapesHeaderBreakingQueryCharacters) {
  auto req = gatekeeper::MakeRequestDescriptor("GET", "/page", {});
  req.query = "next=a b\r\nSet-Cookie: x=1";
  auto decision = gatekeeper_->Process(req);
  auto location = Location(decision);
  EXPECT_EQ(location.find('\r'), std::string::npos);
  EXPECT_EQ(location.find('\n'), std::string::npos);
  EXPECT_EQ(location.find(' '), std::string::npos);
  EXPECT_EQ(location.rfind("/en/page?", 0), 0u);
}

TEST_F(GatekeeperTest, AvoidsDoubleLocalePrefix) {
  auto decision = Process("/xx/../fr/page");
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(Location(decision), "/fr/page");
  EXPECT_EQ(decision.locale, "fr");
}

TEST_F(GatekeeperTest, NonAuthErrorQueryIsOnlyLocalePrefixed) {
  auto decision = Process("/dashboard?error=whatever");
  EXPECT_EQ(Location(decision), "/en/dashboard?error=whatever");
  EXPECT_EQ(observability_->Snapshot().auth_error_redirects, 0u);
}

TEST_F(GatekeeperTest, ApiPathsAreNotLocaleRedirected) {
  auto decision = Process("/api/users", {{"Accept-Language", "it"}});
  EXPECT_EQ(decision.action, gatekeeper::GateAction::kPassThrough);
  EXPECT_EQ(decision.locale, "it");
  EXPECT_EQ(decision.response.FirstHeader("X-Locale"), "it");

  auto auth = Process("/api/auth/callback/google?error=AccessDenied");
  EXPECT_EQ(auth.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(Location(auth), "/en/auth/error?error=AccessDenied");

  auto auth_root = Process("/api/auth/?error=AccessDenied");
  EXPECT_EQ(auth_root.action, gatekeeper::GateAction::kRedirect);
  EXPECT_EQ(Location(auth_root), "/en/auth/error?error=AccessDenied");

  auto climbed = Process("/en/../api/users");
  EXPECT_EQ(climbed.action, gatekeeper::GateAction::kPassThrough);
}

TEST_F(GatekeeperTest, StaticAssetsBypassEverything) {
  const std::vector<std::string> assets = {"/_next/static/chunks/main.js", "/favicon.ico", "/robots.txt",
                                           "/sitemap.xml", "/images/logo.PNG", "/fonts/inter.woff2"};
  for (const auto& asset : assets) {
    auto decision = Process(asset, {{"Cookie", "locale=<script>"}});
    EXPECT_EQ(decision.action, gatekeeper::GateAction::kStaticBypass) << asset;
    EXPECT_TRUE(decision.response.headers.empty()) << asset;
  }
  EXPECT_EQ(observability_->Snapshot().static_bypass, assets.size());
  EXPECT_EQ(observability_->Snapshot().rejected_candidates, 0u);
}

TEST(GatekeeperStaticTest, Classification) {
  EXPECT_TRUE(gatekeeper::Gatekeeper::IsStaticAsset("/a/b/c.css"));
  EXPECT_FALSE(gatekeeper::Gatekeeper::IsStaticAsset("/feed.xml"));
  EXPECT_FALSE(gatekeeper::Gatekeeper::IsStaticAsset("/en/dashboard"));
  EXPECT_FALSE(gatekeeper::Gatekeeper::IsStaticAsset("/file."));
  EXPECT_FALSE(gatekeeper::Gatekeeper::IsStaticAsset("/v1.2/page"));
  EXPECT_TRUE(gatekeeper::Gatekeeper::IsApiPath("/api"));
  EXPECT_TRUE(gatekeeper::Gatekeeper::IsApiPath("/api/x"));
  EXPECT_FALSE(gatekeeper::Gatekeeper::IsApiPath("/apiary"));
}

TEST_F(GatekeeperTest, RejectedCandidatesAreLoggedWithoutValues) {
  auto decision = Process("/dashboard", {{"Cookie", "locale=<script>alert(1)</script>"}});
  EXPECT_EQ(Location(decision), "/en/dashboard");
  EXPECT_EQ(observability_->Snapshot().rejected_candidates, 1u);

  auto log = log_.str();
  EXPECT_NE(log.find("\"eventName\":\"locale_candidate_rejected\""), std::string::npos);
  EXPECT_NE(log.find("\"source\":\"cookie\""), std::string::npos);
  EXPECT_EQ(log.find("<script>"), std::string::npos);
}

TEST(GatekeeperDevelopmentTest, SecurityLogsOnlyInProduction) {
  auto registry = std::make_shared<const gatekeeper::LocaleRegistry>(std::vector<std::string>{"en", "fr"}, "en");
  std::ostringstream log;
  auto observability = std::make_shared<gatekeeper::Observability>(gatekeeper::LogLevel::kDebug, &log);
  gatekeeper::Gatekeeper gate(registry, gatekeeper::GatekeeperOptions{}, observability);

  auto decision = gate.Process(
      gatekeeper::MakeRequestDescriptor("GET", "/xx/page", {{"Cookie", "locale=<b>"}}));
  EXPECT_EQ(decision.response.FirstHeader("Location"), "/en/page");
  EXPECT_EQ(observability->Snapshot().rejected_candidates, 1u);
  EXPECT_EQ(log.str().find("locale_candidate_rejected"), std::string::npos);
  EXPECT_EQ(log.str().find("invalid_path_locale"), std::string::npos);
}

TEST_F(GatekeeperTest, TotalOverGarbageInput) {
  const std::vector<std::string> targets = {
      "",
      "?",
      "#",
      "//",
      "/%",
      "/%%%%",
      "/%00/%0d%0a",
      "/..%2f..%2f..%2fetc%2fpasswd",
      "/%252e%252e/%252e%252e",
      "/\x01\x02\x7f",
      "/\xff\xfe\xfd",
      "/a/./../../b/./c/..",
      "/" + std::string(5000, 'a'),
      "/" + std::string(2000, '/'),
      "/en%00/x",
      "/%E2%80%A8/line",
      "/?error=x#frag#frag2",
  };
  for (const auto& target : targets) {
    gatekeeper::GateDecision decision;
    ASSERT_NO_THROW(decision = Process(target, {{"Accept-Language", std::string(3000, ',')},
                                                {"Cookie", "locale=%2e%2e; locale=x"}}));
    EXPECT_FALSE(decision.locale.empty());
    EXPECT_TRUE(registry_->IsValid(decision.locale)) << decision.locale;
    auto location = Location(decision);
    EXPECT_EQ(location.find(".."), std::string::npos) << location;
    EXPECT_EQ(location.find_first_of("\r\n<>\"' "), std::string::npos) << location;
    if (decision.action == gatekeeper::GateAction::kRedirect) {
      ASSERT_FALSE(location.empty());
      EXPECT_EQ(location.front(), '/');
      EXPECT_NE(location.rfind("//", 0), 0u) << location;
    }
  }
}
