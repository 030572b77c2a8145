#include <gtest/gtest.h>

#include "gatekeeper/request.hpp"

TEST(RequestDescriptorTest, SplitsPathQueryAndFragment) {
  auto req = gatekeeper::MakeRequestDescriptor("GET", "/en/dashboard?tab=a%20b&x=1#section", {});
  EXPECT_EQ(req.method, "GET");
  EXPECT_EQ(req.path, "/en/dashboard");
  EXPECT_EQ(req.query, "tab=a%20b&x=1");
  EXPECT_EQ(req.fragment, "section");
  EXPECT_EQ(req.QueryParam("tab"), "a b");
  EXPECT_EQ(req.QueryParam("x"), "1");
  EXPECT_FALSE(req.QueryParam("missing").has_value());
}

TEST(RequestDescriptorTest, EmptyTargetBecomesRoot) {
  auto req = gatekeeper::MakeRequestDescriptor("GET", "", {});
  EXPECT_EQ(req.path, "/");
  auto query_only = gatekeeper::MakeRequestDescriptor("GET", "?a=1", {});
  EXPECT_EQ(query_only.path, "/");
  EXPECT_EQ(query_only.QueryParam("a"), "1");
}

TEST(RequestDescriptorTest, FirstQueryValueWinsAndPlusIsSpace) {
  auto params = gatekeeper::ParseQueryParams("error=first&error=second&msg=hello+world&flag");
  EXPECT_EQ(params["error"], "first");
  EXPECT_EQ(params["msg"], "hello world");
  ASSERT_TRUE(params.count("flag"));
  EXPECT_TRUE(params["flag"].empty());
}

TEST(RequestDescriptorTest, HeadersAreCaseInsensitive) {
  auto req = gatekeeper::MakeRequestDescriptor(
      "GET", "/", {{"accept-language", "es-ES,es;q=0.9"}, {"X-Forwarded-For", "1.1.1.1"}, {"x-forwarded-for", "2.2.2.2"}});
  EXPECT_EQ(req.Header("Accept-Language"), "es-ES,es;q=0.9");
  EXPECT_EQ(req.Header("X-FORWARDED-FOR"), "1.1.1.1, 2.2.2.2");
  EXPECT_FALSE(req.Header("Authorization").has_value());
}

TEST(RequestDescriptorTest, MergesCookieHeaders) {
  auto req = gatekeeper::MakeRequestDescriptor("GET", "/", {{"Cookie", "session=abc; locale=\"fr\""}, {"cookie", "theme=dark"}});
  EXPECT_EQ(req.Cookie("locale"), "fr");
  EXPECT_EQ(req.Cookie("session"), "abc");
  EXPECT_EQ(req.Cookie("theme"), "dark");
  EXPECT_FALSE(req.Cookie("other").has_value());
}

TEST(RequestDescriptorTest, IgnoresMalformedCookiePairs) {
  auto cookies = gatekeeper::ParseCookieHeader(" ; =value; novalue;  locale = de ");
  EXPECT_EQ(cookies.size(), 1u);
  EXPECT_EQ(cookies["locale"], "de");
}

TEST(ResponseDescriptorTest, SetHeaderReplacesAddHeaderAppends) {
  gatekeeper::ResponseDescriptor res;
  res.SetHeader("X-Locale", "en");
  res.SetHeader("x-locale", "fr");
  res.AddHeader("Set-Cookie", "a=1");
  res.AddHeader("Set-Cookie", "b=2");
  EXPECT_EQ(res.HeaderValues("X-Locale").size(), 1u);
  EXPECT_EQ(res.FirstHeader("X-LOCALE"), "fr");
  EXPECT_EQ(res.HeaderValues("set-cookie").size(), 2u);
  EXPECT_FALSE(res.FirstHeader("Location").has_value());
}
