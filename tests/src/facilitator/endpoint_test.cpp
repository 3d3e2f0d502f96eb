#include <gtest/gtest.h>
#include <turnstile/facilitator/endpoint.hpp>

namespace {

std::optional<turnstile::facilitator::endpoint_t> parse(const std::string_view url) {
  auto error = std::string{};
  return turnstile::facilitator::parse_https_url(url, error);
}

}  // namespace

TEST(endpoint, parses_host_port_and_base_path) {
  auto endpoint = parse("https://facilitator.example:8443/x402/");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->host, "facilitator.example");
  EXPECT_EQ(endpoint->port, "8443");
  EXPECT_EQ(endpoint->base_path, "/x402");
  EXPECT_EQ(endpoint->target("/verify"), "/x402/verify");
  EXPECT_EQ(endpoint->url(), "https://facilitator.example:8443/x402");
}

TEST(endpoint, defaults_to_port_443_and_root_path) {
  auto endpoint = parse("HTTPS://facilitator.example");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->port, "443");
  EXPECT_EQ(endpoint->base_path, "");
  EXPECT_EQ(endpoint->target("/settle"), "/settle");
  EXPECT_EQ(endpoint->url(), "https://facilitator.example");
}

TEST(endpoint, accepts_ipv6_literal) {
  auto endpoint = parse("https://[::1]:9000/api");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->host, "::1");
  EXPECT_EQ(endpoint->port, "9000");
  EXPECT_EQ(endpoint->url(), "https://[::1]:9000/api");
}

TEST(endpoint, rejects_plain_http) {
  auto error = std::string{};
  EXPECT_FALSE(turnstile::facilitator::parse_https_url("http://facilitator.example",
                                                       error)
                   .has_value());
  EXPECT_NE(error.find("https"), std::string::npos);
}

TEST(endpoint, rejects_query_fragment_credentials_and_bad_ports) {
  EXPECT_FALSE(parse("https://facilitator.example/?a=b").has_value());
  EXPECT_FALSE(parse("https://facilitator.example/#top").has_value());
  EXPECT_FALSE(parse("https://user:pw@facilitator.example").has_value());
  EXPECT_FALSE(parse("https://facilitator.example:0").has_value());
  EXPECT_FALSE(parse("https://facilitator.example:70000").has_value());
  EXPECT_FALSE(parse("https://facilitator.example:").has_value());
  EXPECT_FALSE(parse("https://:443").has_value());
  EXPECT_FALSE(parse("https://[::1").has_value());
}
