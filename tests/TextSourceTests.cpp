#include <gtest/gtest.h>
#include "fetch/TextSource.hpp"

#include <promscope/promscope.hpp>

#include <string>

using namespace promscope;

TEST(TextSourceTest, ParseHttpResponseStripsHeaders) {
  std::string body, err;
  ASSERT_TRUE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nup 1\n", body, err)) << err;
  EXPECT_EQ(body, "up 1\n");
}

TEST(TextSourceTest, ParseHttpResponseRejectsErrors) {
  std::string body, err;
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.0 404 Not Found\r\n\r\nnope", body, err));
  EXPECT_EQ(err, "HTTP status 404");

  EXPECT_FALSE(ParseHttpResponse("", body, err));
  EXPECT_FALSE(ParseHttpResponse("garbage", body, err));
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.0 2", body, err));
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.0 200 OK\r\nContent-Length: 4\r\n", body, err));
  EXPECT_EQ(err, "truncated HTTP headers");
}

TEST(TextSourceTest, EndpointFromConfig) {
  Config cfg;
  cfg.host = "exporter.local";
  cfg.port = 9256;
  cfg.path = "";
  auto ep = EndpointFromConfig(cfg);
  EXPECT_EQ(ep.host, "exporter.local");
  EXPECT_EQ(ep.port, 9256);
  EXPECT_EQ(ep.path, "/metrics");
  EXPECT_EQ(HttpSource(ep).Describe(), "http://exporter.local:9256/metrics");
}

TEST(TextSourceTest, FileSourceReadsDocument) {
  FileSource src(std::string(PROMSCOPE_TEST_DATA_DIR) + "/node_exporter.prom");
  std::string body, err;
  ASSERT_TRUE(src.Fetch(body, err)) << err;
  EXPECT_NE(body.find("node_cpu_seconds_total"), std::string::npos);
}

TEST(TextSourceTest, FileSourceMissingFileFails) {
  FileSource src("/nonexistent/metrics.prom");
  std::string body, err;
  EXPECT_FALSE(src.Fetch(body, err));
  EXPECT_NE(err.find("/nonexistent/metrics.prom"), std::string::npos);
}

TEST(TextSourceTest, HttpSourceReportsConnectFailure) {
  Endpoint ep;
  ep.host = "127.0.0.1";
  ep.port = 1; // nothing listens on tcpmux
  ep.timeout_ms = 1000;
  HttpSource src(ep);
  std::string body, err;
  EXPECT_FALSE(src.Fetch(body, err));
  EXPECT_FALSE(err.empty());
}
