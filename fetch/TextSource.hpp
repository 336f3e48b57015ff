// TextSource: where exposition text comes from (HTTP scrape or saved file)
#pragma once

#include <string>
#include <utility>

namespace promscope {

struct Config;

struct Endpoint {
  std::string host = "localhost";
  int         port = 9100;
  std::string path = "/metrics";
  int         timeout_ms = 5000; // applied to send and recv; 0 disables
};

Endpoint EndpointFromConfig(const Config& cfg);

class TextSource {
 public:
  virtual ~TextSource() = default;
  // Fill `body` with the whole document. On failure return false and set `err`.
  virtual bool Fetch(std::string& body, std::string& err) = 0;
  // Human readable origin, e.g. http://localhost:9100/metrics
  virtual std::string Describe() const = 0;
};

// Blocking HTTP/1.0 GET; any non-2xx status is a failure.
class HttpSource : public TextSource {
 public:
  explicit HttpSource(Endpoint ep) : ep_(std::move(ep)) {}
  bool Fetch(std::string& body, std::string& err) override;
  std::string Describe() const override;

 private:
  Endpoint ep_;
};

class FileSource : public TextSource {
 public:
  explicit FileSource(std::string path) : path_(std::move(path)) {}
  bool Fetch(std::string& body, std::string& err) override;
  std::string Describe() const override { return "file:" + path_; }

 private:
  std::string path_;
};

// Split a raw HTTP response into status and body. False on a malformed
// response or a non-2xx status, with the reason in `err`.
bool ParseHttpResponse(const std::string& resp, std::string& body, std::string& err);

} // namespace promscope
