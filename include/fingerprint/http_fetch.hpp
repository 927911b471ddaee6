#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include "result_monad.hpp"

namespace lanlens {

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

struct HttpResponse {
  int status{0};
  std::string body;
  std::map<std::string, std::string> headers;
};

// Blocking HTTP exchange; the fingerprint pipeline runs on worker threads.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  // Any status code is a successful exchange. Errors cover URL, resolve,
  // connect, TLS, I/O and timeout failures.
  virtual monad::MyResult<HttpResponse> perform(const HttpRequest &request) = 0;
};

// Boost.Beast client over plain TCP or TLS (peer verified against the
// system trust store). Each call runs its own io_context under one deadline.
class BeastHttpTransport : public IHttpTransport {
public:
  explicit BeastHttpTransport(std::size_t body_limit = 1024 * 1024)
      : body_limit_(body_limit) {}

  monad::MyResult<HttpResponse> perform(const HttpRequest &request) override;

private:
  std::size_t body_limit_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
