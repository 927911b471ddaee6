#include "fingerprint/http_fetch.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/url/parse.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <optional>
#include <type_traits>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace lanlens {

namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

struct TargetParts {
  bool tls{false};
  std::string host;
  std::string port;
  std::string target;
};

monad::MyResult<TargetParts> split_url(const std::string &url) {
  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return monad::MyResult<TargetParts>::Err(monad::make_error(
        lanlens_errors::NETWORK::BAD_URL,
        "Invalid URL '" + url + "': " + parsed.error().message()));
  }
  TargetParts parts;
  const std::string scheme(parsed->scheme());
  if (scheme == "https") {
    parts.tls = true;
  } else if (scheme != "http") {
    return monad::MyResult<TargetParts>::Err(monad::make_error(
        lanlens_errors::NETWORK::BAD_URL, "Unsupported URL scheme: " + scheme));
  }
  parts.host = std::string(parsed->host());
  if (parts.host.empty()) {
    return monad::MyResult<TargetParts>::Err(
        monad::make_error(lanlens_errors::NETWORK::BAD_URL, "URL has no host: " + url));
  }
  parts.port = parsed->has_port() ? std::string(parsed->port())
                                  : (parts.tls ? "443" : "80");
  parts.target = std::string(parsed->encoded_path());
  if (parts.target.empty()) parts.target = "/";
  if (parsed->has_query()) {
    parts.target += "?" + std::string(parsed->encoded_query());
  }
  return monad::MyResult<TargetParts>::Ok(std::move(parts));
}

template <typename Stream>
class HttpCall : public std::enable_shared_from_this<HttpCall<Stream>> {
  static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

public:
  template <typename... StreamArgs>
  HttpCall(net::io_context &ioc, TargetParts target,
           http::request<http::string_body> request,
           std::chrono::milliseconds timeout, std::size_t body_limit,
           StreamArgs &&...stream_args)
      : target_(std::move(target)), request_(std::move(request)),
        timeout_(timeout), resolver_(ioc),
        stream_(ioc, std::forward<StreamArgs>(stream_args)...),
        deadline_(ioc) {
    parser_.body_limit(body_limit);
  }

  void Start() {
    auto self = this->shared_from_this();
    deadline_.expires_after(timeout_);
    deadline_.async_wait(beast::bind_front_handler(&HttpCall::OnTimeout, self));
    resolver_.async_resolve(
        target_.host, target_.port,
        beast::bind_front_handler(&HttpCall::OnResolve, self));
  }

  std::optional<monad::MyResult<HttpResponse>> &result() { return result_; }

private:
  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail(lanlens_errors::NETWORK::RESOLVE_ERROR, "resolve", ec);
      return;
    }
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&HttpCall::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(lanlens_errors::NETWORK::CONNECT_ERROR, "connect", ec);
      return;
    }
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    target_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail(lanlens_errors::NETWORK::SSL_ERROR, "set_sni", sni_error);
        return;
      }
      stream_.set_verify_callback(ssl::host_name_verification(target_.host));
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&HttpCall::OnHandshake,
                                    this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(lanlens_errors::NETWORK::SSL_HANDSHAKE_ERROR, "handshake", ec);
      return;
    }
    Write();
  }

  void Write() {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&HttpCall::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(lanlens_errors::NETWORK::WRITE_ERROR, "write", ec);
      return;
    }
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&HttpCall::OnRead,
                                               this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(lanlens_errors::NETWORK::READ_ERROR, "read", ec);
      return;
    }
    auto &res = parser_.get();
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.body = std::move(res.body());
    for (const auto &field : res) {
      out.headers.emplace(std::string(field.name_string()),
                          std::string(field.value()));
    }
    Complete(monad::MyResult<HttpResponse>::Ok(std::move(out)));
  }

  void OnTimeout(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted || result_) {
      return;
    }
    resolver_.cancel();
    beast::get_lowest_layer(stream_).cancel();
    Complete(monad::MyResult<HttpResponse>::Err(monad::make_error(
        lanlens_errors::NETWORK::TIMEOUT_ERROR,
        "request to " + target_.host + " timed out")));
  }

  void Fail(int code, const char *stage, const beast::error_code &ec) {
    if (ec == beast::error::timeout) {
      code = lanlens_errors::NETWORK::TIMEOUT_ERROR;
    }
    Complete(monad::MyResult<HttpResponse>::Err(monad::make_error(
        code, fmt::format("{} {}:{} failed: {}", stage, target_.host,
                          target_.port, ec.message()))));
  }

  void Complete(monad::MyResult<HttpResponse> r) {
    if (result_) {
      return;
    }
    result_ = std::move(r);
    deadline_.cancel();
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().close(ignore);
  }

  TargetParts target_;
  http::request<http::string_body> request_;
  std::chrono::milliseconds timeout_;
  tcp::resolver resolver_;
  Stream stream_;
  net::steady_timer deadline_;
  beast::flat_buffer buffer_;
  http::response_parser<http::string_body> parser_;
  std::optional<monad::MyResult<HttpResponse>> result_;
};

template <typename Stream, typename... StreamArgs>
monad::MyResult<HttpResponse> run_call(net::io_context &ioc, TargetParts target,
                              http::request<http::string_body> request,
                              std::chrono::milliseconds timeout,
                              std::size_t body_limit,
                              StreamArgs &&...stream_args) {
  auto call = std::make_shared<HttpCall<Stream>>(
      ioc, std::move(target), std::move(request), timeout, body_limit,
      std::forward<StreamArgs>(stream_args)...);
  call->Start();
  ioc.run();
  if (!call->result()) {
    return monad::MyResult<HttpResponse>::Err(monad::make_error(
        lanlens_errors::NETWORK::SOCKET_ERROR, "request ended without result"));
  }
  return std::move(*call->result());
}

} // namespace

monad::MyResult<HttpResponse> BeastHttpTransport::perform(const HttpRequest &request) {
  auto parts_r = split_url(request.url);
  if (parts_r.is_err()) {
    return monad::MyResult<HttpResponse>::Err(parts_r.error());
  }
  TargetParts parts = std::move(parts_r.value());

  http::request<http::string_body> req;
  req.version(11);
  auto verb = http::string_to_verb(request.method);
  if (verb == http::verb::unknown) {
    return monad::MyResult<HttpResponse>::Err(
        monad::make_error(lanlens_errors::GENERAL::INVALID_ARGUMENT,
                   "Unsupported HTTP method: " + request.method));
  }
  req.method(verb);
  req.target(parts.target);
  const bool default_port =
      (parts.tls && parts.port == "443") || (!parts.tls && parts.port == "80");
  req.set(http::field::host,
          default_port ? parts.host : parts.host + ":" + parts.port);
  req.set(http::field::user_agent, std::string("lanlens/") + LANLENS_VERSION);
  req.set(http::field::connection, "close");
  for (const auto &[name, value] : request.headers) {
    req.set(name, value);
  }
  if (!request.body.empty() || verb == http::verb::post) {
    req.body() = request.body;
    req.prepare_payload();
  }

  BOOST_LOG_SEV(lg_, trivial::debug)
      << request.method << " " << request.url << " (timeout "
      << request.timeout.count() << "ms)";

  net::io_context ioc;
  if (!parts.tls) {
    return run_call<beast::tcp_stream>(ioc, std::move(parts), std::move(req),
                                       request.timeout, body_limit_);
  }

  ssl::context ssl_ctx(ssl::context::tls_client);
  boost::system::error_code ec;
  ssl_ctx.set_default_verify_paths(ec);
  if (ec) {
    return monad::MyResult<HttpResponse>::Err(
        monad::make_error(lanlens_errors::NETWORK::SSL_ERROR,
                   "Unable to load system trust store: " + ec.message()));
  }
  ssl_ctx.set_verify_mode(ssl::verify_peer);
  return run_call<TlsStream>(ioc, std::move(parts), std::move(req),
                             request.timeout, body_limit_, ssl_ctx);
}

} // namespace lanlens
