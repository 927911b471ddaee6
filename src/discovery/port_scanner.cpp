#include "discovery/port_scanner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <istream>
#include <memory>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace portscan {

const std::vector<int> &smart_device_ports() {
  static const std::vector<int> ports{
      22,   80,   443,  548,  554,  1400, 1883, 3000,  3478,  3689,
      5000, 5001, 5353, 6466, 7000, 8008, 8009, 8080,  8123,  8443,
      8883, 9000, 9090, 9100, 49152, 49153, 49154};
  return ports;
}

const std::vector<int> &quick_ports() {
  static const std::vector<int> ports{22,   80,   443,  554,  1883,
                                      5000, 7000, 8008, 8080, 8123};
  return ports;
}

std::optional<std::string> guess_service(int port) {
  switch (port) {
  case 22: return "ssh";
  case 23: return "telnet";
  case 80: return "http";
  case 443: return "https";
  case 445: return "smb";
  case 548: return "afp";
  case 554: return "rtsp";
  case 1400: return "sonos";
  case 1883: return "mqtt";
  case 3000: return "http";
  case 3689: return "daap";
  case 5000: return "upnp";
  case 5001: return "upnp-ssl";
  case 5353: return "mdns";
  case 7000: return "airplay";
  case 8008:
  case 8009: return "googlecast";
  case 8080: return "http-alt";
  case 8123: return "homeassistant";
  case 8443: return "https-alt";
  case 8883: return "mqtt-ssl";
  case 9000: return "http";
  case 9090: return "prometheus";
  case 9100: return "printing";
  case 32400: return "plex";
  default:
    if (port >= 49152 && port <= 49160) return "upnp";
    return std::nullopt;
  }
}

bool is_smart_indicator(int port) {
  switch (port) {
  case 554:
  case 1400:
  case 1883:
  case 7000:
  case 8008:
  case 8009:
  case 8123:
  case 8883:
  case 32400:
    return true;
  default:
    return false;
  }
}

int smart_weight(int port) {
  switch (port) {
  case 554: return 20;
  case 1400: return 25;
  case 1883:
  case 8883: return 25;
  case 7000: return 20;
  case 8008:
  case 8009: return 20;
  case 8123: return 30;
  case 32400: return 15;
  case 80:
  case 443: return 5;
  case 22: return 5;
  default: return 0;
  }
}

data::DeviceType inferred_type(int port) {
  using T = data::DeviceType;
  switch (port) {
  case 554: return T::camera;
  case 1400: return T::speaker;
  case 7000:
  case 8008:
  case 8009: return T::smartTV;
  case 8123: return T::hub;
  case 32400: return T::computer;
  case 9100: return T::printer;
  default: return T::unknown;
  }
}

data::PortScanResult make_result(int port, std::optional<std::string> banner) {
  data::PortScanResult r;
  r.port = port;
  r.protocol = data::TransportProtocol::tcp;
  r.service = guess_service(port).value_or("unknown");
  r.is_smart_indicator = is_smart_indicator(port);
  if (auto t = inferred_type(port); t != data::DeviceType::unknown) {
    r.inferred_type = t;
  }
  r.banner = std::move(banner);
  return r;
}

} // namespace portscan

namespace {

namespace net = boost::asio;
using tcp = net::ip::tcp;

enum class BannerKind { none, passive, http, rtsp };

BannerKind banner_kind(int port) {
  switch (port) {
  case 22: return BannerKind::passive;
  case 80:
  case 8080: return BannerKind::http;
  case 554: return BannerKind::rtsp;
  default: return BannerKind::none;
  }
}

// Connect attempt on one port, optionally followed by a banner read.
class PortConnector : public std::enable_shared_from_this<PortConnector> {
public:
  PortConnector(net::io_context &ioc, tcp::endpoint endpoint,
            std::chrono::milliseconds timeout,
            std::vector<data::PortScanResult> &open)
      : endpoint_(endpoint), timeout_(timeout), socket_(ioc), deadline_(ioc),
        open_(open) {}

  void Start() {
    auto self = shared_from_this();
    deadline_.expires_after(timeout_);
    deadline_.async_wait([self](const boost::system::error_code &ec) {
      self->OnTimeout(ec);
    });
    socket_.async_connect(endpoint_, [self](const boost::system::error_code &ec) {
      self->OnConnect(ec);
    });
  }

private:
  void OnConnect(const boost::system::error_code &ec) {
    if (done_) return;
    if (ec) {
      Finish(false);
      return;
    }
    connected_ = true;
    switch (banner_kind(endpoint_.port())) {
    case BannerKind::none:
      Finish(true);
      return;
    case BannerKind::passive:
      ReadBanner();
      return;
    case BannerKind::http:
      request_ = "HEAD / HTTP/1.0\r\nHost: " +
                 endpoint_.address().to_string() + "\r\n\r\n";
      break;
    case BannerKind::rtsp:
      request_ = "OPTIONS rtsp://" + endpoint_.address().to_string() +
                 " RTSP/1.0\r\nCSeq: 1\r\n\r\n";
      break;
    }
    auto self = shared_from_this();
    net::async_write(socket_, net::buffer(request_),
                     [self](const boost::system::error_code &wec, std::size_t) {
                       if (wec) {
                         self->Finish(true);
                         return;
                       }
                       self->ReadBanner();
                     });
  }

  void ReadBanner() {
    auto self = shared_from_this();
    const char *delim = banner_kind(endpoint_.port()) == BannerKind::passive
                            ? "\n"
                            : "\r\n\r\n";
    net::async_read_until(
        socket_, buffer_, delim,
        [self](const boost::system::error_code &ec, std::size_t) {
          self->OnBanner(ec);
        });
  }

  void OnBanner(const boost::system::error_code &ec) {
    if (done_) return;
    if (!ec || buffer_.size() > 0) {
      banner_ = ExtractBanner();
    }
    Finish(true);
  }

  std::optional<std::string> ExtractBanner() {
    std::istream is(&buffer_);
    std::string line;
    const bool passive = banner_kind(endpoint_.port()) == BannerKind::passive;
    std::optional<std::string> first;
    while (std::getline(is, line)) {
      stringutil::trim(line);
      if (line.empty()) continue;
      if (passive) return line;
      if (!first) first = line;
      auto lower = stringutil::toLowerCase(line);
      if (stringutil::starts_with(lower, "server:")) {
        return stringutil::trimmed(line.substr(7));
      }
    }
    return first;
  }

  void OnTimeout(const boost::system::error_code &ec) {
    if (ec == net::error::operation_aborted || done_) return;
    boost::system::error_code ignored;
    socket_.cancel(ignored);
    // Connected but silent: the port is open, there is just no banner.
    Finish(connected_);
  }

  void Finish(bool open) {
    if (done_) return;
    done_ = true;
    deadline_.cancel();
    boost::system::error_code close_ec;
    socket_.close(close_ec);
    if (open) {
      open_.push_back(portscan::make_result(endpoint_.port(), banner_));
    }
  }

  tcp::endpoint endpoint_;
  std::chrono::milliseconds timeout_;
  tcp::socket socket_;
  net::steady_timer deadline_;
  net::streambuf buffer_{4096};
  std::string request_;
  std::optional<std::string> banner_;
  bool connected_{false};
  bool done_{false};
  std::vector<data::PortScanResult> &open_;
};

} // namespace

AsioPortScanner::AsioPortScanner(ILanlensConfigProvider &config_provider)
    : timeout_(std::max(100, config_provider.get().discovery.port_timeout_ms)) {}

monad::MyResult<std::vector<data::PortScanResult>>
AsioPortScanner::scan(const std::string &ip, const std::vector<int> &ports) {
  using R = monad::MyResult<std::vector<data::PortScanResult>>;
  boost::system::error_code ec;
  auto address = net::ip::make_address(ip, ec);
  if (ec) {
    return R::Err(monad::make_error(lanlens_errors::GENERAL::INVALID_ARGUMENT,
                             "Invalid IP address '" + ip + "'"));
  }

  std::vector<data::PortScanResult> open;
  net::io_context ioc;
  for (int port : ports) {
    if (port <= 0 || port > 65535) continue;
    std::make_shared<PortConnector>(
        ioc, tcp::endpoint(address, static_cast<unsigned short>(port)),
        timeout_, open)
        ->Start();
  }
  ioc.run();

  std::sort(open.begin(), open.end(),
            [](const auto &a, const auto &b) { return a.port < b.port; });
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Port scan " << ip << ": " << open.size() << "/" << ports.size()
      << " open";
  return R::Ok(std::move(open));
}

} // namespace lanlens
