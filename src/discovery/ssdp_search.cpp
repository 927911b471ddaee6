#include "discovery/ssdp_search.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/url/parse.hpp>

#include <array>
#include <functional>
#include <map>
#include <set>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace net = boost::asio;
using udp = net::ip::udp;

std::string build_msearch(int mx, std::string_view search_target) {
  return fmt::format("M-SEARCH * HTTP/1.1\r\n"
                     "HOST: {}:{}\r\n"
                     "MAN: \"ssdp:discover\"\r\n"
                     "MX: {}\r\n"
                     "ST: {}\r\n"
                     "\r\n",
                     kSsdpMulticastGroup, kSsdpPort, mx, search_target);
}

std::optional<data::SsdpAnnouncement>
parse_ssdp_response(std::string_view message, const std::string &sender_ip) {
  std::map<std::string, std::string> headers;
  size_t pos = 0;
  while (pos < message.size()) {
    auto end = message.find('\n', pos);
    if (end == std::string_view::npos) end = message.size();
    std::string line(message.substr(pos, end - pos));
    pos = end + 1;
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    auto key = stringutil::toUpperCase(stringutil::trimmed(line.substr(0, colon)));
    auto value = stringutil::trimmed(line.substr(colon + 1));
    headers.emplace(std::move(key), std::move(value));
  }

  auto location = headers.find("LOCATION");
  auto usn = headers.find("USN");
  if (location == headers.end() || location->second.empty() ||
      usn == headers.end() || usn->second.empty()) {
    return std::nullopt;
  }

  data::SsdpAnnouncement out;
  out.location = location->second;
  out.usn = usn->second;
  if (auto it = headers.find("SERVER"); it != headers.end()) out.server = it->second;
  if (auto it = headers.find("ST"); it != headers.end()) {
    out.st = it->second;
  } else if (auto nt = headers.find("NT"); nt != headers.end()) {
    out.st = nt->second;
  }
  if (auto url = boost::urls::parse_uri(out.location); url && url->has_authority()) {
    out.host_ip = std::string(url->host_address());
  }
  if (out.host_ip.empty()) {
    out.host_ip = sender_ip;
  }
  return out;
}

monad::MyResult<std::vector<data::SsdpAnnouncement>>
AsioSsdpSearcher::search(std::chrono::seconds listen) {
  using R = monad::MyResult<std::vector<data::SsdpAnnouncement>>;
  net::io_context ioc;
  udp::socket socket(ioc);
  boost::system::error_code ec;
  socket.open(udp::v4(), ec);
  if (!ec) socket.set_option(net::ip::multicast::hops(4), ec);
  if (!ec) socket.bind(udp::endpoint(udp::v4(), 0), ec);
  if (ec) {
    return R::Err(monad::make_error(lanlens_errors::NETWORK::SOCKET_ERROR,
                             "SSDP socket setup failed: " + ec.message()));
  }

  const auto mx = static_cast<int>(std::max<std::chrono::seconds::rep>(1, listen.count()));
  const auto request = build_msearch(mx);
  udp::endpoint group(net::ip::make_address(kSsdpMulticastGroup), kSsdpPort);
  socket.send_to(net::buffer(request), group, 0, ec);
  if (ec) {
    return R::Err(monad::make_error(lanlens_errors::NETWORK::WRITE_ERROR,
                             "M-SEARCH send failed: " + ec.message()));
  }

  std::vector<data::SsdpAnnouncement> found;
  std::set<std::string> seen_usn;
  std::array<char, 2048> buffer{};
  udp::endpoint sender;

  net::steady_timer deadline(ioc);
  deadline.expires_after(listen);
  deadline.async_wait([&socket](const boost::system::error_code &wait_ec) {
    if (wait_ec != net::error::operation_aborted) {
      boost::system::error_code ignored;
      socket.cancel(ignored);
    }
  });

  std::function<void()> receive = [&]() {
    socket.async_receive_from(
        net::buffer(buffer), sender,
        [&](const boost::system::error_code &rec, std::size_t n) {
          if (rec) {
            if (rec != net::error::operation_aborted) {
              BOOST_LOG_SEV(lg_, trivial::debug)
                  << "SSDP receive stopped: " << rec.message();
            }
            deadline.cancel();
            return;
          }
          auto parsed = parse_ssdp_response(std::string_view(buffer.data(), n),
                                            sender.address().to_string());
          if (parsed && seen_usn.insert(parsed->usn).second) {
            BOOST_LOG_SEV(lg_, trivial::debug)
                << "SSDP answer from " << parsed->host_ip << " ("
                << parsed->server << ")";
            found.push_back(std::move(*parsed));
          }
          receive();
        });
  };
  receive();
  ioc.run();

  BOOST_LOG_SEV(lg_, trivial::info)
      << "SSDP search found " << found.size() << " devices";
  return R::Ok(std::move(found));
}

} // namespace lanlens
