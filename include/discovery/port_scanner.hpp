#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/device.hpp"
#include "data/observations.hpp"
#include "result_monad.hpp"

namespace lanlens {

namespace portscan {

// Ports tried by a full scan.
const std::vector<int> &smart_device_ports();
// Ports tried by a quick scan.
const std::vector<int> &quick_ports();

std::optional<std::string> guess_service(int port);
bool is_smart_indicator(int port);
int smart_weight(int port);
data::DeviceType inferred_type(int port);

// Fills service, smart flag and inferred type for an open TCP port.
data::PortScanResult make_result(int port,
                                 std::optional<std::string> banner = std::nullopt);

} // namespace portscan

class IPortScanner {
public:
  virtual ~IPortScanner() = default;

  // Open ports of `ip` among `ports`, ascending. A closed or filtered port
  // is not an error; only an unusable address is.
  virtual monad::MyResult<std::vector<data::PortScanResult>>
  scan(const std::string &ip, const std::vector<int> &ports) = 0;
};

/**
 * TCP connect scanner. All ports of one host are tried concurrently on a
 * private io_context, each under discovery.port_timeout_ms. SSH, HTTP and
 * RTSP ports get a short banner read after connecting.
 */
class AsioPortScanner : public IPortScanner {
public:
  explicit AsioPortScanner(ILanlensConfigProvider &config_provider);

  monad::MyResult<std::vector<data::PortScanResult>>
  scan(const std::string &ip, const std::vector<int> &ports) override;

private:
  std::chrono::milliseconds timeout_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
