#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "data/device.hpp"

namespace lanlens {

/**
 * Coalesces device events into batches. Every event restarts the quiet
 * timer; when it fires without a new event the batch is delivered in
 * arrival order. All state lives on a strand.
 */
class EventDebouncer {
public:
  using BatchHandler = std::function<void(const std::vector<data::DeviceEvent> &)>;

  EventDebouncer(boost::asio::any_io_executor executor,
                 std::chrono::milliseconds quiet, BatchHandler handler);

  void post(data::DeviceEvent event);

  // Delivers anything pending right away and waits until it was handed out.
  // Must not be called from inside the batch handler.
  void drain();

private:
  void arm();
  void deliver();

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds quiet_;
  BatchHandler handler_;
  std::vector<data::DeviceEvent> pending_;
  uint64_t generation_{0};
};

} // namespace lanlens
