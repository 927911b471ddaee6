#include "discovery/event_debouncer.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include <future>

#include "util/my_logging.hpp"

namespace lanlens {

namespace net = boost::asio;

EventDebouncer::EventDebouncer(net::any_io_executor executor,
                               std::chrono::milliseconds quiet,
                               BatchHandler handler)
    : strand_(net::make_strand(executor)), timer_(strand_), quiet_(quiet),
      handler_(std::move(handler)) {}

void EventDebouncer::post(data::DeviceEvent event) {
  net::post(strand_, [this, ev = std::move(event)]() mutable {
    pending_.push_back(std::move(ev));
    arm();
  });
}

void EventDebouncer::arm() {
  const auto gen = ++generation_;
  timer_.expires_after(quiet_);
  timer_.async_wait(net::bind_executor(
      strand_, [this, gen](const boost::system::error_code &ec) {
        if (ec == net::error::operation_aborted || gen != generation_) {
          return;
        }
        deliver();
      }));
}

void EventDebouncer::deliver() {
  if (pending_.empty()) return;
  std::vector<data::DeviceEvent> batch;
  batch.swap(pending_);
  BOOST_LOG_TRIVIAL(trace) << "Delivering " << batch.size() << " device events";
  if (handler_) {
    handler_(batch);
  }
}

void EventDebouncer::drain() {
  std::promise<void> done;
  auto fut = done.get_future();
  net::post(strand_, [this, &done]() {
    ++generation_;
    timer_.cancel();
    deliver();
    done.set_value();
  });
  fut.wait();
}

} // namespace lanlens
