#pragma once

#include <atomic>
#include <boost/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#include "conf/lanlens_config.hpp"
#include "util/clock.hpp"

namespace testinfra {

namespace fs = std::filesystem;
namespace json = boost::json;

inline fs::path make_temp_dir(const std::string &prefix) {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  for (int attempt = 0; attempt < 16; ++attempt) {
    auto candidate = fs::temp_directory_path() /
                     (prefix + "-" + std::to_string(gen()));
    std::error_code ec;
    if (fs::create_directories(candidate, ec)) {
      return candidate;
    }
  }
  throw std::runtime_error("Unable to create temp dir for " + prefix);
}

// Temporary runtime directory removed when the test ends.
class TempDir {
  fs::path path_;

public:
  explicit TempDir(const std::string &prefix = "lanlens-test")
      : path_(make_temp_dir(prefix)) {}
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
};

inline void write_json(const fs::path &path, const json::object &obj) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << json::serialize(obj);
}

// Defaults with short timings so registry tests settle quickly.
inline lanlens::LanlensConfig make_test_config(const fs::path &runtime_dir) {
  lanlens::LanlensConfig config;
  config.verbose = "debug";
  config.runtime_dir = runtime_dir;
  config.fingerbank.api_key = "test-key";
  config.fingerbank.api_url =
      "https://fingerbank.test/api/v2/combinations/interrogate";
  config.discovery.event_debounce_ms = 10;
  config.discovery.scan_concurrency = 4;
  config.discovery.ssdp_listen_seconds = 1;
  return config;
}

// Clock the test moves by hand. Safe to read from worker threads.
class ManualClock {
  std::atomic<std::chrono::system_clock::rep> ticks_;

public:
  explicit ManualClock(std::chrono::system_clock::time_point start =
                           std::chrono::system_clock::time_point(
                               std::chrono::hours(24 * 20000)))
      : ticks_(start.time_since_epoch().count()) {}

  std::chrono::system_clock::time_point now() const {
    return std::chrono::system_clock::time_point(
        std::chrono::system_clock::duration(ticks_.load()));
  }
  void set(std::chrono::system_clock::time_point tp) {
    ticks_ = tp.time_since_epoch().count();
  }
  template <typename Rep, typename Period>
  void advance(std::chrono::duration<Rep, Period> d) {
    ticks_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(d)
                  .count();
  }

  lanlens::WallClock fn() const {
    return [this] { return now(); };
  }
};

} // namespace testinfra
