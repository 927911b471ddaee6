#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <string>

namespace lanlens {
namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"/var/lib/lanlens/logs"};
  std::string log_file{"lanlens"};
  uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    LoggingConfig lc{};
    if (auto *jo = jv.if_object()) {
      if (auto *p = jo->if_contains("level"))
        lc.level = p->as_string().c_str();
      if (auto *p = jo->if_contains("log_dir"))
        lc.log_dir = p->as_string().c_str();
      if (auto *p = jo->if_contains("log_file"))
        lc.log_file = p->as_string().c_str();
      if (auto *p = jo->if_contains("rotation_size"))
        lc.rotation_size = p->to_number<uint64_t>();
    }
    return lc;
  }

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const LoggingConfig &lc) {
    jv = json::object{{"level", lc.level},
                      {"log_dir", lc.log_dir},
                      {"log_file", lc.log_file},
                      {"rotation_size", lc.rotation_size}};
  }
};

} // namespace lanlens
