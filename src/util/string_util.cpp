#include "util/string_util.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fstream>
#include <mutex>
#include <sstream>

namespace lanlens {
namespace stringutil {

std::string generate_uuid(const std::string& prefix, bool no_dash) {
  static std::mutex generator_mutex;
  static boost::uuids::random_generator generator;
  std::string v;
  {
    std::lock_guard<std::mutex> lock(generator_mutex);
    v = boost::uuids::to_string(generator());
  }
  if (no_dash) {
    // remove the dash -
    v.erase(std::remove(v.begin(), v.end(), '-'), v.end());
  }
  return prefix + v;
}

std::vector<std::string> split_trim(const std::string& str, char delim,
                                    bool skip_empty) {
  std::vector<std::string> out;
  std::string token;
  std::istringstream iss(str);
  while (std::getline(iss, token, delim)) {
    trim(token);
    if (skip_empty && token.empty()) continue;
    out.push_back(std::move(token));
  }
  return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(sep);
    out.append(parts[i]);
  }
  return out;
}

std::string replace_all(std::string input, std::string_view from,
                        std::string_view to) {
  if (from.empty()) return input;
  size_t pos = 0;
  while ((pos = input.find(from, pos)) != std::string::npos) {
    input.replace(pos, from.size(), to);
    pos += to.size();
  }
  return input;
}

std::optional<std::chrono::system_clock::time_point> parseISO8601(
    const std::string& iso8601) {
  std::istringstream in(iso8601);
  date::sys_time<std::chrono::seconds> tp;
  in >> date::parse("%Y-%m-%dT%H:%M:%S", tp);
  if (in.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::time_point(tp);
}

std::string readFile(const std::string& filePath, std::error_code& ec) {
  std::ifstream file(filePath, std::ios::in | std::ios::binary);
  if (!file) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace stringutil
}  // namespace lanlens
