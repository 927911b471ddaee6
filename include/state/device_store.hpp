#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/device.hpp"
#include "result_monad.hpp"
#include "state/sqlite_connection.hpp"

namespace lanlens {

// Snapshot persistence for the device registry.
class IDeviceStore {
public:
  virtual ~IDeviceStore() = default;

  virtual monad::MyResult<std::vector<data::Device>> load_all() const = 0;
  virtual std::optional<std::string> save(const data::Device &device) = 0;
  virtual std::optional<std::string> remove(const std::string &mac) = 0;
  virtual std::optional<std::string> clear() = 0;
  virtual bool available() const = 0;
};

class SqliteDeviceStore : public IDeviceStore {
public:
  explicit SqliteDeviceStore(ILanlensConfigProvider &config_provider);

  monad::MyResult<std::vector<data::Device>> load_all() const override;
  std::optional<std::string> save(const data::Device &device) override;
  std::optional<std::string> remove(const std::string &mac) override;
  std::optional<std::string> clear() override;
  bool available() const override;

private:
  bool ensure_initialized() const;

  ILanlensConfigProvider &config_provider_;
  mutable std::mutex mutex_;
  mutable std::unique_ptr<SqliteConnection> db_;
  mutable bool initialized_{false};
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
