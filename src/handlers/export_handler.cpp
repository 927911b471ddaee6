#include "handlers/export_handler.hpp"

namespace lanlens {

monad::MyVoidResult ExportHandler::start() {
  auto format_name = cli_ctx_.positional_at(1).value_or(
      cli_ctx_.params.format.empty() ? "json" : cli_ctx_.params.format);
  auto format = export_format_from_string(format_name);
  if (!format) {
    return monad::MyVoidResult::Err(monad::make_error(
        lanlens_errors::EXPORT::UNSUPPORTED_FORMAT,
        "Unsupported export format '" + format_name + "', use json or csv"));
  }

  if (auto loaded = registry_.load_from_store(); loaded.is_err()) {
    return monad::MyVoidResult::Err(loaded.error());
  }
  auto devices = registry_.get_all_devices();

  if (cli_ctx_.params.output.empty() || cli_ctx_.params.output == "-") {
    auto body = exporter_.export_devices(devices, *format);
    if (body.is_err()) {
      return monad::MyVoidResult::Err(body.error());
    }
    output_.out() << body.value() << std::endl;
    return monad::MyVoidResult::Ok();
  }

  auto written =
      exporter_.export_to_file(devices, *format, cli_ctx_.params.output);
  if (written.is_err()) {
    return monad::MyVoidResult::Err(written.error());
  }
  output_.info() << "Exported " << devices.size() << " devices to "
                 << written.value().string() << std::endl;
  return monad::MyVoidResult::Ok();
}

} // namespace lanlens
