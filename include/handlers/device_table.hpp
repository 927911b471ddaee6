#pragma once

#include <ostream>
#include <vector>

#include "customio/console_output.hpp"
#include "data/device.hpp"
#include "data/scan_session.hpp"

namespace lanlens {

// Fixed width listing shared by the scan, listen and devices subcommands.
void print_device_table(customio::ConsoleOutput &output,
                        const std::vector<data::Device> &devices);

void print_device_detail(customio::ConsoleOutput &output,
                         const data::Device &device);

void print_session_summary(customio::ConsoleOutput &output,
                           const data::ScanSession &session);

} // namespace lanlens
