// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Logging setup and string helpers for messages

#pragma once

#include "eigen.h"

#include <spdlog/pattern_formatter.h>
#include <string>
#include <vector>

namespace rtcomp {

// spdlog flag that prints the level as [warning], [error], etc. and
// nothing for info messages
class rtcomp_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Time-stamped pattern for the default logger and a "plain" logger
// that prints only the message. Safe to call more than once.
auto initLogging() -> void;

// Boxed section title on the plain logger, e.g.
//
// ##############################
// # Radiative transfer engines #
// ##############################
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Used for listing the valid options in error messages
auto joinStrings(const std::vector<std::string>& strings,
                 const std::string& delimiter) -> std::string;

// ASCII lower case
auto lower(const std::string& str) -> std::string;

// Short representation of an array for log messages, e.g.
// [0.5, 1, 1.5].
auto arrayToString(const Eigen::ArrayXd& array) -> std::string;

} // namespace rtcomp
