// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rtcomp {

auto rtcomp_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                   const std::tm& /* tm_time */,
                                   spdlog::memory_buf_t& dest) -> void
{
    // Informational messages carry no label
    if (log_msg.level == spdlog::level::info) {
        return;
    }
    const auto label { fmt::format(
      " [{}]", spdlog::level::to_string_view(log_msg.level)) };
    dest.append(label.data(), label.data() + label.size());
}

auto rtcomp_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<rtcomp_formatter_flag>();
}

auto initLogging() -> void
{
    static std::once_flag init_flag {};
    std::call_once(init_flag, [] {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<rtcomp_formatter_flag>('*');
        formatter->set_pattern("[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        // Logger for headings and tables without time stamps
        if (!spdlog::get("plain")) {
            spdlog::stdout_color_mt("plain")->set_pattern("%v");
        }
        spdlog::set_level(spdlog::level::info);
    });
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    initLogging();
    const auto plain { spdlog::get("plain") };
    if (incl_empty_line) {
        plain->info("");
    }
    const std::string border(heading.size() + 4, '#');
    plain->info("{}\n# {} #\n{}", border, heading, border);
}

auto joinStrings(const std::vector<std::string>& strings,
                 const std::string& delimiter) -> std::string
{
    return fmt::format("{}", fmt::join(strings, delimiter));
}

auto lower(const std::string& str) -> std::string
{
    std::string result(str.size(), ' ');
    std::ranges::transform(str, result.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto arrayToString(const Eigen::ArrayXd& array) -> std::string
{
    return fmt::format(
      "[{}]", fmt::join(array.data(), array.data() + array.size(), ", "));
}

} // namespace rtcomp
