/**
 * @file procfs_probe.cpp
 * @brief /proc based process sampling
 */

#include "secbox/monitor.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace secbox::monitor {

namespace {

/// Field index of utime in /proc/<pid>/stat counted from the state field
constexpr int kUtimeIndex = 11;

[[nodiscard]] secbox::Error probe_failed(int pid, std::string_view what)
{
    return Error::make("ProbeFailed", std::format("Cannot read {} of process {}", what, pid));
}

}  // namespace

secbox::Result<ProcessSample> ProcfsProbe::sample(int pid)
{
    std::ifstream stat_file(std::format("/proc/{}/stat", pid));
    std::string stat;
    if (!stat_file || !std::getline(stat_file, stat)) {
        return std::unexpected(probe_failed(pid, "stat"));
    }
    // comm may contain spaces and parentheses; fields resume after the last ')'
    const auto close = stat.rfind(')');
    if (close == std::string::npos) {
        return std::unexpected(probe_failed(pid, "stat"));
    }
    std::istringstream fields(stat.substr(close + 1));
    std::string field;
    unsigned long long utime = 0;
    unsigned long long stime = 0;
    for (int index = 0; fields >> field && index <= kUtimeIndex + 1; ++index) {
        auto* target = index == kUtimeIndex ? &utime : index == kUtimeIndex + 1 ? &stime : nullptr;
        if (target == nullptr) {
            continue;
        }
        const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), *target);
        if (ec != std::errc{}) {
            return std::unexpected(probe_failed(pid, "stat"));
        }
    }

    std::ifstream statm_file(std::format("/proc/{}/statm", pid));
    unsigned long long size_pages = 0;
    unsigned long long resident_pages = 0;
    if (!statm_file || !(statm_file >> size_pages >> resident_pages)) {
        return std::unexpected(probe_failed(pid, "statm"));
    }

    static const auto ticks_per_second = static_cast<double>(::sysconf(_SC_CLK_TCK));
    static const auto page_size = static_cast<double>(::sysconf(_SC_PAGESIZE));
    return ProcessSample{.rss_mb = static_cast<double>(resident_pages) * page_size / (1'024.0 * 1'024.0),
                         .cpu_time_ms = static_cast<double>(utime + stime) * 1'000.0 / ticks_per_second};
}

}  // namespace secbox::monitor
