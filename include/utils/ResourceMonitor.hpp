#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "utils/Logger.hpp"

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace DmrScan {
namespace Utils {

/**
 * @brief Wall-clock and memory usage reporter for a run or a test.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Bytes currently allocated through jemalloc, 0 without jemalloc
    size_t get_allocated_bytes() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    // Peak resident set size of the process in MB
    double get_peak_rss_mb() const {
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0.0;
        }
        return usage.ru_maxrss / 1024.0;  // ru_maxrss is in KB on Linux
    }

    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s"
           << ", Peak RSS: " << std::setprecision(1) << get_peak_rss_mb() << " MB";
#ifdef USE_JEMALLOC
        ss << ", Allocated: " << std::setprecision(2) << (get_allocated_bytes() / 1024.0 / 1024.0) << " MB";
#endif
        return ss.str();
    }

    void print_stats(const std::string& label = "Execution") const {
        LOG_INFO(format_stats(label));
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace DmrScan
