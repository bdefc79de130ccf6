#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Time utilities (UTC)
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Math utilities
double clamp_unit(double value);                       // [-1, 1], NaN -> 0
double clamp_confidence(double value);                 // [0, 1], NaN -> 0
double safe_divide(double numerator, double denominator, double fallback = 0.0);

// Runs func(i) for i in [0, count) on up to worker_threads threads.
// The first exception thrown by any call is rethrown after all workers join.
template <typename Func>
void parallel_for(std::size_t count, int worker_threads, Func&& func) {
    if (worker_threads <= 1 || count < 2) {
        for (std::size_t i = 0; i < count; ++i) {
            func(i);
        }
        return;
    }

    std::size_t workers = std::min<std::size_t>(count, static_cast<std::size_t>(worker_threads));
    std::atomic<std::size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            for (std::size_t i = next++; i < count; i = next++) {
                try {
                    func(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace util
