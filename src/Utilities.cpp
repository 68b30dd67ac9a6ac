#include "Utilities.hpp"
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <mutex>
#include <thread>
#include <utility>

namespace fc {

// RNG Implementation
RNG::RNG(uint32_t seed) : gen_(seed) {
}

uint32_t RNG::randInt(uint32_t min, uint32_t max) {
    if (min >= max) return min;
    std::uniform_int_distribution<uint32_t> dist(min, max);
    return dist(gen_);
}

void RNG::shuffle(std::vector<uint32_t>& values) {
    if (values.size() < 2) return;
    for (size_t i = values.size() - 1; i > 0; --i) {
        size_t j = randInt(0, static_cast<uint32_t>(i));
        std::swap(values[i], values[j]);
    }
}

// Timer Implementation
Timer::Timer() : start_time_(currentTimeMillis()) {
}

uint64_t Timer::elapsedMillis() const {
    return currentTimeMillis() - start_time_;
}

// ArgParser Implementation
ArgParser::ArgParser(int argc, char* argv[]) {
    for (int i = 0; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

bool ArgParser::hasFlag(const std::string& flag) const {
    return std::find(args_.begin(), args_.end(), flag) != args_.end();
}

std::string ArgParser::getOption(const std::string& option, const std::string& default_value) const {
    auto it = std::find(args_.begin(), args_.end(), option);
    if (it != args_.end() && std::next(it) != args_.end()) {
        return *std::next(it);
    }
    return default_value;
}

int ArgParser::getIntOption(const std::string& option, int default_value) const {
    std::string value = getOption(option);
    if (value.empty()) return default_value;

    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return default_value;
    }
}

uint32_t ArgParser::getUIntOption(const std::string& option, uint32_t default_value) const {
    std::string value = getOption(option);
    if (value.empty() || value.front() == '-') return default_value;

    try {
        unsigned long parsed = std::stoul(value);
        if (parsed > UINT32_MAX) return default_value;
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        return default_value;
    }
}

// Utility functions
void runConcurrently(uint32_t thread_count, const std::function<void(uint32_t)>& body) {
    std::atomic<bool> go{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    std::vector<std::thread> workers;
    workers.reserve(thread_count);

    auto worker = [&](uint32_t index) {
        // Spin until every thread exists so the bodies really overlap
        while (!go.load(std::memory_order_acquire)) {
            std::this_thread::yield();
        }
        try {
            body(index);
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) first_error = std::current_exception();
        }
    };

    try {
        for (uint32_t i = 0; i < thread_count; ++i) {
            workers.emplace_back(worker, i);
        }
    } catch (...) {
        // Thread creation failed: release and join the ones already running
        go.store(true, std::memory_order_release);
        for (auto& t : workers) t.join();
        throw;
    }

    go.store(true, std::memory_order_release);
    for (auto& t : workers) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

uint64_t currentTimeMillis() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string formatRate(uint64_t calls, uint64_t duration_ms) {
    double per_sec = static_cast<double>(calls) * 1000.0 / static_cast<double>(std::max<uint64_t>(duration_ms, 1));

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << per_sec << " calls/s";
    return oss.str();
}

} // namespace fc
