#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <sstream>
#include <string>

#include "logger.h"

/**
 * Per-run state handed to every store operation: logger, metrics and clock.
 */
namespace playledger {

/**
 * Named counters and accumulated stage timings for one run.
 */
class Metrics {
public:
    void add(const std::string& counter, int64_t delta = 1) {
        counters_[counter] += delta;
    }

    int64_t get(const std::string& counter) const {
        auto it = counters_.find(counter);
        return it == counters_.end() ? 0 : it->second;
    }

    void add_time_ms(const std::string& stage, int64_t ms) {
        timings_ms_[stage] += ms;
    }

    int64_t time_ms(const std::string& stage) const {
        auto it = timings_ms_.find(stage);
        return it == timings_ms_.end() ? 0 : it->second;
    }

    const std::map<std::string, int64_t>& counters() const { return counters_; }
    const std::map<std::string, int64_t>& timings_ms() const { return timings_ms_; }

    /**
     * Multi-line summary, one "name: value" per line.
     */
    std::string summary() const {
        std::ostringstream out;
        out << "Metrics:";
        for (const auto& [name, value] : counters_) {
            out << "\n    " << name << ": " << value;
        }
        for (const auto& [name, ms] : timings_ms_) {
            out << "\n    " << name << ": " << ms << "ms";
        }
        return out.str();
    }

private:
    std::map<std::string, int64_t> counters_;
    std::map<std::string, int64_t> timings_ms_;
};

/**
 * Caller-owned context. Construct one per pipeline run (or per test).
 */
class RunContext {
public:
    // Microseconds since the Unix epoch
    using Clock = std::function<int64_t()>;

    explicit RunContext(std::ostream* log_sink = &std::cerr,
                        LogLevel level = LogLevel::INFO)
        : logger_(log_sink, level), clock_(&RunContext::system_now_us) {}

    Logger& logger() { return logger_; }
    Metrics& metrics() { return metrics_; }
    const Metrics& metrics() const { return metrics_; }

    int64_t now_us() const { return clock_(); }

    /**
     * Replace the clock (tests pin "now" for recency windows).
     */
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    static int64_t system_now_us() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

private:
    Logger logger_;
    Metrics metrics_;
    Clock clock_;
};

/**
 * Adds the elapsed wall time of a scope to a metrics stage on destruction.
 */
class StageTimer {
public:
    StageTimer(RunContext& ctx, std::string stage)
        : ctx_(ctx), stage_(std::move(stage)),
          start_(std::chrono::steady_clock::now()) {}

    ~StageTimer() {
        ctx_.metrics().add_time_ms(stage_,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count());
    }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    RunContext& ctx_;
    std::string stage_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace playledger
