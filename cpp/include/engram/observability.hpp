#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "engram/job_result.hpp"

namespace engram {

// One committed (or failed) write-back batch
struct BatchReport {
    std::string stage;
    int64_t processed = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;
    int64_t quarantined = 0;
    int64_t dead_lettered = 0;
    int64_t chunk_size = 0;
    double elapsed_ms = 0.0;
};

/**
 * Receiver of pipeline reports. Callers catch and log anything a sink
 * throws; a sink never stops a job.
 */
class ObservabilitySink {
public:
    virtual ~ObservabilitySink() = default;

    virtual void on_batch(const BatchReport& report) = 0;
    virtual void on_run(const JobResult& result) = 0;
};

using Labels = std::map<std::string, std::string>;

/**
 * Counters, gauges and histograms keyed by name and label set.
 * Thread-safe. Exported in Prometheus text format.
 */
class MetricsRegistry {
public:
    MetricsRegistry();
    ~MetricsRegistry();

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    void increment_counter(const std::string& name, const Labels& labels = {}, int64_t value = 1);
    void set_gauge(const std::string& name, double value, const Labels& labels = {});
    void record_histogram(const std::string& name, double value, const Labels& labels = {});

    int64_t counter(const std::string& name, const Labels& labels = {}) const;
    double gauge(const std::string& name, const Labels& labels = {}) const;
    size_t histogram_count(const std::string& name, const Labels& labels = {}) const;

    // Records elapsed milliseconds into a histogram on stop or destruction
    class Timer {
    public:
        Timer(MetricsRegistry& registry, std::string name, Labels labels = {});
        ~Timer();

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

        double stop();

    private:
        MetricsRegistry& registry_;
        std::string name_;
        Labels labels_;
        std::chrono::steady_clock::time_point start_;
        bool stopped_ = false;
    };

    std::string export_prometheus() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Feeds batch and run reports into a MetricsRegistry
class MetricsSink : public ObservabilitySink {
public:
    explicit MetricsSink(MetricsRegistry& registry) : registry_(registry) {}

    void on_batch(const BatchReport& report) override;
    void on_run(const JobResult& result) override;

private:
    MetricsRegistry& registry_;
};

// Writes reports through the Logger
class LoggingSink : public ObservabilitySink {
public:
    void on_batch(const BatchReport& report) override;
    void on_run(const JobResult& result) override;
};

} // namespace engram
