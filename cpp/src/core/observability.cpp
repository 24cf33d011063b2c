#include "engram/observability.hpp"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <numeric>
#include <sstream>
#include <vector>

#include "engram/logging.hpp"

namespace engram {

namespace {

using SeriesKey = std::pair<std::string, Labels>;

std::string render_labels(const Labels& labels, const std::string& extra = "") {
    if (labels.empty() && extra.empty()) return "";
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) out += ',';
        out += k + "=\"" + v + "\"";
        first = false;
    }
    if (!extra.empty()) {
        if (!first) out += ',';
        out += extra;
    }
    return out + "}";
}

double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    const auto idx = static_cast<size_t>(q * static_cast<double>(sorted.size() - 1));
    return sorted[idx];
}

} // namespace

// =============================================================================
// MetricsRegistry
// =============================================================================

class MetricsRegistry::Impl {
public:
    std::map<SeriesKey, int64_t> counters;
    std::map<SeriesKey, double> gauges;
    std::map<SeriesKey, std::vector<double>> histograms;
    mutable std::mutex mutex;
};

MetricsRegistry::MetricsRegistry() : impl_(std::make_unique<Impl>()) {}

MetricsRegistry::~MetricsRegistry() = default;

void MetricsRegistry::increment_counter(const std::string& name, const Labels& labels, int64_t value) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->counters[{name, labels}] += value;
}

void MetricsRegistry::set_gauge(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->gauges[{name, labels}] = value;
}

void MetricsRegistry::record_histogram(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->histograms[{name, labels}].push_back(value);
}

int64_t MetricsRegistry::counter(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->counters.find({name, labels});
    return it == impl_->counters.end() ? 0 : it->second;
}

double MetricsRegistry::gauge(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->gauges.find({name, labels});
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

size_t MetricsRegistry::histogram_count(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->histograms.find({name, labels});
    return it == impl_->histograms.end() ? 0 : it->second.size();
}

MetricsRegistry::Timer::Timer(MetricsRegistry& registry, std::string name, Labels labels)
    : registry_(registry)
    , name_(std::move(name))
    , labels_(std::move(labels))
    , start_(std::chrono::steady_clock::now()) {}

MetricsRegistry::Timer::~Timer() {
    if (!stopped_) {
        stop();
    }
}

double MetricsRegistry::Timer::stop() {
    const auto end = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(end - start_).count();
    if (!stopped_) {
        registry_.record_histogram(name_, ms, labels_);
        stopped_ = true;
    }
    return ms;
}

std::string MetricsRegistry::export_prometheus() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::ostringstream oss;

    std::string last;
    for (const auto& [key, value] : impl_->counters) {
        if (key.first != last) {
            oss << "# TYPE " << key.first << "_total counter\n";
            last = key.first;
        }
        oss << key.first << "_total" << render_labels(key.second) << ' ' << value << '\n';
    }

    last.clear();
    for (const auto& [key, value] : impl_->gauges) {
        if (key.first != last) {
            oss << "# TYPE " << key.first << " gauge\n";
            last = key.first;
        }
        oss << key.first << render_labels(key.second) << ' ' << std::fixed << std::setprecision(6)
            << value << '\n';
    }

    last.clear();
    for (const auto& [key, samples] : impl_->histograms) {
        if (key.first != last) {
            oss << "# TYPE " << key.first << " summary\n";
            last = key.first;
        }
        std::vector<double> sorted = samples;
        std::sort(sorted.begin(), sorted.end());
        for (const char* q : {"0.5", "0.9", "0.99"}) {
            oss << key.first << render_labels(key.second, std::string("quantile=\"") + q + "\"") << ' '
                << std::fixed << std::setprecision(6) << quantile(sorted, std::stod(q)) << '\n';
        }
        oss << key.first << "_sum" << render_labels(key.second) << ' ' << std::fixed << std::setprecision(6)
            << std::accumulate(sorted.begin(), sorted.end(), 0.0) << '\n';
        oss << key.first << "_count" << render_labels(key.second) << ' ' << sorted.size() << '\n';
    }

    return oss.str();
}

// =============================================================================
// Sinks
// =============================================================================

void MetricsSink::on_batch(const BatchReport& report) {
    const Labels labels{{"stage", report.stage}};
    registry_.increment_counter("engram_records_processed", labels, report.processed);
    registry_.increment_counter("engram_records_succeeded", labels, report.succeeded);
    registry_.increment_counter("engram_records_failed", labels, report.failed);
    registry_.increment_counter("engram_records_quarantined", labels, report.quarantined);
    registry_.increment_counter("engram_records_dead_lettered", labels, report.dead_lettered);
    registry_.record_histogram("engram_batch_duration_ms", report.elapsed_ms, labels);
    registry_.set_gauge("engram_batch_size", static_cast<double>(report.chunk_size), labels);
}

void MetricsSink::on_run(const JobResult& result) {
    registry_.increment_counter("engram_runs", {{"stage", result.stage}, {"status", to_string(result.status)}});
    registry_.record_histogram("engram_run_duration_ms", result.elapsed_ms, {{"stage", result.stage}});
}

void LoggingSink::on_batch(const BatchReport& report) {
    LOG_INFO("batch committed", kv("stage", report.stage), kv("processed", report.processed),
             kv("succeeded", report.succeeded), kv("failed", report.failed),
             kv("quarantined", report.quarantined), kv("dead_lettered", report.dead_lettered),
             kv("elapsed_ms", report.elapsed_ms));
}

void LoggingSink::on_run(const JobResult& result) {
    LOG_INFO("run finished", kv("stage", result.stage), kv("status", to_string(result.status)),
             kv("processed", result.records_processed), kv("quarantined", result.records_quarantined),
             kv("dead_lettered", result.records_dead_lettered), kv("batches", result.batches),
             kv("elapsed_ms", result.elapsed_ms));
    for (const auto& e : result.errors) {
        LOG_WARN("run error", kv("stage", result.stage), kv("error", e));
    }
}

} // namespace engram
