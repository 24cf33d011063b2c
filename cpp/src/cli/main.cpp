// =============================================================================
// engram_job - Scheduled entry point for the consolidation pipeline
// =============================================================================
//
// Usage:
//   engram_job <command> [options]
//
// Commands:
//   working_memory      Admit raw memories into working memory
//   short_term_memory   Group active items into episodes
//   consolidation       Replay ready episodes, promote to long-term
//   long_term_memory    Place consolidated memories in the semantic network
//   homeostasis         Rescale retrieval and prune weak remote nodes
//   recluster           Full k-means over every semantic node
//   all                 The four incremental stages in order
//   access <node_id>    Record a retrieval of a semantic node
//   schema              Create missing tables
//
// Options:
//   -c, --config <path>   key = value configuration file
//   --metrics             Print Prometheus metrics after the run
//   -v, --verbose         Debug logging
//
// Exit codes: 0 success or already running, 2 partial success,
// 3 cancelled, 1 failure, 64 usage error.
//
// =============================================================================

#include <algorithm>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "engram/clock.hpp"
#include "engram/config.hpp"
#include "engram/db/pg_store.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/observability.hpp"
#include "engram/pipeline.hpp"

#define ENGRAM_VERSION_STRING "1.0.0"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_PARTIAL = 2;
constexpr int EXIT_CANCELLED = 3;
constexpr int EXIT_USAGE = 64;

struct GlobalOptions {
    std::string config_path;
    bool metrics = false;
    bool verbose = false;
};

GlobalOptions g_options;
engram::CancellationToken g_cancel;

void on_signal(int) {
    g_cancel.cancel();
}

int exit_code(engram::JobStatus status) {
    switch (status) {
        case engram::JobStatus::Succeeded:
        case engram::JobStatus::AlreadyRunning:
            return EXIT_OK;
        case engram::JobStatus::PartialSuccess:
            return EXIT_PARTIAL;
        case engram::JobStatus::Cancelled:
            return EXIT_CANCELLED;
        case engram::JobStatus::Failed:
            return EXIT_FAILED;
    }
    return EXIT_FAILED;
}

void print_result(const engram::JobResult& r) {
    std::cout << r.stage << ": " << engram::to_string(r.status)
              << " processed=" << r.records_processed
              << " succeeded=" << r.records_succeeded
              << " quarantined=" << r.records_quarantined
              << " dead_lettered=" << r.records_dead_lettered
              << " batches=" << r.batches
              << " elapsed_ms=" << static_cast<int64_t>(r.elapsed_ms) << "\n";
    for (const auto& e : r.errors) {
        std::cout << "  error: " << e << "\n";
    }
}

// Everything a command needs, built from the loaded configuration
struct Job {
    engram::PipelineConfig config;
    engram::SystemClock clock;
    engram::MetricsRegistry metrics;
    engram::MetricsSink metrics_sink{metrics};
    engram::LoggingSink logging_sink;

    // Fans batch and run reports out to logs and metrics
    class Tee : public engram::ObservabilitySink {
    public:
        Tee(engram::ObservabilitySink& a, engram::ObservabilitySink& b) : a_(a), b_(b) {}
        void on_batch(const engram::BatchReport& report) override {
            a_.on_batch(report);
            b_.on_batch(report);
        }
        void on_run(const engram::JobResult& result) override {
            a_.on_run(result);
            b_.on_run(result);
        }

    private:
        engram::ObservabilitySink& a_;
        engram::ObservabilitySink& b_;
    };
    Tee sink{logging_sink, metrics_sink};

    explicit Job(engram::PipelineConfig c) : config(std::move(c)) {}
};

void configure_logging(const engram::PipelineConfig& config) {
    auto& logger = engram::Logger::getInstance();
    logger.setLevel(engram::parse_log_level(config.log_level, engram::LogLevel::INFO));
    if (!config.log_file.empty() && !logger.setFile(config.log_file)) {
        LOG_WARN("cannot open log file, logging to stderr", engram::kv("path", config.log_file));
    }
    logger.configureFromEnv();
    if (g_options.verbose) logger.setLevel(engram::LogLevel::DEBUG);
}

int run_command(const std::string& command, const std::vector<std::string>& args) {
    engram::PipelineConfig config;
    try {
        config = engram::load_config(g_options.config_path);
    } catch (const engram::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return EXIT_FAILED;
    }
    configure_logging(config);

    Job job(std::move(config));
    try {
        engram::db::PgStore store(job.config.database);
        store.ensure_schema();

        engram::Collaborators collaborators;
        collaborators.sink = &job.sink;
        engram::Pipeline pipeline(store, job.config, job.clock, collaborators);

        int rc = EXIT_OK;
        if (command == "schema") {
            std::cout << "schema ready\n";
        } else if (command == "access") {
            if (args.empty()) {
                std::cerr << "Usage: engram_job access <node_id>\n";
                return EXIT_USAGE;
            }
            pipeline.record_access(args[0], job.clock.now());
        } else if (command == "all") {
            for (const auto& r : pipeline.run_all(&g_cancel)) {
                print_result(r);
                rc = std::max(rc, exit_code(r.status));
            }
        } else {
            const auto r = pipeline.run_stage(command, &g_cancel);
            print_result(r);
            rc = exit_code(r.status);
        }

        if (g_options.metrics) std::cout << job.metrics.export_prometheus();
        return rc;
    } catch (const engram::EngramException& e) {
        LOG_ERROR("job aborted", engram::kv("command", command), engram::kv("error", e.what()));
        std::cerr << e.what() << "\n";
        return EXIT_FAILED;
    }
}

void print_help() {
    std::cout << "engram_job - memory consolidation pipeline\n";
    std::cout << "Version " << ENGRAM_VERSION_STRING << "\n\n";
    std::cout << "Usage: engram_job <command> [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& name : engram::Pipeline::stage_names()) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "  all\n  access <node_id>\n  schema\n  version\n  help\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>   Configuration file (ENGRAM_* variables override it)\n";
    std::cout << "  --metrics             Print Prometheus metrics after the run\n";
    std::cout << "  -v, --verbose         Debug logging\n";
}

bool is_command(const std::string& name) {
    if (name == "all" || name == "access" || name == "schema") return true;
    for (const auto& s : engram::Pipeline::stage_names()) {
        if (s == name) return true;
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << argv[i] << "\n";
                return EXIT_USAGE;
            }
            g_options.config_path = argv[++i];
        } else if (strcmp(argv[i], "--metrics") == 0) {
            g_options.metrics = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            g_options.verbose = true;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (command.empty() || command == "help" || command == "--help" || command == "-h") {
        print_help();
        return command.empty() ? EXIT_USAGE : EXIT_OK;
    }
    if (command == "version") {
        std::cout << "engram_job " << ENGRAM_VERSION_STRING << "\n";
        return EXIT_OK;
    }
    if (!is_command(command)) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'engram_job help' for usage.\n";
        return EXIT_USAGE;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    return run_command(command, args);
}
