#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace engram {

enum class JobStatus {
    Succeeded,
    // Finished, some records quarantined or dead-lettered
    PartialSuccess,
    // Another instance holds the stage lock; not an error
    AlreadyRunning,
    Cancelled,
    Failed
};

inline const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::PartialSuccess: return "partial_success";
        case JobStatus::AlreadyRunning: return "already_running";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

struct JobResult {
    std::string stage;
    JobStatus status = JobStatus::Succeeded;
    int64_t records_processed = 0;
    int64_t records_succeeded = 0;
    int64_t records_quarantined = 0;
    int64_t records_dead_lettered = 0;
    int64_t batches = 0;
    double elapsed_ms = 0.0;
    std::vector<std::string> errors;
};

} // namespace engram
