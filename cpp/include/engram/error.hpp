#pragma once

#include <stdexcept>
#include <string>

namespace engram {

/**
 * Structured error reporting for the consolidation pipeline.
 * Every exception carries a code, the failing context and a recovery hint.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Store / collaborator I/O
    TRANSIENT_IO = 100,
    STORE_TIMEOUT = 101,
    POOL_EXHAUSTED = 102,
    COLLABORATOR_TIMEOUT = 103,

    // Record level
    DATA_INTEGRITY = 200,
    CONSTRAINT_VIOLATION = 201,
    HASH_MISMATCH = 202,

    // Contract level
    INVARIANT_VIOLATION = 300,

    // Coordination
    CONCURRENCY_CONFLICT = 400,

    // Startup
    CONFIGURATION = 500,

    // Stage could not make progress
    STAGE_FATAL = 600
};

class EngramException : public std::runtime_error {
public:
    explicit EngramException(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "engram error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += " (context: " + context + ")";
        }
        if (!suggestion.empty()) {
            result += " (suggestion: " + suggestion + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Network/store timeouts. Retried with backoff, then degraded.
class TransientIOError : public EngramException {
public:
    explicit TransientIOError(const std::string& message,
                              const std::string& context = "",
                              ErrorCode code = ErrorCode::TRANSIENT_IO)
        : EngramException(code, message, context, "retry with backoff") {}
};

// Malformed or missing fields, constraint and hash failures.
// The offending record is quarantined, never the whole batch.
class DataIntegrityError : public EngramException {
public:
    explicit DataIntegrityError(const std::string& message,
                                const std::string& record_id = "",
                                ErrorCode code = ErrorCode::DATA_INTEGRITY)
        : EngramException(code, message, record_id, "quarantine record")
        , record_id_(record_id) {}

    const std::string& record_id() const noexcept { return record_id_; }

private:
    std::string record_id_;
};

// A strength/rank outside its contract that could not be clamped.
class InvariantViolation : public EngramException {
public:
    explicit InvariantViolation(const std::string& message,
                                const std::string& record_id = "")
        : EngramException(ErrorCode::INVARIANT_VIOLATION, message, record_id,
                          "quarantine and alert")
        , record_id_(record_id) {}

    const std::string& record_id() const noexcept { return record_id_; }

private:
    std::string record_id_;
};

class ConcurrencyConflict : public EngramException {
public:
    explicit ConcurrencyConflict(const std::string& stage)
        : EngramException(ErrorCode::CONCURRENCY_CONFLICT,
                          "run lock already held", stage, "exit, another run is active") {}
};

class ConfigurationError : public EngramException {
public:
    explicit ConfigurationError(const std::string& message, const std::string& key = "")
        : EngramException(ErrorCode::CONFIGURATION, message, key, "fix configuration and restart") {}
};

// Raised when write-back cannot commit even at the minimum batch size.
class StageFatalError : public EngramException {
public:
    explicit StageFatalError(const std::string& message, const std::string& stage)
        : EngramException(ErrorCode::STAGE_FATAL, message, stage, "inspect store health") {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw EngramException(code, message, context, suggestion);
        }
    }

    static void check_config(bool condition, const std::string& key, const std::string& message) {
        if (!condition) {
            throw ConfigurationError(message, key);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name) {
        if (!ptr) {
            throw EngramException(ErrorCode::INVALID_ARGUMENT, "Null pointer: " + name);
        }
    }
};

#define ENGRAM_CHECK(condition, code, message) \
    engram::ErrorHandler::check_condition(condition, code, message, __func__)

#define ENGRAM_CHECK_ARGUMENT(condition, message) \
    ENGRAM_CHECK(condition, engram::ErrorCode::INVALID_ARGUMENT, message)

#define ENGRAM_CHECK_POINTER(ptr, name) \
    engram::ErrorHandler::check_pointer(ptr, name)

} // namespace engram
