#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace meetscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per failure class the pipeline distinguishes
 */
enum class ErrorCategory {
    TRANSIENT_BACKEND,   // Network hiccup or rate limit, retried
    EXHAUSTED_RETRY,     // Backend gave up, degraded result substituted
    STREAM_DISCONNECT,   // Connector lost its frame source
    SEGMENT_TIMEOUT,     // Segment force-finalized with placeholders
    FATAL_CONNECTOR,     // Meeting ended abnormally or connection rejected
    CONFIGURATION,
    ARCHIVE,
    SUMMARIZER,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception carrying an ErrorInfo
 */
class MeetScribeException : public std::exception {
public:
    explicit MeetScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ConfigException : public MeetScribeException {
public:
    ConfigException(const std::string& message, const std::string& details = "");
};

/**
 * Recoverable connector problem (the connector may still reconnect)
 */
class ConnectorException : public MeetScribeException {
public:
    ConnectorException(const std::string& message, const std::string& session_id = "");
};

/**
 * Meeting ended abnormally or the platform rejected the connection
 */
class FatalConnectorException : public MeetScribeException {
public:
    FatalConnectorException(const std::string& message, const std::string& session_id = "");
};

/**
 * Raised by engines that prefer exceptions over BackendResult; the workers
 * classify it as a transient failure unless marked permanent.
 */
class BackendException : public MeetScribeException {
public:
    BackendException(const std::string& message, bool permanent = false);
    bool isPermanent() const { return permanent_; }

private:
    bool permanent_;
};

class ArchiveException : public MeetScribeException {
public:
    ArchiveException(const std::string& message, const std::string& path = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error registry. Logs every reported error and keeps a bounded
 * history with per-category counts.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    size_t getErrorCount(ErrorCategory category) const;
    size_t getTotalErrorCount() const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    std::map<ErrorCategory, size_t> category_counts_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

std::string errorCategoryToString(ErrorCategory category);

} // namespace utils
} // namespace meetscribe
