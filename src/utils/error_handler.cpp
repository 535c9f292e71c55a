#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <random>

namespace meetscribe {
namespace utils {

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

MeetScribeException::MeetScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* MeetScribeException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ConfigException::ConfigException(const std::string& message, const std::string& details)
    : MeetScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                    message, details, "Configuration")) {
}

ConnectorException::ConnectorException(const std::string& message, const std::string& session_id)
    : MeetScribeException(ErrorInfo(ErrorCategory::STREAM_DISCONNECT, ErrorSeverity::WARNING,
                                    message, "", "Connector", session_id)) {
}

FatalConnectorException::FatalConnectorException(const std::string& message, const std::string& session_id)
    : MeetScribeException(ErrorInfo(ErrorCategory::FATAL_CONNECTOR, ErrorSeverity::CRITICAL,
                                    message, "", "Connector", session_id)) {
}

BackendException::BackendException(const std::string& message, bool permanent)
    : MeetScribeException(ErrorInfo(permanent ? ErrorCategory::EXHAUSTED_RETRY
                                              : ErrorCategory::TRANSIENT_BACKEND,
                                    ErrorSeverity::WARNING, message, "", "Backend")),
      permanent_(permanent) {
}

ArchiveException::ArchiveException(const std::string& message, const std::string& path)
    : MeetScribeException(ErrorInfo(ErrorCategory::ARCHIVE, ErrorSeverity::ERROR,
                                    message, path, "Archive")) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        category_counts_[error.category]++;
        callback = error_callback_;
    }

    // Invoked without the lock so the callback may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    if (auto* known = dynamic_cast<const MeetScribeException*>(&e)) {
        ErrorInfo info = known->getErrorInfo();
        if (!context.empty()) {
            info.context = context;
        }
        if (!session_id.empty()) {
            info.session_id = session_id;
        }
        reportError(info);
        return;
    }

    reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, session_id));
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = category_counts_.find(category);
    return it == category_counts_.end() ? 0 : it->second;
}

size_t ErrorHandler::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : category_counts_) {
        total += entry.second;
    }
    return total;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
    category_counts_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = max_size == 0 ? 1 : max_size;
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << errorCategoryToString(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

std::string errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::TRANSIENT_BACKEND: return "TransientBackend";
        case ErrorCategory::EXHAUSTED_RETRY: return "ExhaustedRetry";
        case ErrorCategory::STREAM_DISCONNECT: return "StreamDisconnect";
        case ErrorCategory::SEGMENT_TIMEOUT: return "SegmentTimeout";
        case ErrorCategory::FATAL_CONNECTOR: return "FatalConnector";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::ARCHIVE: return "Archive";
        case ErrorCategory::SUMMARIZER: return "Summarizer";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

} // namespace utils
} // namespace meetscribe
