#pragma once

#include <string>
#include <utility>

namespace meetscribe {
namespace core {

/**
 * Classified outcome of one inference backend call
 */
enum class BackendStatus {
    OK,
    TRANSIENT_FAILURE,   // Network hiccup, rate limit: worth retrying
    PERMANENT_FAILURE,   // Rejected input, misconfiguration: retrying is pointless
    CANCELLED            // Pipeline stop cancelled the call
};

/**
 * Result of a backend call: either a payload or a classified failure.
 * Engines return this instead of throwing so the workers can apply the
 * retry and degradation policy uniformly.
 */
template <typename T>
struct BackendResult {
    BackendStatus status = BackendStatus::TRANSIENT_FAILURE;
    T value{};
    std::string errorMessage;

    bool ok() const { return status == BackendStatus::OK; }
    bool isRetryable() const { return status == BackendStatus::TRANSIENT_FAILURE; }

    static BackendResult success(T payload) {
        BackendResult result;
        result.status = BackendStatus::OK;
        result.value = std::move(payload);
        return result;
    }

    static BackendResult transientFailure(const std::string& message) {
        BackendResult result;
        result.status = BackendStatus::TRANSIENT_FAILURE;
        result.errorMessage = message;
        return result;
    }

    static BackendResult permanentFailure(const std::string& message) {
        BackendResult result;
        result.status = BackendStatus::PERMANENT_FAILURE;
        result.errorMessage = message;
        return result;
    }

    static BackendResult cancelled() {
        BackendResult result;
        result.status = BackendStatus::CANCELLED;
        result.errorMessage = "cancelled";
        return result;
    }
};

inline const char* backendStatusToString(BackendStatus status) {
    switch (status) {
        case BackendStatus::OK: return "ok";
        case BackendStatus::TRANSIENT_FAILURE: return "transient_failure";
        case BackendStatus::PERMANENT_FAILURE: return "permanent_failure";
        case BackendStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace core
} // namespace meetscribe
