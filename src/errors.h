#pragma once

#include <string>

namespace meshchat {

/**
 * Failure categories reported by the delivery core
 */
enum class MeshError {
    None,
    ConnectionTimeout,      // Handshake did not complete in time
    ConnectionRejected,     // Malformed offer or answer
    SendFailed,             // Transport refused or dropped the payload
    RateLimited,            // Rate limiter denied the operation
    ValidationFailed,       // File policy rejected the attachment
    NotInitialized,         // Session not started or identity missing
    QueueFull               // Offline queue reached its capacity
};

const char* mesh_error_to_string(MeshError error);

/**
 * Outcome of an operation that may fail with a typed error
 */
struct OperationResult {
    bool success;
    MeshError error;
    std::string error_message;

    OperationResult() : success(true), error(MeshError::None) {}

    static OperationResult ok() { return OperationResult(); }

    static OperationResult failure(MeshError err, const std::string& message = "") {
        OperationResult result;
        result.success = false;
        result.error = err;
        result.error_message = message.empty() ? mesh_error_to_string(err) : message;
        return result;
    }

    explicit operator bool() const { return success; }
};

} // namespace meshchat
