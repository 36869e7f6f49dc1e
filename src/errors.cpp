#include "errors.h"

namespace meshchat {

const char* mesh_error_to_string(MeshError error) {
    switch (error) {
        case MeshError::None:               return "none";
        case MeshError::ConnectionTimeout:  return "connection timeout";
        case MeshError::ConnectionRejected: return "connection rejected";
        case MeshError::SendFailed:         return "send failed";
        case MeshError::RateLimited:        return "rate limited";
        case MeshError::ValidationFailed:   return "validation failed";
        case MeshError::NotInitialized:     return "not initialized";
        case MeshError::QueueFull:          return "offline queue is full";
        default:                            return "unknown";
    }
}

} // namespace meshchat
