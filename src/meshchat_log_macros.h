 /**
 * @file meshchat_log_macros.h
 * @brief Per-component logging macros shared by the meshchat sources.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different sessions in one test binary can be told apart.
 */

#ifndef MESHCHAT_LOG_MACROS_H
#define MESHCHAT_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define MESHCHAT_LOG_TAG "[pointer: " << this << "] "
#else
#define MESHCHAT_LOG_TAG ""
#endif

#define LOG_ORCH_DEBUG(message) LOG_DEBUG("orchestrator", MESHCHAT_LOG_TAG << message)
#define LOG_ORCH_INFO(message)  LOG_INFO("orchestrator", MESHCHAT_LOG_TAG << message)
#define LOG_ORCH_WARN(message)  LOG_WARN("orchestrator", MESHCHAT_LOG_TAG << message)
#define LOG_ORCH_ERROR(message) LOG_ERROR("orchestrator", MESHCHAT_LOG_TAG << message)

#define LOG_PIPELINE_DEBUG(message) LOG_DEBUG("pipeline", MESHCHAT_LOG_TAG << message)
#define LOG_PIPELINE_INFO(message)  LOG_INFO("pipeline", MESHCHAT_LOG_TAG << message)
#define LOG_PIPELINE_WARN(message)  LOG_WARN("pipeline", MESHCHAT_LOG_TAG << message)
#define LOG_PIPELINE_ERROR(message) LOG_ERROR("pipeline", MESHCHAT_LOG_TAG << message)

#define LOG_DISCOVERY_DEBUG(message) LOG_DEBUG("discovery", MESHCHAT_LOG_TAG << message)
#define LOG_DISCOVERY_INFO(message)  LOG_INFO("discovery", MESHCHAT_LOG_TAG << message)
#define LOG_DISCOVERY_WARN(message)  LOG_WARN("discovery", MESHCHAT_LOG_TAG << message)
#define LOG_DISCOVERY_ERROR(message) LOG_ERROR("discovery", MESHCHAT_LOG_TAG << message)

#define LOG_QUEUE_DEBUG(message) LOG_DEBUG("queue", MESHCHAT_LOG_TAG << message)
#define LOG_QUEUE_INFO(message)  LOG_INFO("queue", MESHCHAT_LOG_TAG << message)
#define LOG_QUEUE_WARN(message)  LOG_WARN("queue", MESHCHAT_LOG_TAG << message)
#define LOG_QUEUE_ERROR(message) LOG_ERROR("queue", MESHCHAT_LOG_TAG << message)

#define LOG_RELAY_DEBUG(message) LOG_DEBUG("relay", MESHCHAT_LOG_TAG << message)
#define LOG_RELAY_INFO(message)  LOG_INFO("relay", MESHCHAT_LOG_TAG << message)
#define LOG_RELAY_WARN(message)  LOG_WARN("relay", MESHCHAT_LOG_TAG << message)
#define LOG_RELAY_ERROR(message) LOG_ERROR("relay", MESHCHAT_LOG_TAG << message)

#define LOG_SESSION_DEBUG(message) LOG_DEBUG("session", MESHCHAT_LOG_TAG << message)
#define LOG_SESSION_INFO(message)  LOG_INFO("session", MESHCHAT_LOG_TAG << message)
#define LOG_SESSION_WARN(message)  LOG_WARN("session", MESHCHAT_LOG_TAG << message)
#define LOG_SESSION_ERROR(message) LOG_ERROR("session", MESHCHAT_LOG_TAG << message)

// Free functions have no `this`
#define LOG_CODEC_DEBUG(message) LOG_DEBUG("codec", message)
#define LOG_CODEC_INFO(message)  LOG_INFO("codec", message)
#define LOG_CODEC_WARN(message)  LOG_WARN("codec", message)
#define LOG_CODEC_ERROR(message) LOG_ERROR("codec", message)

#endif // MESHCHAT_LOG_MACROS_H
