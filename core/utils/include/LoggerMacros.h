/**
 * @file LoggerMacros.h
 * @brief Performance-optimized logging macros
 *
 * These macros prevent expensive string construction when logging is disabled.
 * Chunk-level tracing in the transfer pipeline should always go through the
 * *_IF variants.
 */

#pragma once

#include "Logger.h"

namespace TermXfer {

// Conditional logging macros - avoid string construction overhead
#define LOG_DEBUG_IF(msg) \
    do { \
        auto& logger__ = ::TermXfer::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::TermXfer::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_IF(msg) \
    do { \
        auto& logger__ = ::TermXfer::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::TermXfer::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

// Regular logging (always executes)
#define LOG_WARN(msg) ::TermXfer::Logger::instance().warn(msg)
#define LOG_ERROR(msg) ::TermXfer::Logger::instance().error(msg)
#define LOG_CRITICAL(msg) ::TermXfer::Logger::instance().critical(msg)

#define LOG_WARN_COMP(msg, component) ::TermXfer::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::TermXfer::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::TermXfer::Logger::instance().critical(msg, component)

} // namespace TermXfer
