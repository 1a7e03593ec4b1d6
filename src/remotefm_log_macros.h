/**
 * @file remotefm_log_macros.h
 * @brief Shared logging macros for the file manager sources.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different FileManager instances can be distinguished.
 */

#ifndef REMOTEFM_LOG_MACROS_H
#define REMOTEFM_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_FM_DEBUG(message) LOG_DEBUG("filemanager", "[pointer: " << this << "] " << message)
#define LOG_FM_INFO(message)  LOG_INFO("filemanager", "[pointer: " << this << "] " << message)
#define LOG_FM_WARN(message)  LOG_WARN("filemanager", "[pointer: " << this << "] " << message)
#define LOG_FM_ERROR(message) LOG_ERROR("filemanager", "[pointer: " << this << "] " << message)
#else
#define LOG_FM_DEBUG(message) LOG_DEBUG("filemanager", message)
#define LOG_FM_INFO(message)  LOG_INFO("filemanager", message)
#define LOG_FM_WARN(message)  LOG_WARN("filemanager", message)
#define LOG_FM_ERROR(message) LOG_ERROR("filemanager", message)
#endif

#endif // REMOTEFM_LOG_MACROS_H
