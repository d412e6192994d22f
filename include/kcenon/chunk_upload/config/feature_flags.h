// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for chunk_upload_system
 *
 * Central entry point for feature detection in the chunk_upload_system
 * library. Include this header to get access to all CHUNK_UPLOAD_HAS_* and
 * KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - CHUNK_UPLOAD_HAS_*   : Transport backends compiled into the library
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/chunk_upload/config/feature_flags.h>
 *
 * #if CHUNK_UPLOAD_HAS_SFTP
 *     auto transport = std::make_unique<sftp_transport>(config);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define CHUNK_UPLOAD_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CHUNK_UPLOAD_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Transport Backends
//==============================================================================

/**
 * @brief FTP backend (libcurl)
 *
 * Set by CMake when libcurl is found (CHUNK_UPLOAD_ENABLE_FTP).
 */
#ifndef CHUNK_UPLOAD_HAS_FTP
    #if defined(CHUNK_UPLOAD_ENABLE_FTP)
        #define CHUNK_UPLOAD_HAS_FTP 1
    #else
        #define CHUNK_UPLOAD_HAS_FTP 0
    #endif
#endif

/**
 * @brief SFTP backend (libssh2)
 *
 * Set by CMake when libssh2 is found (CHUNK_UPLOAD_ENABLE_SFTP).
 */
#ifndef CHUNK_UPLOAD_HAS_SFTP
    #if defined(CHUNK_UPLOAD_ENABLE_SFTP)
        #define CHUNK_UPLOAD_HAS_SFTP 1
    #else
        #define CHUNK_UPLOAD_HAS_SFTP 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for async uploads)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef CHUNK_UPLOAD_PRINT_FEATURE_SUMMARY

#pragma message("=== Chunk Upload System Feature Summary ===")

#if CHUNK_UPLOAD_HAS_FTP
    #pragma message("  FTP (libcurl): Enabled")
#else
    #pragma message("  FTP (libcurl): Disabled")
#endif

#if CHUNK_UPLOAD_HAS_SFTP
    #pragma message("  SFTP (libssh2): Enabled")
#else
    #pragma message("  SFTP (libssh2): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("============================================")

#endif // CHUNK_UPLOAD_PRINT_FEATURE_SUMMARY
