// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for vector_trans_system
 *
 * Central entry point for feature detection and integration flags in the
 * vector_trans_system library. Include this header to get access to all
 * VECTOR_TRANS_* and KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - VECTOR_TRANS_*       : Library-local switches
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/vector_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = thread_system_task_adapter::create_default();
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define VECTOR_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define VECTOR_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * @brief Ensure KCENON_WITH_* flags are always available
 *
 * These flags indicate integration with other kcenon ecosystem modules.
 * They are set via CMake compile definitions and may be inherited from
 * common_system's feature_flags.h. Defaults are only provided here for
 * standalone builds.
 */

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for part uploads and prefetch)
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
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in vector_transfer
 *
 * logger_system forwarding needs both the logger and common_system.
 */
#ifndef VECTOR_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define VECTOR_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define VECTOR_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Library Defaults
//==============================================================================

/**
 * @brief Default multipart part size in bytes (512 MiB)
 *
 * Can be overridden at build time, e.g. for memory constrained targets.
 */
#ifndef VECTOR_TRANS_DEFAULT_PART_SIZE
    #define VECTOR_TRANS_DEFAULT_PART_SIZE (512ULL * 1024ULL * 1024ULL)
#endif

/**
 * @brief Default number of consecutive ranged read failures tolerated
 */
#ifndef VECTOR_TRANS_DEFAULT_MAX_READ_FAILURES
    #define VECTOR_TRANS_DEFAULT_MAX_READ_FAILURES 5
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

/**
 * @brief Print feature detection summary at compile time
 *
 * Enable by defining VECTOR_TRANS_PRINT_FEATURE_SUMMARY before including this
 * header.
 */
#ifdef VECTOR_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Vector Transfer System Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
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

#pragma message("==============================================")

#endif // VECTOR_TRANS_PRINT_FEATURE_SUMMARY
