// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Integration flags for file_stream_system
 *
 * KCENON_WITH_* macros tell whether an optional kcenon ecosystem module is
 * linked. They are normally set through CMake compile definitions.
 *
 * @code
 * #include <kcenon/file_stream/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = std::make_shared<kcenon::thread::thread_pool>("uploads");
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#endif

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for batch fan-out and connections)
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

/**
 * @brief Whether log records are forwarded to logger_system
 */
#ifndef FILE_STREAM_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define FILE_STREAM_USE_LOGGER_SYSTEM 1
    #else
        #define FILE_STREAM_USE_LOGGER_SYSTEM 0
    #endif
#endif
