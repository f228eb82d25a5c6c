/**
 * @file file_stream.h
 * @brief Main header for file_stream_system library
 * @version 0.1.0
 *
 * Streaming HTTP multipart uploads: a client that encodes files while
 * sending them, and a server that writes them as they arrive.
 *
 * @code
 * #include <kcenon/file_stream/file_stream.h>
 *
 * using namespace kcenon::file_stream;
 *
 * // Create a server
 * auto server = upload_server::builder()
 *     .with_upload_directory("/path/to/uploads")
 *     .build();
 *
 * // Create a client
 * auto client = upload_client::builder()
 *     .with_max_concurrency(4)
 *     .build();
 * @endcode
 */

#ifndef KCENON_FILE_STREAM_FILE_STREAM_H
#define KCENON_FILE_STREAM_FILE_STREAM_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/file_stream/core/types.h"
#include "kcenon/file_stream/core/error_codes.h"
#include "kcenon/file_stream/core/progress.h"
#include "kcenon/file_stream/core/transfer_config.h"

// Server
#include "kcenon/file_stream/server/server_types.h"
#include "kcenon/file_stream/server/throughput_meter.h"
#include "kcenon/file_stream/server/upload_handler.h"
#include "kcenon/file_stream/server/upload_observer.h"
#include "kcenon/file_stream/server/upload_server.h"

// Client
#include "kcenon/file_stream/client/client_types.h"
#include "kcenon/file_stream/client/logging_progress_sink.h"
#include "kcenon/file_stream/client/upload_client.h"

// Adapters
#include "kcenon/file_stream/adapters/thread_pool_adapter.h"

namespace kcenon::file_stream {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_FILE_STREAM_H
