/**
 * @file upload_observer.h
 * @brief Observer of uploads received by the server
 */

#ifndef KCENON_FILE_STREAM_SERVER_UPLOAD_OBSERVER_H
#define KCENON_FILE_STREAM_SERVER_UPLOAD_OBSERVER_H

#include "server_types.h"

#include "kcenon/file_stream/core/types.h"

namespace kcenon::file_stream {

/**
 * @brief Receives events of every upload the handler processes
 *
 * Uploads on different connections are handled concurrently, so
 * implementations must be thread-safe.
 */
class upload_observer {
public:
    virtual ~upload_observer() = default;

    virtual void on_upload_started(const inbound_file& file) = 0;

    virtual void on_upload_progress(const inbound_file& file, const throughput_report& report) = 0;

    virtual void on_upload_completed(const inbound_file& file, const upload_summary& summary) = 0;

    /**
     * @brief Upload aborted after the destination file was opened
     *
     * The partial file is left in place.
     */
    virtual void on_upload_failed(const inbound_file& file,
                                  const upload_summary& summary,
                                  const error& cause) = 0;
};

/**
 * @brief Writes upload events to the file_stream.server log category
 */
class logging_upload_observer : public upload_observer {
public:
    void on_upload_started(const inbound_file& file) override;
    void on_upload_progress(const inbound_file& file, const throughput_report& report) override;
    void on_upload_completed(const inbound_file& file, const upload_summary& summary) override;
    void on_upload_failed(const inbound_file& file,
                          const upload_summary& summary,
                          const error& cause) override;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_SERVER_UPLOAD_OBSERVER_H
