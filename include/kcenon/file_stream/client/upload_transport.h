/**
 * @file upload_transport.h
 * @brief Transmission path consuming a streamed request body
 */

#ifndef KCENON_FILE_STREAM_CLIENT_UPLOAD_TRANSPORT_H
#define KCENON_FILE_STREAM_CLIENT_UPLOAD_TRANSPORT_H

#include "client_types.h"

#include "kcenon/file_stream/core/byte_channel.h"
#include "kcenon/file_stream/core/types.h"

#include <stop_token>
#include <string>

namespace kcenon::file_stream {

/**
 * @brief Sends one POST whose body is read from a byte_channel
 *
 * Implementations read @p body until end of stream, then wait for the
 * response. A failing body read must be returned as-is. A transport that
 * gives up early should abort() the channel so the producer unblocks.
 */
class upload_transport {
public:
    virtual ~upload_transport() = default;

    /**
     * @brief Perform one request
     * @return Response of any status, or a network error, the body's
     *         error, or error_code::cancelled
     */
    [[nodiscard]] virtual auto send(const upload_request& request,
                                    byte_channel& body,
                                    std::stop_token stop) -> result<upload_response> = 0;
};

/**
 * @brief HTTP/1.1 transport over Boost.Beast
 *
 * Each call opens its own connection. The request timeout bounds the
 * whole exchange from connect to the end of the response.
 */
class beast_upload_transport : public upload_transport {
public:
    explicit beast_upload_transport(std::string user_agent = "file_stream_system");

    [[nodiscard]] auto send(const upload_request& request,
                            byte_channel& body,
                            std::stop_token stop) -> result<upload_response> override;

private:
    std::string user_agent_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CLIENT_UPLOAD_TRANSPORT_H
