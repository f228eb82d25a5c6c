/**
 * @file upload_transport.cpp
 * @brief HTTP/1.1 transport over Boost.Beast
 *
 * Operations are asynchronous on a private io_context that is run to
 * completion after each step, which lets the stop token and the deadline
 * interrupt a blocked connect, write or read.
 */

#include "kcenon/file_stream/client/upload_transport.h"

#include "kcenon/file_stream/core/logging.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::file_stream {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// How long to wait for a response the server may have sent before it
// stopped reading the request body.
constexpr auto early_response_window = std::chrono::seconds{2};

/**
 * @brief Drive the io_context until the pending operation has completed
 */
void run_pending(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

auto map_network_error(const beast::error_code& ec,
                       const std::stop_token& stop,
                       std::string_view stage) -> error {
    if (stop.stop_requested()) {
        return error{error_code::cancelled, "upload cancelled during " + std::string(stage)};
    }

    auto detail = std::string(stage) + ": " + ec.message();
    if (ec == beast::error::timeout) {
        return error{error_code::connection_timeout, "timed out during " + detail};
    }
    if (ec == net::error::connection_refused) {
        return error{error_code::connection_refused, detail};
    }
    if (ec == net::error::connection_reset || ec == net::error::broken_pipe ||
        ec == net::error::eof || ec == http::error::end_of_stream ||
        ec == net::error::connection_aborted) {
        return error{error_code::connection_lost, detail};
    }
    return error{error_code::connection_failed, detail};
}

}  // namespace

beast_upload_transport::beast_upload_transport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

auto beast_upload_transport::send(const upload_request& request,
                                  byte_channel& body,
                                  std::stop_token stop) -> result<upload_response> {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;

    // Stop requests arrive from other threads; cancel on the io_context's own thread.
    std::stop_callback on_stop(stop, [&ioc, &resolver, &stream] {
        net::post(ioc, [&resolver, &stream] {
            resolver.cancel();
            stream.cancel();
        });
    });

    auto fail = [&](const beast::error_code& ec, std::string_view stage) {
        auto err = map_network_error(ec, stop, stage);
        body.abort(err);
        return unexpected{err};
    };
    auto cancelled = [&]() {
        error err{error_code::cancelled, "upload cancelled"};
        body.abort(err);
        return unexpected{err};
    };

    // Resolve
    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    if (stop.stop_requested()) return cancelled();
    resolver.async_resolve(request.endpoint.host, std::to_string(request.endpoint.port),
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                               ec = e;
                               endpoints = std::move(r);
                           });
    run_pending(ioc);
    if (ec) return fail(ec, "resolve " + request.endpoint.host);

    // Connect
    if (stop.stop_requested()) return cancelled();
    stream.expires_at(deadline);
    stream.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_pending(ioc);
    if (ec) return fail(ec, "connect to " + request.endpoint.host_header());

    // Header
    http::request<http::buffer_body> req{http::verb::post, request.endpoint.target, 11};
    req.set(http::field::host, request.endpoint.host_header());
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::content_type, request.content_type);
    req.content_length(request.content_length);
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> serializer{req};

    if (stop.stop_requested()) return cancelled();
    stream.expires_at(deadline);
    http::async_write_header(stream, serializer,
                             [&](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    if (ec) return fail(ec, "send request header");

    beast::flat_buffer read_buffer;
    http::response<http::string_body> res;

    // A server that rejects the upload early answers and stops reading, which
    // surfaces here as a failed body write. Its status is the better report.
    auto read_early_response = [&]() -> std::optional<upload_response> {
        if (stop.stop_requested() || ec == beast::error::timeout) {
            return std::nullopt;
        }
        beast::error_code read_ec;
        stream.expires_at(std::min(deadline, std::chrono::steady_clock::now() +
                                                 early_response_window));
        http::async_read(stream, read_buffer, res,
                         [&](beast::error_code e, std::size_t) { read_ec = e; });
        run_pending(ioc);
        if (read_ec) {
            FS_LOG_DEBUG(log_category::client,
                         "No response after failed body write: " + read_ec.message());
            return std::nullopt;
        }
        FS_LOG_DEBUG(log_category::client,
                     "Server answered " + std::to_string(res.result_int()) +
                         " before the request body was sent");
        body.abort(error{error_code::connection_lost,
                         "server stopped reading the request body"});
        return upload_response{res.result_int(), std::move(res.body())};
    };

    // Body, drained from the channel as the producer fills it
    std::vector<std::byte> buffer(std::max<std::size_t>(request.chunk_size, 1));
    while (true) {
        auto n = body.read_until(buffer, deadline, stop);
        if (!n) {
            if (n.error().code == error_code::connection_timeout) {
                body.abort(n.error());
            }
            // producer failure or cancellation; surface it unchanged
            return unexpected{n.error()};
        }

        if (n.value() == 0) {
            req.body().data = nullptr;
            req.body().size = 0;
            req.body().more = false;
        } else {
            req.body().data = buffer.data();
            req.body().size = n.value();
            req.body().more = true;
        }

        if (stop.stop_requested()) return cancelled();
        stream.expires_at(deadline);
        http::async_write(stream, serializer,
                          [&](beast::error_code e, std::size_t) { ec = e; });
        run_pending(ioc);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            if (auto early = read_early_response()) {
                return std::move(*early);
            }
            return fail(ec, "send request body");
        }

        if (n.value() == 0) {
            break;
        }
    }

    // Response
    if (stop.stop_requested()) return cancelled();
    stream.expires_at(deadline);
    http::async_read(stream, read_buffer, res,
                     [&](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    if (ec) return fail(ec, "read response");

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        FS_LOG_DEBUG(log_category::client, "Socket shutdown reported: " + ec.message());
    }

    upload_response response;
    response.status = res.result_int();
    response.body = std::move(res.body());
    return response;
}

}  // namespace kcenon::file_stream
