/**
 * @file upload_server.cpp
 * @brief HTTP upload server over Boost.Beast
 *
 * Connections are accepted asynchronously on a private io_context driven
 * by one thread; each accepted socket is then served with synchronous
 * reads and writes on the task pool.
 */

#include "kcenon/file_stream/server/upload_server.h"

#include "kcenon/file_stream/core/logging.h"
#include "kcenon/file_stream/server/upload_handler.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kcenon::file_stream {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* server_banner = "file_stream_system";
constexpr const char* liveness_text = "HTTP File Upload Server is running";

// Upper bound for discarding an unread request body after an early response.
constexpr auto linger_timeout = std::chrono::seconds{2};

auto describe_remote(const tcp::socket& socket) -> std::string {
    beast::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return remote.address().to_string() + ":" + std::to_string(remote.port());
}

auto resolve_listen_endpoint(const endpoint& listen_addr) -> result<tcp::endpoint> {
    auto host = listen_addr.host.empty() ? std::string("0.0.0.0") : listen_addr.host;

    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (!ec) {
        return tcp::endpoint{address, listen_addr.port};
    }

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(host, std::to_string(listen_addr.port), ec);
    if (ec || results.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "cannot resolve listen address " + host + ": " + ec.message()}};
    }
    return results.begin()->endpoint();
}

}  // namespace

// ============================================================================
// upload_server::impl
// ============================================================================

struct upload_server::impl {
    server_config config;
    std::shared_ptr<adapters::upload_task_pool_interface> pool;
    upload_handler handler;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread accept_thread;
    std::atomic<server_state> state{server_state::stopped};
    std::atomic<uint16_t> bound_port{0};

    std::mutex connections_mutex;
    uint64_t next_connection_id = 0;
    std::unordered_map<uint64_t, std::shared_ptr<tcp::socket>> connections;
    std::vector<std::future<void>> tasks;
    std::atomic<std::size_t> active_connections{0};

    impl(server_config cfg,
         std::shared_ptr<upload_observer> observer,
         std::shared_ptr<adapters::upload_task_pool_interface> p)
        : config(cfg), pool(std::move(p)), handler(std::move(cfg), std::move(observer)) {}

    void do_accept() {
        auto socket = std::make_shared<tcp::socket>(ioc);
        acceptor->async_accept(*socket, [this, socket](beast::error_code ec) {
            if (ec) {
                if (ec == net::error::operation_aborted || !acceptor->is_open()) {
                    return;
                }
                FS_LOG_WARN(log_category::server, "Accept failed: " + ec.message());
            } else {
                dispatch(socket);
            }
            do_accept();
        });
    }

    void dispatch(const std::shared_ptr<tcp::socket>& socket) {
        std::lock_guard lock(connections_mutex);
        collect_finished_tasks();

        if (active_connections.load() >= config.max_connections) {
            reject_busy(*socket);
            return;
        }

        auto id = next_connection_id++;
        connections.emplace(id, socket);
        ++active_connections;

        tasks.push_back(pool->submit([this, id, socket] {
            try {
                serve(*socket);
            } catch (const std::exception& e) {
                FS_LOG_ERROR(log_category::server,
                             std::string("Connection handler failed: ") + e.what());
            }
            release_connection(id);
        }));
    }

    // Closes under connections_mutex so it never overlaps the shutdown in stop().
    void release_connection(uint64_t id) {
        std::lock_guard lock(connections_mutex);
        if (auto it = connections.find(id); it != connections.end()) {
            beast::error_code ec;
            it->second->close(ec);
            connections.erase(it);
        }
        --active_connections;
    }

    /**
     * @brief Drop futures of connections that already ended
     *
     * Caller holds connections_mutex.
     */
    void collect_finished_tasks() {
        std::vector<std::future<void>> running;
        for (auto& task : tasks) {
            if (task.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
                wait_task(task);
            } else {
                running.push_back(std::move(task));
            }
        }
        tasks.swap(running);
    }

    static void wait_task(std::future<void>& task) {
        try {
            task.get();
        } catch (const std::exception& e) {
            FS_LOG_ERROR(log_category::server, std::string("Connection task failed: ") + e.what());
        }
    }

    static void reject_busy(tcp::socket& socket) {
        http::response<http::string_body> res{http::status::service_unavailable, 11};
        res.set(http::field::server, server_banner);
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.keep_alive(false);
        res.body() = "Too many connections";
        res.prepare_payload();

        beast::error_code ec;
        http::write(socket, res, ec);
        if (ec) {
            FS_LOG_DEBUG(log_category::server, "Busy response not delivered: " + ec.message());
        }
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
        FS_LOG_WARN(log_category::server, "Connection rejected: connection limit reached");
    }

    /**
     * @brief Half-close and discard what the client is still sending
     *
     * Closing with unread input resets the connection, which can destroy a
     * response the client has not read yet. Draining for a bounded time lets
     * the client see the response or the end of stream first.
     */
    void linger(tcp::socket& socket) {
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
        socket.non_blocking(true, ec);

        std::array<char, 16 * 1024> discard;
        const auto until = std::chrono::steady_clock::now() + linger_timeout;
        while (!ec && state.load() == server_state::running &&
               std::chrono::steady_clock::now() < until) {
            socket.read_some(net::buffer(discard), ec);
            if (ec == net::error::would_block) {
                ec = {};
                std::this_thread::sleep_for(std::chrono::milliseconds{5});
            }
        }
    }

    void serve(tcp::socket& socket) {
        beast::flat_buffer buffer;
        const auto remote = describe_remote(socket);
        beast::error_code ec;
        bool body_unread = false;

        while (state.load() == server_state::running) {
            http::request_parser<http::buffer_body> parser;
            parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

            http::read_header(socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                FS_LOG_DEBUG(log_category::server,
                             "Request header from " + remote + " not read: " + ec.message());
                break;
            }

            auto& req = parser.get();
            std::string target(req.target());
            auto path = target.substr(0, target.find('?'));

            handler_response response;
            if (path == upload_route) {
                if (req.method() == http::verb::post &&
                    beast::iequals(req[http::field::expect], "100-continue")) {
                    http::response<http::empty_body> proceed{http::status::continue_,
                                                             req.version()};
                    http::write(socket, proceed, ec);
                    if (ec) {
                        break;
                    }
                }

                inbound_upload upload;
                upload.method = std::string(req.method_string());
                upload.content_type = std::string(req[http::field::content_type]);
                if (auto length = parser.content_length()) {
                    upload.content_length = *length;
                }
                upload.remote_address = remote;
                upload.user_agent = std::string(req[http::field::user_agent]);

                body_reader read_body = [&](std::span<std::byte> out) -> result<std::size_t> {
                    while (!parser.is_done()) {
                        parser.get().body().data = out.data();
                        parser.get().body().size = out.size();

                        beast::error_code read_ec;
                        http::read(socket, buffer, parser, read_ec);
                        if (read_ec == http::error::need_buffer) {
                            read_ec = {};
                        }
                        if (read_ec) {
                            return unexpected{
                                error{error_code::connection_lost, read_ec.message()}};
                        }
                        auto n = out.size() - parser.get().body().size;
                        if (n > 0) {
                            return n;
                        }
                    }
                    return std::size_t{0};
                };

                response = handler.handle(upload, read_body);
            } else {
                response = {200, liveness_text};
            }

            // A body left unread makes the connection unusable for another request.
            body_unread = !parser.is_done();
            bool keep_alive = req.keep_alive() && !body_unread;

            http::response<http::string_body> res{static_cast<http::status>(response.status),
                                                  req.version()};
            res.set(http::field::server, server_banner);
            res.set(http::field::content_type, "text/plain; charset=utf-8");
            if (response.status == 405) {
                res.set(http::field::allow, "POST");
            }
            res.keep_alive(keep_alive);
            res.body() = std::move(response.body);
            res.prepare_payload();

            http::write(socket, res, ec);
            if (ec) {
                FS_LOG_DEBUG(log_category::server,
                             "Response to " + remote + " not delivered: " + ec.message());
                break;
            }
            if (!keep_alive) {
                break;
            }
        }

        if (body_unread) {
            linger(socket);
        } else {
            socket.shutdown(tcp::socket::shutdown_send, ec);
        }
    }
};

// ============================================================================
// upload_server::builder
// ============================================================================

upload_server::builder::builder() = default;

auto upload_server::builder::with_upload_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.upload_directory = dir;
    return *this;
}

auto upload_server::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_server::builder::with_max_header_bytes(std::size_t size) -> builder& {
    config_.max_header_bytes = size;
    return *this;
}

auto upload_server::builder::with_max_connections(std::size_t max_count) -> builder& {
    config_.max_connections = max_count;
    return *this;
}

auto upload_server::builder::with_report_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.report_interval = interval;
    return *this;
}

auto upload_server::builder::with_observer(std::shared_ptr<upload_observer> observer)
    -> builder& {
    observer_ = std::move(observer);
    return *this;
}

auto upload_server::builder::with_task_pool(
    std::shared_ptr<adapters::upload_task_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_server::builder::build() -> result<upload_server> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                                "invalid server configuration"}};
    }

    auto observer = observer_ ? observer_ : std::make_shared<logging_upload_observer>();
    auto pool = pool_ ? pool_
                      : adapters::upload_pool_factory::create(config_.max_connections,
                                                              "file_stream_server");
    return upload_server{std::make_unique<impl>(config_, std::move(observer), std::move(pool))};
}

// ============================================================================
// upload_server
// ============================================================================

upload_server::upload_server(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {
    get_logger().initialize();
}

upload_server::upload_server(upload_server&&) noexcept = default;
auto upload_server::operator=(upload_server&&) noexcept -> upload_server& = default;

upload_server::~upload_server() {
    if (impl_ && impl_->state.load() == server_state::running) {
        auto stopped = stop();
        if (!stopped) {
            FS_LOG_WARN(log_category::server, "Stop on destruction failed: " +
                                                  stopped.error().message);
        }
    }
}

auto upload_server::start(const endpoint& listen_addr) -> result<void> {
    auto expected = server_state::stopped;
    if (!impl_->state.compare_exchange_strong(expected, server_state::starting)) {
        return unexpected{error{error_code::already_initialized, "server is already running"}};
    }

    auto fail = [this](error err) -> result<void> {
        impl_->acceptor.reset();
        impl_->state = server_state::stopped;
        FS_LOG_ERROR(log_category::server, err.message);
        return unexpected{std::move(err)};
    };

    auto address = resolve_listen_endpoint(listen_addr);
    if (!address) {
        return fail(address.error());
    }

    impl_->ioc.restart();
    impl_->acceptor = std::make_unique<tcp::acceptor>(impl_->ioc);

    beast::error_code ec;
    auto& acceptor = *impl_->acceptor;
    acceptor.open(address.value().protocol(), ec);
    if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(address.value(), ec);
    if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail(error{error_code::connection_failed,
                          "cannot listen on " + listen_addr.host + ":" +
                              std::to_string(listen_addr.port) + ": " + ec.message()});
    }

    impl_->bound_port = acceptor.local_endpoint(ec).port();
    impl_->do_accept();
    impl_->state = server_state::running;
    impl_->accept_thread = std::thread([state = impl_.get()] { state->ioc.run(); });

    FS_LOG_INFO(log_category::server,
                "Server listening on port " + std::to_string(impl_->bound_port.load()) +
                    ", uploads go to " + impl_->config.upload_directory.string() +
                    " via POST " + upload_route);
    return {};
}

auto upload_server::stop() -> result<void> {
    auto expected = server_state::running;
    if (!impl_->state.compare_exchange_strong(expected, server_state::stopping)) {
        return unexpected{error{error_code::server_not_running, "server is not running"}};
    }

    net::post(impl_->ioc, [state = impl_.get()] {
        beast::error_code ec;
        state->acceptor->close(ec);
    });
    if (impl_->accept_thread.joinable()) {
        impl_->accept_thread.join();
    }

    std::vector<std::future<void>> tasks;
    {
        std::lock_guard lock(impl_->connections_mutex);
        // Workers may be blocked in a read on these sockets. shutdown() only
        // touches the descriptor, which stays open until release_connection()
        // closes it under this same lock, and makes the blocked read return.
        for (auto& [id, socket] : impl_->connections) {
            beast::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        tasks.swap(impl_->tasks);
    }
    for (auto& task : tasks) {
        impl::wait_task(task);
    }

    impl_->acceptor.reset();
    impl_->bound_port = 0;
    impl_->state = server_state::stopped;
    FS_LOG_INFO(log_category::server, "Server stopped");
    return {};
}

auto upload_server::is_running() const -> bool {
    return impl_->state.load() == server_state::running;
}

auto upload_server::state() const -> server_state {
    return impl_->state.load();
}

auto upload_server::port() const -> uint16_t {
    return impl_->bound_port.load();
}

auto upload_server::get_statistics() const -> server_statistics {
    auto stats = impl_->handler.statistics();
    stats.active_connections = impl_->active_connections.load();
    return stats;
}

auto upload_server::config() const -> const server_config& {
    return impl_->config;
}

}  // namespace kcenon::file_stream
