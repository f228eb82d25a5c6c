/**
 * @file upload_client.cpp
 * @brief Streaming multipart upload client implementation
 */

#include "kcenon/file_stream/client/upload_client.h"

#include "kcenon/file_stream/client/logging_progress_sink.h"
#include "kcenon/file_stream/client/stream_encoder.h"
#include "kcenon/file_stream/core/byte_channel.h"
#include "kcenon/file_stream/core/logging.h"
#include "kcenon/file_stream/core/multipart_writer.h"
#include "kcenon/file_stream/core/retry_policy.h"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <string>
#include <system_error>
#include <thread>

namespace kcenon::file_stream {

namespace fs = std::filesystem;

namespace {

auto is_success_status(unsigned status) -> bool {
    return status >= 200 && status < 300;
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

/**
 * @brief Check that @p path is a readable, non-empty regular file
 * @return File size
 */
auto inspect_source(const fs::path& path) -> result<uint64_t> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return unexpected{error{error_code::file_not_found, "file not found: " + path.string()}};
    }
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
                                "cannot access file " + path.string() + ": " + ec.message()}};
    }
    if (!fs::is_regular_file(status)) {
        return unexpected{error{error_code::not_regular_file,
                                "not a regular file: " + path.string()}};
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
                                "cannot read size of " + path.string() + ": " + ec.message()}};
    }
    if (size == 0) {
        return unexpected{error{error_code::file_empty, "file is empty: " + path.string()}};
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return unexpected{error{error_code::file_access_denied,
                                "file is not readable: " + path.string()}};
    }
    return static_cast<uint64_t>(size);
}

}  // namespace

// ============================================================================
// list_directory_files
// ============================================================================

auto list_directory_files(const fs::path& directory) -> result<std::vector<fs::path>> {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return unexpected{error{error_code::directory_read_error,
                                "cannot read directory " + directory.string() + ": " +
                                    ec.message()}};
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return unexpected{error{error_code::directory_read_error,
                                    "cannot read directory " + directory.string() + ": " +
                                        ec.message()}};
        }
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return unexpected{error{error_code::directory_read_error,
                                "cannot read directory " + directory.string() + ": " +
                                    ec.message()}};
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ============================================================================
// upload_client::impl
// ============================================================================

struct upload_client::impl {
    transfer_config config;
    std::shared_ptr<upload_transport> transport;
    std::shared_ptr<concurrency_limiter> limiter;
    std::shared_ptr<adapters::upload_task_pool_interface> pool;
    stream_encoder encoder;
    retry_policy retry;

    impl(transfer_config cfg,
         std::shared_ptr<upload_transport> t,
         std::shared_ptr<concurrency_limiter> l,
         std::shared_ptr<adapters::upload_task_pool_interface> p)
        : config(cfg)
        , transport(std::move(t))
        , limiter(std::move(l))
        , pool(std::move(p))
        , encoder(cfg.chunk_size, cfg.progress_interval)
        , retry(cfg.retry_attempts, cfg.retry_delay) {}

    /**
     * @brief One encode-and-transmit cycle
     */
    auto attempt_once(const fs::path& source,
                      const upload_endpoint& endpoint,
                      progress_sink* sink,
                      uint32_t attempt,
                      std::stop_token stop) -> result<void> {
        auto size = inspect_source(source);
        if (!size) {
            return unexpected{size.error()};
        }

        auto framing = multipart_writer::create(upload_field_name, source.filename().string());
        if (!framing) {
            return unexpected{framing.error()};
        }

        upload_request request;
        request.endpoint = endpoint;
        request.content_type = framing.value().content_type();
        request.content_length = framing.value().content_length(size.value());
        request.timeout = config.timeout;
        request.chunk_size = config.chunk_size;

        byte_channel channel(config.chunk_size);
        std::stop_source attempt_stop;
        std::stop_callback forward_stop(stop, [&attempt_stop] { attempt_stop.request_stop(); });

        encode_source src{source, size.value(), attempt};
        result<void> produced;
        result<upload_response> sent;
        {
            std::jthread producer([&] {
                produced = encoder.encode(src, framing.value(), channel, sink,
                                          attempt_stop.get_token());
            });

            sent = transport->send(request, channel, attempt_stop.get_token());
            if (!sent) {
                channel.abort(sent.error());
            } else {
                channel.abort(error{error_code::connection_lost,
                                    "response received before the request body was sent"});
            }
        }  // joins the producer

        if (sent && !is_success_status(sent.value().status)) {
            return unexpected{error{error_code::http_status_error,
                                    "server returned status " +
                                        std::to_string(sent.value().status) + ": " +
                                        sent.value().body}};
        }
        if (!produced) {
            return produced;
        }
        if (!sent) {
            return unexpected{sent.error()};
        }
        return {};
    }

    /**
     * @brief Run one file's whole session and notify the sink once at the end
     */
    auto run_session(const fs::path& source,
                     const upload_endpoint& endpoint,
                     progress_sink* sink,
                     std::stop_token stop) -> upload_outcome {
        const auto started = std::chrono::steady_clock::now();
        upload_outcome outcome;
        outcome.file = source;

        auto finish = [&](const result<void>& status) {
            outcome.elapsed = elapsed_since(started);
            if (!status) {
                outcome.failure = status.error();
            }
            log_outcome(outcome);
            if (sink) {
                sink->on_complete(outcome);
            }
            return outcome;
        };

        auto size = inspect_source(source);
        if (!size) {
            return finish(unexpected{size.error()});
        }
        outcome.file_size = size.value();

        auto slot = limiter->acquire(stop);
        if (!slot) {
            return finish(unexpected{slot.error()});
        }

        auto retried = retry.run(
            [&](uint32_t attempt) { return attempt_once(source, endpoint, sink, attempt, stop); },
            stop);
        slot.value().release();

        outcome.attempts = retried.attempts;
        return finish(retried.status);
    }

    static auto log_outcome(const upload_outcome& outcome) -> void {
        transfer_log_context ctx;
        ctx.filename = outcome.file.filename().string();
        ctx.file_size = outcome.file_size;
        ctx.attempt = outcome.attempts;
        ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());

        if (outcome.succeeded()) {
            if (outcome.elapsed.count() > 0) {
                ctx.rate_mbps = static_cast<double>(outcome.file_size) / (1024.0 * 1024.0) /
                                (static_cast<double>(outcome.elapsed.count()) / 1000.0);
            }
            FS_LOG_INFO_CTX(log_category::client, "Upload successful", ctx);
        } else {
            ctx.error_message = outcome.failure->message;
            FS_LOG_ERROR_CTX(log_category::client, "Upload failed", ctx);
        }
    }
};

// ============================================================================
// upload_client::builder
// ============================================================================

upload_client::builder::builder() = default;

auto upload_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_client::builder::with_max_concurrency(std::size_t count) -> builder& {
    config_.max_concurrency = count;
    return *this;
}

auto upload_client::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.timeout = timeout;
    return *this;
}

auto upload_client::builder::with_retry_attempts(uint32_t attempts) -> builder& {
    config_.retry_attempts = attempts;
    return *this;
}

auto upload_client::builder::with_retry_delay(std::chrono::milliseconds delay) -> builder& {
    config_.retry_delay = delay;
    return *this;
}

auto upload_client::builder::with_progress_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.progress_interval = interval;
    return *this;
}

auto upload_client::builder::with_config(const transfer_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto upload_client::builder::with_transport(std::shared_ptr<upload_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_client::builder::with_concurrency_limiter(
    std::shared_ptr<concurrency_limiter> limiter) -> builder& {
    limiter_ = std::move(limiter);
    return *this;
}

auto upload_client::builder::with_task_pool(
    std::shared_ptr<adapters::upload_task_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_client::builder::build() -> result<upload_client> {
    if (limiter_) {
        config_.max_concurrency = limiter_->capacity();
    }

    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    auto transport = transport_ ? transport_ : std::make_shared<beast_upload_transport>();
    auto limiter = limiter_ ? limiter_
                            : std::make_shared<concurrency_limiter>(config_.max_concurrency);
    auto pool = pool_ ? pool_
                      : adapters::upload_pool_factory::create(config_.max_concurrency,
                                                              "file_stream_upload");

    return upload_client{std::make_unique<impl>(config_, std::move(transport),
                                                std::move(limiter), std::move(pool))};
}

// ============================================================================
// upload_client
// ============================================================================

upload_client::upload_client(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {
    get_logger().initialize();
}

upload_client::upload_client(upload_client&&) noexcept = default;
auto upload_client::operator=(upload_client&&) noexcept -> upload_client& = default;
upload_client::~upload_client() = default;

auto upload_client::create(std::chrono::milliseconds timeout) -> result<upload_client> {
    return builder().with_timeout(timeout).build();
}

auto upload_client::upload_file(const fs::path& source,
                                const upload_endpoint& endpoint,
                                progress_sink* sink,
                                std::stop_token stop) -> result<void> {
    auto outcome = impl_->run_session(source, endpoint, sink, stop);
    if (!outcome.succeeded()) {
        return unexpected{*outcome.failure};
    }
    return {};
}

auto upload_client::upload_file_with_progress(const fs::path& source,
                                              const upload_endpoint& endpoint,
                                              std::stop_token stop) -> result<void> {
    logging_progress_sink sink(std::chrono::seconds{1});
    return upload_file(source, endpoint, &sink, stop);
}

auto upload_client::upload_files_detailed(const std::vector<fs::path>& sources,
                                          const upload_endpoint& endpoint,
                                          progress_sink* sink,
                                          std::stop_token stop) -> result<batch_result> {
    if (sources.empty()) {
        return unexpected{error{error_code::empty_file_set, "No files specified for upload"}};
    }

    const auto started = std::chrono::steady_clock::now();

    // One cancellation scope for the whole batch, fed by the caller's token.
    std::stop_source batch_stop;
    std::stop_callback forward_stop(stop, [&batch_stop] { batch_stop.request_stop(); });

    batch_result batch;
    batch.total_files = sources.size();
    batch.file_results.resize(sources.size());

    std::vector<std::future<void>> tasks;
    tasks.reserve(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        auto* slot = &batch.file_results[i];
        slot->file = sources[i];
        tasks.push_back(impl_->pool->submit(
            [this, slot, &endpoint, sink, token = batch_stop.get_token()] {
                auto outcome = impl_->run_session(slot->file, endpoint, sink, token);
                slot->success = outcome.succeeded();
                slot->bytes_transferred = outcome.succeeded() ? outcome.file_size : 0;
                slot->attempts = outcome.attempts;
                slot->elapsed = outcome.elapsed;
                slot->failure = outcome.failure;
            }));
    }

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        try {
            tasks[i].get();
        } catch (const std::exception& e) {
            batch.file_results[i].success = false;
            batch.file_results[i].failure =
                error{error_code::internal_error, std::string("upload task failed: ") + e.what()};
        }
    }

    for (const auto& file_result : batch.file_results) {
        if (file_result.success) {
            ++batch.succeeded;
            batch.total_bytes += file_result.bytes_transferred;
        } else {
            ++batch.failed;
        }
    }
    batch.elapsed = elapsed_since(started);

    transfer_log_context ctx;
    ctx.bytes_transferred = batch.total_bytes;
    ctx.duration_ms = static_cast<uint64_t>(batch.elapsed.count());
    FS_LOG_INFO_CTX(log_category::client,
                    "Batch finished: " + std::to_string(batch.succeeded) + "/" +
                        std::to_string(batch.total_files) + " files uploaded",
                    ctx);

    return batch;
}

auto upload_client::upload_files(const std::vector<fs::path>& sources,
                                 const upload_endpoint& endpoint,
                                 progress_sink* sink,
                                 std::stop_token stop) -> result<void> {
    auto batch = upload_files_detailed(sources, endpoint, sink, stop);
    if (!batch) {
        return unexpected{batch.error()};
    }

    auto failure = batch.value().aggregate_error();
    if (!failure) {
        return {};
    }
    if (stop.stop_requested()) {
        return unexpected{error{error_code::cancelled, "batch upload cancelled; " +
                                                           failure->message}};
    }
    return unexpected{*failure};
}

auto upload_client::upload_directory(const fs::path& directory,
                                     const upload_endpoint& endpoint,
                                     progress_sink* sink,
                                     std::stop_token stop) -> result<void> {
    auto files = list_directory_files(directory);
    if (!files) {
        return unexpected{files.error()};
    }
    if (files.value().empty()) {
        return unexpected{error{error_code::empty_file_set,
                                "No files found in directory " + directory.string()}};
    }
    return upload_files(files.value(), endpoint, sink, stop);
}

auto upload_client::config() const -> const transfer_config& {
    return impl_->config;
}

auto upload_client::limiter() const -> const concurrency_limiter& {
    return *impl_->limiter;
}

}  // namespace kcenon::file_stream
