/**
 * @file byte_channel.cpp
 * @brief Bounded single-producer single-consumer byte pipe
 */

#include "kcenon/file_stream/core/byte_channel.h"

#include <algorithm>
#include <cstring>

namespace kcenon::file_stream {

namespace {

auto cancelled_error() -> error {
    return error{error_code::cancelled, "stream cancelled"};
}

}  // namespace

byte_channel::byte_channel(std::size_t capacity)
    : buffer_(std::max<std::size_t>(capacity, 1)) {}

auto byte_channel::write(std::span<const std::byte> data, std::stop_token stop)
    -> result<void> {
    std::unique_lock lock(mutex_);

    while (!data.empty()) {
        writable_.wait(lock, stop, [this] {
            return size_ < buffer_.size() || abort_error_ || closed_;
        });

        if (abort_error_) {
            return unexpected{*abort_error_};
        }
        if (closed_) {
            return unexpected{error{error_code::internal_error, "write to closed channel"}};
        }
        if (stop.stop_requested()) {
            return unexpected{cancelled_error()};
        }

        auto cap = buffer_.size();
        auto tail = (head_ + size_) % cap;
        auto n = std::min(data.size(), cap - size_);
        auto first = std::min(n, cap - tail);
        std::memcpy(buffer_.data() + tail, data.data(), first);
        if (n > first) {
            std::memcpy(buffer_.data(), data.data() + first, n - first);
        }
        size_ += n;
        data = data.subspan(n);

        readable_.notify_one();
    }

    return {};
}

auto byte_channel::close() -> void {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    readable_.notify_all();
    writable_.notify_all();
}

auto byte_channel::close_with_error(error err) -> void {
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            close_error_ = std::move(err);
        }
        closed_ = true;
    }
    readable_.notify_all();
    writable_.notify_all();
}

auto byte_channel::read(std::span<std::byte> out, std::stop_token stop)
    -> result<std::size_t> {
    if (out.empty()) {
        return std::size_t{0};
    }

    std::unique_lock lock(mutex_);
    readable_.wait(lock, stop, [this] { return size_ > 0 || closed_ || abort_error_; });
    return take_locked(out);
}

auto byte_channel::read_until(std::span<std::byte> out,
                              std::chrono::steady_clock::time_point deadline,
                              std::stop_token stop) -> result<std::size_t> {
    if (out.empty()) {
        return std::size_t{0};
    }

    std::unique_lock lock(mutex_);
    auto ready = readable_.wait_until(lock, stop, deadline, [this] {
        return size_ > 0 || closed_ || abort_error_;
    });
    if (!ready && !stop.stop_requested()) {
        return unexpected{error{error_code::connection_timeout,
                                "timed out waiting for request body data"}};
    }
    return take_locked(out);
}

auto byte_channel::take_locked(std::span<std::byte> out) -> result<std::size_t> {
    if (size_ > 0) {
        auto cap = buffer_.size();
        auto n = std::min(out.size(), size_);
        auto first = std::min(n, cap - head_);
        std::memcpy(out.data(), buffer_.data() + head_, first);
        if (n > first) {
            std::memcpy(out.data() + first, buffer_.data(), n - first);
        }
        head_ = (head_ + n) % cap;
        size_ -= n;

        writable_.notify_one();
        return n;
    }

    if (close_error_) {
        return unexpected{*close_error_};
    }
    if (closed_) {
        return std::size_t{0};
    }
    if (abort_error_) {
        return unexpected{*abort_error_};
    }
    return unexpected{cancelled_error()};
}

auto byte_channel::abort(error err) -> void {
    {
        std::lock_guard lock(mutex_);
        if (closed_ || abort_error_) {
            return;
        }
        abort_error_ = std::move(err);
    }
    readable_.notify_all();
    writable_.notify_all();
}

auto byte_channel::buffered() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return size_;
}

auto byte_channel::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace kcenon::file_stream
