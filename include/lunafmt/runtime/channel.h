#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace lunafmt::runtime {

namespace detail {

template <typename T> struct ChannelState {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<T> queue;
    size_t senders = 0;
};

} // namespace detail

template <typename T> class Receiver;

/**
 * Producer handle of an unbounded multi-producer, single-consumer channel.
 *
 * Copies share the channel. The channel closes when the last Sender is
 * destroyed or reset; messages already sent are still delivered.
 */
template <typename T> class Sender {
public:
    Sender(const Sender& other) : state_(other.state_) { acquire(); }

    Sender& operator=(const Sender& other) {
        if (this != &other) {
            release();
            state_ = other.state_;
            acquire();
        }
        return *this;
    }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Sender() { release(); }

    // Never blocks. Returns false only on a handle that was reset or moved from.
    bool send(T value) const {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->queue.push_back(std::move(value));
        }
        state_->ready.notify_one();
        return true;
    }

    void reset() { release(); }

private:
    template <typename U> friend std::pair<Sender<U>, Receiver<U>> makeChannel();

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        acquire();
    }

    void acquire() {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->senders;
        }
    }

    void release() {
        if (!state_) {
            return;
        }
        bool closed = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            closed = (--state_->senders == 0);
        }
        if (closed) {
            state_->ready.notify_all();
        }
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Consumer handle. Only one thread may receive at a time.
 */
template <typename T> class Receiver {
public:
    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&&) noexcept = default;
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    /**
     * Block until a message arrives or the channel is closed and empty.
     * @return the next message in delivery order, or std::nullopt once closed
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->ready.wait(lock, [this] { return !state_->queue.empty() || state_->senders == 0; });
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

private:
    template <typename U> friend std::pair<Sender<U>, Receiver<U>> makeChannel();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T> std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace lunafmt::runtime
