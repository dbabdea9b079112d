#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "conduit/errors.hpp"

namespace conduit {

/**
 * Outcome of a non-blocking send.
 */
enum class SendResult {
    Sent,
    Full,          ///< Queue is at capacity; the message was not enqueued.
    Disconnected,  ///< No receiver is alive; the message was not enqueued.
};

namespace detail {

template<typename T>
struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::deque<T> queue;
    const size_t capacity;
    size_t receivers = 0;
    uint64_t received = 0;
};

} // namespace detail

template<typename T>
class Receiver;

/**
 * Producer handle of a bounded channel. Copies share the queue.
 */
template<typename T>
class Sender {
public:
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    /**
     * Enqueue a message without blocking.
     */
    SendResult try_send(T message) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->receivers == 0) {
            return SendResult::Disconnected;
        }
        if (state_->queue.size() >= state_->capacity) {
            return SendResult::Full;
        }
        state_->queue.push_back(std::move(message));
        return SendResult::Sent;
    }

    bool is_disconnected() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->receivers == 0;
    }

    /**
     * Number of messages taken off the queue by any receiver.
     */
    uint64_t received_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->received;
    }

    size_t len() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

    size_t capacity() const { return state_->capacity; }

    /**
     * Create a new receiver attached to this channel.
     */
    Receiver<T> subscribe() const { return Receiver<T>(state_); }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Consumer handle of a bounded channel.
 *
 * Clones pull from the same queue, so each message is seen by exactly one
 * of them. The channel counts as disconnected once every receiver is gone.
 * A moved-from receiver is detached: it reads as empty and copies of it
 * stay detached.
 */
template<typename T>
class Receiver {
public:
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        if (!state_) return;
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->receivers;
    }

    Receiver(const Receiver& other) : Receiver(other.state_) {}

    Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}

    Receiver& operator=(Receiver other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Receiver() { release(); }

    Receiver clone() const { return Receiver(*this); }

    /**
     * Take the oldest message, if any, without blocking.
     */
    std::optional<T> try_recv() {
        if (!state_) return std::nullopt;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T message = std::move(state_->queue.front());
        state_->queue.pop_front();
        ++state_->received;
        return message;
    }

    /**
     * Take every message currently queued.
     */
    std::vector<T> drain() {
        std::vector<T> messages;
        if (!state_) return messages;
        std::lock_guard<std::mutex> lock(state_->mutex);
        messages.reserve(state_->queue.size());
        while (!state_->queue.empty()) {
            messages.push_back(std::move(state_->queue.front()));
            state_->queue.pop_front();
        }
        state_->received += messages.size();
        return messages;
    }

    bool empty() const {
        if (!state_) return true;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.empty();
    }

private:
    void release() noexcept {
        if (!state_) return;
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->receivers;
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Bounded multi-producer queue with non-blocking send and receive.
 *
 * The channel object itself holds only the sender side; receivers are
 * created on demand with subscribe().
 */
template<typename T>
class Channel {
public:
    /**
     * @throws InvalidArgumentError if capacity is zero
     */
    explicit Channel(size_t capacity)
        : sender_(make_state(capacity)) {}

    Sender<T>& sender() { return sender_; }
    const Sender<T>& sender() const { return sender_; }

    Receiver<T> subscribe() const { return sender_.subscribe(); }

private:
    static std::shared_ptr<detail::ChannelState<T>> make_state(size_t capacity) {
        if (capacity == 0) {
            throw InvalidArgumentError("Channel capacity must be positive");
        }
        return std::make_shared<detail::ChannelState<T>>(capacity);
    }

    Sender<T> sender_;
};

} // namespace conduit
