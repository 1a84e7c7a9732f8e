#ifndef SEQFLOW_COMMON_CHANNEL_HPP
#define SEQFLOW_COMMON_CHANNEL_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

/*
 * Bounded producer/consumer channels.
 * ---------------------------------------------------------------------------
 *  - Sender<T> is the write side, Stream<T> the read side. Both are move-only
 *    handles on one shared ChannelState<T>.
 *  - send() blocks while the buffer holds `capacity` items; receive() blocks
 *    until an item is available or the sender closed the channel.
 *  - A producer may fail the channel with an exception: buffered items are
 *    still delivered, then receive() rethrows it.
 *  - Destroying a Stream abandons the channel. Blocked and future sends return
 *    false so the producer can stop, and a Stream that owns its producer
 *    thread joins it.
 */

namespace Seqflow {
    namespace Details {
        template <class T>
        class ChannelState {
        public:
            explicit ChannelState(std::size_t capacity) : capacity_(capacity)
            {
                if (capacity_ == 0) {
                    throw std::invalid_argument("Channel capacity must be at least one.");
                }
            }

            ChannelState(const ChannelState&) = delete;
            ChannelState& operator=(const ChannelState&) = delete;

            bool push(T value)
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_) {
                    throw std::logic_error("Attempted to send on a closed channel.");
                }
                writable_.wait(lock, [this] { return abandoned_ || buffer_.size() < capacity_; });
                if (abandoned_) {
                    return false;
                }
                buffer_.push_back(std::move(value));
                lock.unlock();
                readable_.notify_one();
                return true;
            }

            std::optional<T> pop()
            {
                std::unique_lock<std::mutex> lock(mutex_);
                readable_.wait(lock, [this] { return !buffer_.empty() || closed_; });
                if (!buffer_.empty()) {
                    std::optional<T> value{std::move(buffer_.front())};
                    buffer_.pop_front();
                    ++received_;
                    lock.unlock();
                    writable_.notify_one();
                    return value;
                }
                exhausted_ = true;
                if (error_) {
                    std::rethrow_exception(error_);
                }
                return std::nullopt;
            }

            void close(std::exception_ptr error = nullptr)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (closed_) {
                        return;
                    }
                    closed_ = true;
                    error_ = std::move(error);
                }
                readable_.notify_all();
            }

            void abandon()
            {
                std::function<void()> hook;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (abandoned_) {
                        return;
                    }
                    abandoned_ = true;
                    buffer_.clear();
                    hook = std::move(on_abandon_);
                }
                writable_.notify_all();
                if (hook) {
                    hook();
                }
            }

            // Runs `hook` once the read side goes away (immediately if it already has).
            void on_abandon(std::function<void()> hook)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!abandoned_) {
                        on_abandon_ = std::move(hook);
                        return;
                    }
                }
                hook();
            }

            [[nodiscard]] bool abandoned() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return abandoned_;
            }

            [[nodiscard]] std::size_t received() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return received_;
            }

            [[nodiscard]] bool exhausted() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return exhausted_;
            }

        private:
            mutable std::mutex mutex_;
            std::condition_variable readable_;
            std::condition_variable writable_;
            std::deque<T> buffer_{};
            std::size_t capacity_;
            std::size_t received_{0};
            bool closed_{false};
            bool abandoned_{false};
            bool exhausted_{false};
            std::exception_ptr error_{};
            std::function<void()> on_abandon_{};
        };
    }

    template <class T>
    class Sender {
    public:
        Sender() = default;
        explicit Sender(std::shared_ptr<Details::ChannelState<T>> state) : state_(std::move(state)) {}

        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;
        Sender(Sender&&) noexcept = default;

        Sender& operator=(Sender&& other) noexcept
        {
            if (this != &other) {
                close();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~Sender() { close(); }

        // Returns false once the reading side has been dropped.
        bool send(T value)
        {
            if (!state_) {
                throw std::logic_error("Attempted to send through a released sender.");
            }
            return state_->push(std::move(value));
        }

        void close() noexcept
        {
            if (state_) {
                state_->close();
                state_.reset();
            }
        }

        void fail(std::exception_ptr error) noexcept
        {
            if (state_) {
                state_->close(std::move(error));
                state_.reset();
            }
        }

        void on_abandon(std::function<void()> hook)
        {
            if (state_) {
                state_->on_abandon(std::move(hook));
            }
        }

        [[nodiscard]] bool abandoned() const { return !state_ || state_->abandoned(); }
        [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(state_); }

    private:
        std::shared_ptr<Details::ChannelState<T>> state_{};
    };

    template <class T>
    class Stream {
    public:
        Stream() = default;

        explicit Stream(std::shared_ptr<Details::ChannelState<T>> state, std::thread producer = {})
            : state_(std::move(state)), producer_(std::move(producer)) {}

        Stream(const Stream&) = delete;
        Stream& operator=(const Stream&) = delete;

        Stream(Stream&& other) noexcept
            : state_(std::move(other.state_)), producer_(std::move(other.producer_)) {}

        Stream& operator=(Stream&& other) noexcept
        {
            if (this != &other) {
                release_();
                state_ = std::move(other.state_);
                producer_ = std::move(other.producer_);
            }
            return *this;
        }

        ~Stream() { release_(); }

        // std::nullopt once the producer closed the channel and the buffer is empty.
        std::optional<T> receive()
        {
            if (!state_) {
                throw std::logic_error("Attempted to receive from an empty stream handle.");
            }
            return state_->pop();
        }

        std::size_t drain()
        {
            std::size_t count = 0;
            while (receive()) {
                ++count;
            }
            return count;
        }

        std::vector<T> collect()
        {
            std::vector<T> items;
            while (auto item = receive()) {
                items.push_back(std::move(*item));
            }
            return items;
        }

        [[nodiscard]] std::size_t received() const { return state_ ? state_->received() : 0; }
        [[nodiscard]] bool exhausted() const { return state_ && state_->exhausted(); }

    private:
        void release_() noexcept
        {
            if (state_) {
                state_->abandon();
            }
            if (producer_.joinable()) {
                producer_.join();
            }
            state_.reset();
        }

        std::shared_ptr<Details::ChannelState<T>> state_{};
        std::thread producer_{};
    };

    template <class T>
    std::pair<Sender<T>, Stream<T>> make_channel(std::size_t capacity = 1)
    {
        auto state = std::make_shared<Details::ChannelState<T>>(capacity);
        return {Sender<T>{state}, Stream<T>{state}};
    }

    // Runs producer(Sender<T>&) on a thread owned by the returned stream. An
    // exception escaping the producer fails the stream.
    template <class T, class Producer>
    Stream<T> spawn_stream(Producer producer, std::size_t capacity = 1)
    {
        auto state = std::make_shared<Details::ChannelState<T>>(capacity);
        std::thread worker([state, producer = std::move(producer)]() mutable {
            Sender<T> sender{state};
            try {
                producer(sender);
            } catch (...) {
                sender.fail(std::current_exception());
            }
        });
        return Stream<T>{std::move(state), std::move(worker)};
    }

    // A closed stream pre-loaded with `items`; no producer thread is involved.
    template <class T>
    Stream<T> stream_of(std::vector<T> items)
    {
        auto state = std::make_shared<Details::ChannelState<T>>(std::max<std::size_t>(items.size(), 1));
        for (auto& item : items) {
            state->push(std::move(item));
        }
        state->close();
        return Stream<T>{std::move(state)};
    }
}

#endif // SEQFLOW_COMMON_CHANNEL_HPP
