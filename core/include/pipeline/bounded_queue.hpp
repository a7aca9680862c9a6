#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <chrono>
#include <mutex>
#include <utility>

namespace bgs {
    // Fixed-capacity FIFO with latest-item-wins overflow: a push never blocks,
    // when full the oldest item is discarded to make room.
    //
    // close() stops intake but leaves buffered items poppable (drain).
    // stop() refuses everything and wakes all waiters.
    // An intake gate that returns false closes the queue on the next push.
    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : cap_(capacity == 0 ? 1 : capacity) {}

        // Evaluated under the queue lock by every push; must not block.
        void set_intake_gate(std::function<bool()> open) {
            std::lock_guard lk(m_);
            gate_ = std::move(open);
        }

        // false only when the queue no longer accepts items
        bool push_drop_oldest(T v) {
            {
                std::lock_guard lk(m_);
                if (!stopped_ && !closed_ && gate_ && !gate_()) {
                    closed_ = true;
                    cv_.notify_all();
                }
                if (stopped_ || closed_) return false;
                if (q_.size() >= cap_) {
                    q_.pop_front();
                    ++dropped_;
                }
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        bool try_pop(T& out) {
            std::lock_guard lk(m_);
            if (stopped_ || q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        // Waits until an item is available, the queue is closed and empty,
        // or the timeout expires.
        bool pop_for(T& out, std::chrono::milliseconds d) {
            std::unique_lock lk(m_);
            if (!cv_.wait_for(lk, d, [&]{ return stopped_ || closed_ || !q_.empty(); })) return false;
            if (stopped_ || q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void close() {
            {
                std::lock_guard lk(m_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        void stop() {
            {
                std::lock_guard lk(m_);
                stopped_ = true;
                closed_ = true;
                q_.clear();
            }
            cv_.notify_all();
        }

        // closed and nothing left to drain
        bool finished() const {
            std::lock_guard lk(m_);
            return stopped_ || (closed_ && q_.empty());
        }

        bool closed() const {
            std::lock_guard lk(m_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard lk(m_);
            return q_.size();
        }

        uint64_t dropped() const {
            std::lock_guard lk(m_);
            return dropped_;
        }

        size_t capacity() const { return cap_; }
    private:
        size_t cap_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        std::function<bool()> gate_;
        uint64_t dropped_ = 0;
        bool closed_ = false;
        bool stopped_ = false;
    };
}
