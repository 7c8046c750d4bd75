#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Bounded FIFO between two stages. All operations are non-blocking; a
// consumer polls with tryPop() and backs off when empty.
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False if the channel is full or closed; value is untouched then.
    bool tryPush(T& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(value));
        return true;
    }

    bool tryPush(T&& value) {
        return tryPush(value);
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    // Producers are refused after close(); queued items can still be drained.
    void close() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mtx_;
    std::deque<T> items_;
    std::size_t capacity_;
    bool closed_ = false;
};
