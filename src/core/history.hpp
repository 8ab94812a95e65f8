#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Bounded, thread-safe history that keeps only the newest entries
 *
 * Pushing beyond capacity drops the oldest entry (trim-to-last-N).
 * Used for the link's recent command journal, which is written from
 * whichever front end issues a command and read by status queries.
 */
template<typename T>
class BoundedHistory {
private:
    mutable std::mutex mtx_;
    std::deque<T> items_;
    size_t capacity_;

public:
    /**
     * @brief Construct with a fixed capacity
     * @param n Maximum number of entries retained (at least 1)
     */
    explicit BoundedHistory(size_t n) : capacity_(n == 0 ? 1 : n) {}

    void push(const T& v) {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.push_back(v);
        while (items_.size() > capacity_) {
            items_.pop_front();
        }
    }

    /**
     * @brief Copy of the entries, oldest first
     */
    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::vector<T>(items_.begin(), items_.end());
    }

    std::optional<T> latest() const {
        std::lock_guard<std::mutex> lock(mtx_);
        if (items_.empty()) return std::nullopt;
        return items_.back();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    bool empty() const { return size() == 0; }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.clear();
    }
};
