#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Fixed-capacity FIFO that overwrites its oldest element when full.
 *
 * Not synchronised; owners provide their own locking.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
        buffer_.reserve(capacity_);
    }

    /**
     * @brief Appends a value, evicting the oldest one when at capacity.
     * @return True if an element was evicted.
     */
    bool push(T value) {
        if (buffer_.size() < capacity_) {
            buffer_.push_back(std::move(value));
            return false;
        }
        buffer_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
        return true;
    }

    /**
     * @brief Copies the retained elements, oldest first.
     */
    std::vector<T> snapshot() const {
        std::vector<T> out;
        out.reserve(buffer_.size());
        for (size_t i = 0; i < buffer_.size(); ++i) {
            out.push_back(buffer_[(head_ + i) % buffer_.size()]);
        }
        return out;
    }

    /**
     * @brief Copies the retained elements satisfying a predicate, oldest first.
     */
    template <typename Predicate>
    std::vector<T> snapshotIf(Predicate&& predicate) const {
        std::vector<T> out;
        for (size_t i = 0; i < buffer_.size(); ++i) {
            const T& value = buffer_[(head_ + i) % buffer_.size()];
            if (predicate(value)) {
                out.push_back(value);
            }
        }
        return out;
    }

    size_t size() const { return buffer_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return buffer_.empty(); }

private:
    size_t capacity_;
    std::vector<T> buffer_;
    size_t head_{0}; ///< Index of the oldest element once the buffer is full
};

} // namespace lanwatch::infra
