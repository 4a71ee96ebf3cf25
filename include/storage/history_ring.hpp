#pragma once

#include <cstddef>
#include <vector>

namespace benchlog {

// Bounded ring that keeps the newest `capacity` items.
// Pushing into a full ring overwrites the oldest item. Capacity is fixed at
// construction (runtime value), storage is allocated once up front.
// Not thread-safe: the owner serializes access.
template <typename T>
class HistoryRing {
public:
    explicit HistoryRing(size_t capacity)
        : buffer_(capacity > 0 ? capacity : 1)
        , head_(0)
        , count_(0)
    {}

    // Returns true if an item was evicted to make room
    bool push(const T& item) {
        const size_t cap = buffer_.size();
        buffer_[(head_ + count_) % cap] = item;
        if (count_ < cap) {
            ++count_;
            return false;
        }
        head_ = (head_ + 1) % cap;
        return true;
    }

    // 0 = oldest
    const T& operator[](size_t i) const { return buffer_[(head_ + i) % buffer_.size()]; }

    const T& oldest() const { return (*this)[0]; }
    const T& newest() const { return (*this)[count_ - 1]; }

    size_t size() const { return count_; }
    size_t capacity() const { return buffer_.size(); }
    bool empty() const { return count_ == 0; }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

    // Oldest-first copy
    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

private:
    std::vector<T> buffer_;
    size_t head_;
    size_t count_;
};

} // namespace benchlog
