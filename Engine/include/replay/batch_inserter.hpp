#pragma once

#include <algorithm>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ChainReplay {

/**
 * @brief Bounded row buffer that hands full batches to a bulk insert.
 *
 * Every insert call except the one made by flush() receives exactly
 * batch_size rows; order is preserved and an empty batch is never sent.
 * One instance per target table, used from one thread.
 */
template <typename T>
class BatchInserter {
public:
    using InsertFn = std::function<void(const std::vector<T>&)>;

    BatchInserter(size_t batch_size, InsertFn insert)
        : batch_size_(batch_size), insert_(std::move(insert)) {
        if (batch_size_ == 0) {
            throw std::invalid_argument("BatchInserter: batch size must be positive");
        }
        buffer_.reserve(batch_size_);
    }

    void push(T item) {
        buffer_.push_back(std::move(item));
        if (buffer_.size() == batch_size_) {
            insert_(buffer_);
            buffer_.clear();
        }
    }

    void push(std::vector<T> items) {
        if (items.empty()) return;
        buffer_.insert(buffer_.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));

        if (buffer_.size() == batch_size_) {
            insert_(buffer_);
            buffer_.clear();
        } else if (buffer_.size() > batch_size_) {
            size_t full = (buffer_.size() / batch_size_) * batch_size_;
            std::vector<T> batch;
            batch.reserve(batch_size_);
            for (size_t start = 0; start < full; start += batch_size_) {
                batch.assign(std::make_move_iterator(buffer_.begin() + static_cast<std::ptrdiff_t>(start)),
                             std::make_move_iterator(buffer_.begin() + static_cast<std::ptrdiff_t>(start + batch_size_)));
                insert_(batch);
            }
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(full));
        }
    }

    void flush() {
        if (buffer_.empty()) return;
        insert_(buffer_);
        buffer_.clear();
    }

    size_t pending() const { return buffer_.size(); }
    size_t batch_size() const { return batch_size_; }

private:
    size_t batch_size_;
    InsertFn insert_;
    std::vector<T> buffer_;
};

} // namespace ChainReplay
