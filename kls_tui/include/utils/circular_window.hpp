#pragma once

#include <cstddef>
#include <vector>

namespace kls::tui {

/**
 * Rotating view over a fixed backing sequence.
 *
 * The backing vector is never reordered; scrolling only moves the rotation
 * offset, so wrap-around is free. A view of length k starting at logical
 * position 0 yields backing positions idx, idx+1, ... (mod size).
 */
template <typename T>
class CircularWindow {
public:
    CircularWindow() = default;
    explicit CircularWindow(std::vector<T> elements)
        : elements_(std::move(elements)) {}

    size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }
    size_t offset() const { return idx_; }
    const std::vector<T>& elements() const { return elements_; }

    /**
     * Returns k logical elements starting at the rotation offset.
     * k may exceed size(), in which case elements repeat. Empty when the
     * backing sequence is empty.
     */
    std::vector<T> view(size_t k) const {
        std::vector<T> out;
        if (elements_.empty()) {
            return out;
        }
        out.reserve(k);
        for (size_t i = 0; i < k; ++i) {
            out.push_back(elements_[(idx_ + i) % elements_.size()]);
        }
        return out;
    }

    // Logical element at position i of the current view.
    const T& at(size_t i) const {
        return elements_.at((idx_ + i) % elements_.size());
    }

    void shift(long steps) {
        if (elements_.empty()) {
            return;
        }
        const long n = static_cast<long>(elements_.size());
        long next = (static_cast<long>(idx_) + steps % n) % n;
        if (next < 0) {
            next += n;
        }
        idx_ = static_cast<size_t>(next);
    }

    void reset() { idx_ = 0; }

private:
    std::vector<T> elements_;
    size_t idx_ = 0;
};

} // namespace kls::tui
