#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "stowage/contract.hpp"
#include "stowage/local/storage.hpp"
#include "stowage/log/logger.hpp"
#include "stowage/memory/footprint.hpp"


namespace stowage {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded FIFO buffer over a flat array.
//
// Items are appended at the back with put() and consumed from the front with
// front()/pop_front(). Consuming the last item rewinds both cursors to zero,
// so a buffer that is drained regularly keeps reusing the same slots and
// never reallocates.
//
// Storage:
//   storage::fixed     - std::array<T, OriginalCapacity> embedded in the
//                        object. Putting past capacity is a contract violation.
//   storage::growable  - std::vector<T>. Starts without storage; the first put
//                        allocates OriginalCapacity slots, later growth is by
//                        a factor of 1.5.
//
// Emptying:
//   reset()  - cursors back to zero, old values stay in the slots
//   clear()  - reset() plus every slot overwritten with T{}
//
// Thread-safety:
//   - NOT thread-safe. Callers sharing a buffer serialize access themselves.
//
// Example:
//   linear_buffer<std::string, storage::fixed, 16> lines;
//   lines.put("PING :irc.example.net");
//   while (!lines.empty()) {
//       handle(lines.front());
//       lines.pop_front();
//   }
//
// Template parameters:
//   T                 - element type, must be default constructible
//   Storage           - fixed or growable backing store
//   OriginalCapacity  - fixed capacity, or first allocation when growable
//------------------------------------------------------------------------------
template <typename T, storage Storage = storage::fixed, std::size_t OriginalCapacity = 128>
class linear_buffer {
    static_assert(OriginalCapacity > 0, "OriginalCapacity must be > 0");
    static_assert(std::is_default_constructible_v<T>, "linear_buffer requires default constructible T");

    static constexpr bool is_growable = (Storage == storage::growable);
    static_assert(!(is_growable && std::is_same_v<T, bool>),
                  "growable linear_buffer<bool> would sit on std::vector<bool>");

    using backing_type = std::conditional_t<is_growable,
                                            std::vector<T>,
                                            std::array<T, OriginalCapacity>>;

public:
    using value_type      = T;
    using size_type       = std::size_t;
    using reference       = T&;
    using const_reference = const T&;
    using iterator        = T*;
    using const_iterator  = const T*;

    static constexpr double growth_factor = 1.5;
    static constexpr size_type original_capacity = OriginalCapacity;

    linear_buffer() = default;

    // Append (copy)
    inline void put(const T& item) {
        make_room();
        buf_[end_++] = item;
    }

    // Append (move)
    inline void put(T&& item) {
        make_room();
        buf_[end_++] = std::move(item);
    }

    // Append (construct from arguments)
    template <typename... Args>
    inline void emplace_put(Args&&... args) {
        make_room();
        buf_[end_++] = T(std::forward<Args>(args)...);
    }

    [[nodiscard]] inline T& front() noexcept {
        STOWAGE_EXPECTS(end_ > 0, "linear_buffer underrun");
        return buf_[pos_];
    }

    [[nodiscard]] inline const T& front() const noexcept {
        STOWAGE_EXPECTS(end_ > 0, "linear_buffer underrun");
        return buf_[pos_];
    }

    inline void pop_front() noexcept {
        STOWAGE_EXPECTS(end_ > 0, "linear_buffer underrun");
        if (++pos_ == end_) reset();
    }

    // Distance between the front cursor and the end of written data
    [[nodiscard]] inline size_type size() const noexcept { return end_ - pos_; }

    [[nodiscard]] inline bool empty() const noexcept { return end_ == 0; }

    [[nodiscard]] inline size_type capacity() const noexcept {
        if constexpr (is_growable) {
            return buf_.size();
        } else {
            return OriginalCapacity;
        }
    }

    // Grows the backing store to hold at least `n` items. Never shrinks.
    inline void reserve(size_type n) requires is_growable {
        if (buf_.size() < n) {
            STOWAGE_TRACE("[LINEAR] reserve " << buf_.size() << " -> " << n);
            buf_.resize(n);
        }
    }

    // Soft empty: cursors rewind, slot contents are left as they are
    inline void reset() noexcept {
        pos_ = 0;
        end_ = 0;
    }

    inline void clear() {
        reset();
        std::fill(buf_.begin(), buf_.end(), T{});
    }

    // -------------------------------------------------------------------------
    // Views
    // -------------------------------------------------------------------------

    // Live items, front to back
    [[nodiscard]] inline iterator begin() noexcept { return buf_.data() + pos_; }
    [[nodiscard]] inline iterator end() noexcept { return buf_.data() + end_; }
    [[nodiscard]] inline const_iterator begin() const noexcept { return buf_.data() + pos_; }
    [[nodiscard]] inline const_iterator end() const noexcept { return buf_.data() + end_; }

    // The whole backing store, including consumed and stale slots
    [[nodiscard]] inline std::span<const T> data() const noexcept {
        return std::span<const T>(buf_.data(), capacity());
    }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        memory::footprint fp{ .static_bytes = sizeof(*this), .dynamic_bytes = 0 };
        if constexpr (is_growable) {
            fp.dynamic_bytes = buf_.capacity() * sizeof(T);
        }
        return fp;
    }

private:
    inline void make_room() {
        if constexpr (is_growable) {
            if (end_ == buf_.size()) {
                grow();
            }
        } else {
            STOWAGE_EXPECTS(end_ < OriginalCapacity, "linear_buffer overflow");
        }
    }

    inline void grow() requires is_growable {
        const size_type current = buf_.size();
        size_type next = (current == 0)
            ? OriginalCapacity
            : static_cast<size_type>(static_cast<double>(current) * growth_factor);
        // Small capacities truncate back to themselves (1 * 1.5 == 1)
        next = std::max({next, OriginalCapacity, current + 1});
        STOWAGE_TRACE("[LINEAR] grow " << current << " -> " << next);
        buf_.resize(next);
    }

private:
    backing_type buf_{};
    size_type pos_{0};
    size_type end_{0};
};

} // namespace local
} // namespace stowage
