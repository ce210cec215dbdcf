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
// Single-threaded bounded history buffer.
//
// A circular buffer that never grows on put(): once every slot is written,
// each new item silently overwrites the oldest one. Reading is newest-first:
// front() is the most recently put item and pop_front() steps back toward
// older ones.
//
// Cursor model:
//   head_       - slot of the item front() returns
//   tail_       - slot of the last put(); head_ == tail_ marks the walk's end
//   caught_up_  - head_ and tail_ coincide because nothing was consumed yet
//   initialised_- at least one put() happened since the last reset
//
//   put() advances head_ (except for the very first write), then pins
//   tail_ = head_ and sets caught_up_. pop_front() moves head_ backward and
//   clears caught_up_ when it wraps from slot 0 to the last slot. The buffer
//   is empty when !caught_up_ && head_ == tail_.
//
//   A walk always visits every slot, so a partially filled buffer yields the
//   unwritten slots (T{}) after its real items.
//
// Storage:
//   storage::fixed     - std::array<T, Capacity>, Capacity >= 2
//   storage::growable  - std::vector<T>, zero capacity until sized with the
//                        capacity constructor or resize(). Capacity is ignored.
//
// Copies:
//   dup()   - deep copy, always independent of the original
//   save()  - fixed storage: same as dup()
//             growable storage: a cursor over this buffer's storage; walking
//             it never moves the original's cursors, but later writes to the
//             original are visible through it
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//
// Example:
//   ring_buffer<int, storage::fixed, 3> recent;
//   for (int i = 1; i <= 4; ++i) recent.put(i);  // slots: [4, 2, 3]
//   while (!recent.empty()) {
//       use(recent.front());                       // 4, 3, 2
//       recent.pop_front();
//   }
//------------------------------------------------------------------------------
template <typename T, storage Storage = storage::fixed, std::size_t Capacity = 16>
class ring_buffer {
    static_assert(std::is_default_constructible_v<T>, "ring_buffer requires default constructible T");
    static_assert(Storage == storage::growable || Capacity >= 2,
                  "fixed ring_buffer capacity must be >= 2");

    static constexpr bool is_growable = (Storage == storage::growable);
    static_assert(!(is_growable && std::is_same_v<T, bool>),
                  "growable ring_buffer<bool> would sit on std::vector<bool>");

    using backing_type = std::conditional_t<is_growable,
                                            std::vector<T>,
                                            std::array<T, Capacity>>;

public:
    using value_type = T;
    using size_type  = std::size_t;

    // -------------------------------------------------------------------------
    // Read-only cursor over a growable buffer's storage (see save()).
    //
    // The owner may be resized after the cursor was taken; the cursor then
    // clamps its slots into the owner's current capacity, as resize() does
    // for the owner's own cursors. The owner must outlive the cursor.
    // -------------------------------------------------------------------------
    class cursor {
    public:
        [[nodiscard]] inline const T& front() const noexcept {
            const size_type cap = owner_->capacity();
            STOWAGE_EXPECTS(cap > 0, "ring_buffer has zero capacity");
            return owner_->buf_[clamp(head_, cap)];
        }

        inline void pop_front() noexcept {
            const size_type cap = owner_->capacity();
            STOWAGE_EXPECTS(cap > 0, "ring_buffer has zero capacity");
            head_ = clamp(head_, cap);
            tail_ = clamp(tail_, cap);
            STOWAGE_EXPECTS(!empty(), "ring_buffer underrun");
            step_back(head_, caught_up_, cap);
        }

        [[nodiscard]] inline bool empty() const noexcept {
            const size_type cap = owner_->capacity();
            return !caught_up_ && clamp(head_, cap) == clamp(tail_, cap);
        }

    private:
        friend class ring_buffer;

        cursor(const ring_buffer& owner) noexcept
            : owner_(&owner)
            , head_(owner.head_)
            , tail_(owner.tail_)
            , caught_up_(owner.caught_up_)
        {}

        const ring_buffer* owner_;
        size_type head_;
        size_type tail_;
        bool caught_up_;
    };

    ring_buffer() = default;

    explicit ring_buffer(size_type capacity) requires is_growable
        : buf_(capacity)
    {}

    // Write (copy)
    inline void put(const T& item) {
        buf_[advance()] = item;
    }

    // Write (move)
    inline void put(T&& item) {
        buf_[advance()] = std::move(item);
    }

    // Most recently put item, or the item the last pop_front() stepped to
    [[nodiscard]] inline T& front() noexcept {
        STOWAGE_EXPECTS(capacity() > 0, "ring_buffer has zero capacity");
        return buf_[head_];
    }

    [[nodiscard]] inline const T& front() const noexcept {
        STOWAGE_EXPECTS(capacity() > 0, "ring_buffer has zero capacity");
        return buf_[head_];
    }

    // Steps toward the next older item
    inline void pop_front() noexcept {
        STOWAGE_EXPECTS(capacity() > 0, "ring_buffer has zero capacity");
        STOWAGE_EXPECTS(!empty(), "ring_buffer underrun");
        step_back(head_, caught_up_, capacity());
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return !caught_up_ && head_ == tail_;
    }

    [[nodiscard]] inline size_type capacity() const noexcept {
        if constexpr (is_growable) {
            return buf_.size();
        } else {
            return Capacity;
        }
    }

    // Changes capacity; cursors falling outside [0, n) are clamped to n - 1
    inline void resize(size_type n) requires is_growable {
        STOWAGE_TRACE("[RING] resize " << buf_.size() << " -> " << n);
        buf_.resize(n);
        head_ = clamp(head_, n);
        tail_ = clamp(tail_, n);
    }

    [[nodiscard]] inline ring_buffer dup() const {
        return *this;
    }

    [[nodiscard]] inline auto save() const {
        if constexpr (is_growable) {
            return cursor(*this);
        } else {
            return dup();
        }
    }

    // Cursors back to the initial state, slot contents untouched
    inline void reset() noexcept {
        head_ = 0;
        tail_ = 0;
        caught_up_ = false;
        initialised_ = false;
    }

    inline void clear() {
        reset();
        std::fill(buf_.begin(), buf_.end(), T{});
    }

    [[nodiscard]] inline size_type head() const noexcept { return head_; }
    [[nodiscard]] inline size_type tail() const noexcept { return tail_; }

    // Backing store in slot order
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
    // Moves head_ to the slot the next put() writes and pins tail_ to it
    inline size_type advance() noexcept {
        STOWAGE_EXPECTS(capacity() > 0, "ring_buffer has zero capacity");
        if (initialised_) {
            if (++head_ >= capacity()) head_ = 0;
        } else {
            initialised_ = true;
        }
        tail_ = head_;
        caught_up_ = true;
        return head_;
    }

    static inline size_type clamp(size_type slot, size_type cap) noexcept {
        return (slot < cap) ? slot : (cap > 0 ? cap - 1 : 0);
    }

    static inline void step_back(size_type& head, bool& caught_up, size_type cap) noexcept {
        if (head == 0) {
            head = cap - 1;
            caught_up = false;
        } else {
            --head;
        }
    }

private:
    backing_type buf_{};
    size_type head_{0};
    size_type tail_{0};
    bool caught_up_{false};
    bool initialised_{false};
};

} // namespace local
} // namespace stowage
