#pragma once
#include "memory_types.hpp"
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

// Lazy, finite, restartable view over one memory type in (stored_at, key)
// order. Items are fetched a page at a time through PageFn; each begin()
// starts a fresh pass. Expiry and the filter are re-checked as the iterator
// advances, so an item that expires mid-iteration is skipped.
class MemorySequence {
public:
    using PageFn = std::function<std::vector<MemoryItem>(const std::optional<ListCursor>& after,
                                                         std::size_t limit)>;

    MemorySequence(PageFn fetch, MemoryFilter filter, std::size_t page_size);

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MemoryItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const MemoryItem*;
        using reference = const MemoryItem&;

        iterator() = default;

        reference operator*() const { return *state_->current; }
        pointer operator->() const { return &*state_->current; }
        iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }

        bool operator==(const iterator& o) const { return at_end() == o.at_end() && (at_end() || state_ == o.state_); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class MemorySequence;
        struct State {
            PageFn fetch;
            MemoryFilter filter;
            std::size_t page_size{64};
            std::vector<MemoryItem> page;
            std::size_t index{0};
            std::optional<ListCursor> cursor;
            bool exhausted{false};
            std::size_t yielded{0};
            std::optional<MemoryItem> current;
        };

        explicit iterator(std::shared_ptr<State> s) : state_(std::move(s)) { advance(); }
        void advance();
        bool at_end() const { return !state_ || !state_->current; }

        std::shared_ptr<State> state_;
    };

    iterator begin() const;
    iterator end() const { return iterator(); }

    // Drains one pass into a vector.
    std::vector<MemoryItem> to_vector() const;

private:
    PageFn fetch_;
    MemoryFilter filter_;
    std::size_t page_size_;
};
