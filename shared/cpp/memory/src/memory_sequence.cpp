#include "../include/memory_sequence.hpp"
#include "../../common/include/util.hpp"
#include <chrono>

MemorySequence::MemorySequence(PageFn fetch, MemoryFilter filter, std::size_t page_size)
    : fetch_(std::move(fetch)), filter_(std::move(filter)), page_size_(page_size == 0 ? 1 : page_size) {}

MemorySequence::iterator MemorySequence::begin() const {
    auto s = std::make_shared<iterator::State>();
    s->fetch = fetch_;
    s->filter = filter_;
    s->page_size = page_size_;
    return iterator(std::move(s));
}

void MemorySequence::iterator::advance() {
    if (!state_) return;
    auto& s = *state_;
    s.current.reset();
    if (s.filter.limit && s.yielded >= *s.filter.limit) return;

    for (;;) {
        if (s.index >= s.page.size()) {
            if (s.exhausted) return;
            s.page = s.fetch(s.cursor, s.page_size);
            s.index = 0;
            if (s.page.size() < s.page_size) s.exhausted = true;
            if (s.page.empty()) return;
        }
        MemoryItem& item = s.page[s.index++];
        s.cursor = ListCursor{to_unix_ms(item.stored_at), item.key};
        if (item.expired(std::chrono::system_clock::now())) continue;
        if (!s.filter.matches(item)) continue;
        s.current = std::move(item);
        ++s.yielded;
        return;
    }
}

std::vector<MemoryItem> MemorySequence::to_vector() const {
    std::vector<MemoryItem> out;
    for (auto it = begin(); it != end(); ++it) out.push_back(*it);
    return out;
}
