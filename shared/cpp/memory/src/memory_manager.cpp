#include "../include/memory_manager.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/log.hpp"
#include "../../common/include/util.hpp"
#include <algorithm>
#include <functional>

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

namespace {
Clock::time_point now_ms() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}
}

MemoryManager::MemoryManager(std::shared_ptr<DurableStore> durable, MemoryManagerOptions opts)
    : durable_(std::move(durable)), working_(std::make_shared<WorkingMemory>()), opts_(opts) {
    if (!durable_) throw InvalidArgument("MemoryManager requires a durable store");
}

MemoryManager::~MemoryManager() {
    stop_sweeper();
}

std::mutex& MemoryManager::key_lock(MemoryType type, const std::string& key) {
    std::size_t h = std::hash<std::string>{}(key) ^ (static_cast<std::size_t>(type) * 0x9e3779b97f4a7c15ULL);
    return key_locks_[h % kKeyStripes];
}

void MemoryManager::store(MemoryType type, const std::string& key, json value,
                          std::optional<std::chrono::milliseconds> ttl,
                          std::map<std::string, std::string> metadata) {
    if (key.empty()) throw InvalidArgument("memory key must not be empty");
    if (type == MemoryType::Working) {
        if (!ttl) throw InvalidArgument("working memory requires a ttl");
        if (ttl->count() <= 0) throw InvalidArgument("working memory ttl must be positive");
    } else if (ttl) {
        throw InvalidArgument(to_string(type) + " memory does not take a ttl");
    }

    MemoryItem item;
    item.type = type;
    item.key = key;
    item.value = std::move(value);
    item.ttl = ttl;
    item.metadata = std::move(metadata);

    std::lock_guard<std::mutex> lock(key_lock(type, key));
    item.stored_at = now_ms();
    if (type == MemoryType::Working) working_->put(std::move(item));
    else durable_->put(item);
}

std::optional<MemoryItem> MemoryManager::find(MemoryType type, const std::string& key) {
    std::lock_guard<std::mutex> lock(key_lock(type, key));
    if (type == MemoryType::Working) return working_->get(key, Clock::now());
    return durable_->get(type, key);
}

json MemoryManager::retrieve(MemoryType type, const std::string& key) {
    auto item = find(type, key);
    if (!item) throw NotFound("no " + to_string(type) + " memory for key '" + key + "'");
    return item->value;
}

bool MemoryManager::erase(MemoryType type, const std::string& key) {
    std::lock_guard<std::mutex> lock(key_lock(type, key));
    if (type == MemoryType::Working) return working_->erase(key);
    return durable_->erase(type, key);
}

MemorySequence MemoryManager::list(MemoryType type, MemoryFilter filter) {
    std::string prefix = filter.key_prefix.value_or("");
    MemorySequence::PageFn fetch;
    if (type == MemoryType::Working) {
        std::weak_ptr<WorkingMemory> weak = working_;
        fetch = [weak, prefix](const std::optional<ListCursor>& after, std::size_t limit) {
            std::vector<MemoryItem> page;
            auto wm = weak.lock();
            if (!wm) return page;
            for (auto& item : wm->snapshot(Clock::now())) {
                if (page.size() >= limit) break;
                if (after) {
                    auto ms = to_unix_ms(item.stored_at);
                    if (ms < after->stored_at_ms) continue;
                    if (ms == after->stored_at_ms && item.key <= after->key) continue;
                }
                if (!prefix.empty() && item.key.compare(0, prefix.size(), prefix) != 0) continue;
                page.push_back(std::move(item));
            }
            return page;
        };
    } else {
        std::shared_ptr<DurableStore> store = durable_;
        fetch = [store, type, prefix](const std::optional<ListCursor>& after, std::size_t limit) {
            return store->scan(type, after, limit, prefix);
        };
    }
    return MemorySequence(std::move(fetch), std::move(filter), opts_.page_size);
}

MemoryStats MemoryManager::stats() {
    MemoryStats out;
    auto now = Clock::now();
    for (auto t : kAllMemoryTypes) {
        auto s = t == MemoryType::Working ? working_->stats(now) : durable_->stats(t);
        out.total += s.count;
        out.by_type[t] = s;
    }
    return out;
}

std::size_t MemoryManager::sweep_expired() {
    return working_->sweep(Clock::now());
}

void MemoryManager::start_sweeper() {
    std::lock_guard<std::mutex> lock(sweep_mtx_);
    if (sweeper_.joinable()) return;
    sweep_stop_ = false;
    sweeper_ = std::thread([this]{ sweep_loop(); });
}

void MemoryManager::stop_sweeper() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(sweep_mtx_);
        sweep_stop_ = true;
        t = std::move(sweeper_);
    }
    sweep_cv_.notify_all();
    if (t.joinable()) t.join();
}

void MemoryManager::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mtx_);
    while (!sweep_stop_) {
        sweep_cv_.wait_for(lock, opts_.sweep_interval, [this]{ return sweep_stop_; });
        if (sweep_stop_) break;
        lock.unlock();
        std::size_t n = sweep_expired();
        if (n > 0) log_debug("memory", "Swept " + std::to_string(n) + " expired working item(s)");
        lock.lock();
    }
}
