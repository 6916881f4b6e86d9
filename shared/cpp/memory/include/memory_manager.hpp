#pragma once
#include "durable_store.hpp"
#include "memory_sequence.hpp"
#include "memory_types.hpp"
#include "working_memory.hpp"
#include <array>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct MemoryManagerOptions {
    std::chrono::milliseconds sweep_interval{1000};
    std::size_t page_size{64};
};

// Typed view over the five memory categories. Working memory lives in
// process with a mandatory TTL; the other four go to the DurableStore.
// Operations on the same (type, key) are linearizable; different keys
// never wait on each other beyond lock-stripe collisions.
class MemoryManager {
public:
    explicit MemoryManager(std::shared_ptr<DurableStore> durable, MemoryManagerOptions opts = {});
    ~MemoryManager();
    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    // Working memory requires a positive ttl, durable types reject one.
    // Throws InvalidArgument.
    void store(MemoryType type, const std::string& key, nlohmann::json value,
               std::optional<std::chrono::milliseconds> ttl = std::nullopt,
               std::map<std::string, std::string> metadata = {});

    // Throws NotFound.
    nlohmann::json retrieve(MemoryType type, const std::string& key);
    std::optional<MemoryItem> find(MemoryType type, const std::string& key);
    bool erase(MemoryType type, const std::string& key);

    MemorySequence list(MemoryType type, MemoryFilter filter = {});
    MemoryStats stats();

    // Drops expired working items; returns the number removed.
    std::size_t sweep_expired();

    // Background sweep every sweep_interval. Idempotent.
    void start_sweeper();
    void stop_sweeper();

private:
    static constexpr std::size_t kKeyStripes = 64;
    std::mutex& key_lock(MemoryType type, const std::string& key);
    void sweep_loop();

    std::shared_ptr<DurableStore> durable_;
    std::shared_ptr<WorkingMemory> working_;
    MemoryManagerOptions opts_;
    std::array<std::mutex, kKeyStripes> key_locks_;

    std::mutex sweep_mtx_;
    std::condition_variable sweep_cv_;
    bool sweep_stop_{false};
    std::thread sweeper_;
};
