#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <sys/stat.h>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/agent_sdk/include/agent_runtime.hpp"
#include "../../../shared/cpp/bus/include/http_bus.hpp"
#include "../../../shared/cpp/common/include/config.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include "../../../shared/cpp/memory/include/memory_manager.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
volatile std::sig_atomic_t g_stop = 0;

const std::set<std::string> kPhotoExtensions = {".jpg", ".jpeg", ".png", ".tiff", ".bmp", ".webp"};

struct FileInfo {
    std::uintmax_t size{0};
    std::time_t mtime{0};
};

FileInfo stat_file(const fs::path& p) {
    struct stat st {};
    if (::stat(p.c_str(), &st) != 0) throw AgentHandlerError("cannot stat " + p.string());
    return FileInfo{(std::uintmax_t)st.st_size, st.st_mtime};
}

std::string year_month(std::time_t t) {
    std::tm tm {};
    gmtime_r(&t, &tm);
    char buf[8];
    std::strftime(buf, sizeof(buf), "%Y-%m", &tm);
    return buf;
}

bool is_photo(const fs::path& p) {
    return kPhotoExtensions.count(to_lower(p.extension().string())) > 0;
}

class PhotoAgent : public Agent {
public:
    explicit PhotoAgent(std::string photo_dir) : photo_dir_(std::move(photo_dir)) {}

    std::string type() const override { return "photo-agent"; }
    std::set<std::string> capabilities() const override { return {"photo"}; }
    std::vector<std::string> topics() const override { return {"crm.new_client", "calendar.session_scheduled"}; }

    json receive(const Message& msg, AgentContext& ctx) override {
        if (msg.kind == MessageKind::Event) {
            on_event(msg, ctx);
            return json();
        }
        const json input = msg.payload.value("input", json::object());
        std::string task_type = input.value("type", std::string("organize_photos"));
        if (task_type == "organize_photos") return organize(input.value("path", photo_dir_), msg, ctx);
        if (task_type == "analyze_photo") return analyze(input.value("photo_path", std::string()));
        if (task_type == "create_client_folder") return create_client_folder(input.value("client_name", std::string()));
        if (task_type == "get_stats") return stats();
        throw AgentHandlerError("unknown task type: " + task_type);
    }

private:
    // Groups the photos in a directory by year-month of modification.
    json organize(const std::string& path, const Message& msg, AgentContext& ctx) {
        if (path.empty() || !fs::is_directory(path)) throw AgentHandlerError("photo directory not found: " + path);
        std::map<std::string, int> by_month;
        int total = 0, errors = 0;
        for (const auto& entry : fs::directory_iterator(path)) {
            if (!entry.is_regular_file() || !is_photo(entry.path())) continue;
            try {
                ++by_month[year_month(stat_file(entry.path()).mtime)];
                ++total;
            } catch (const AgentHandlerError& e) {
                log_warn("photo-agent", e.what());
                ++errors;
            }
        }
        organized_ += total;
        errors_ += errors;
        json result = {{"source_path", path}, {"organized_count", total}, {"error_count", errors}, {"by_month", by_month}};

        std::string task_id = msg.payload.value("task_id", std::string());
        if (!task_id.empty()) {
            ctx.memory.store(MemoryType::Episodic, "organize:" + task_id, result, std::nullopt,
                             {{"agent", ctx.agent_id}, {"kind", "organize"}});
        }
        ctx.bus.publish("photos.organized", result);
        log_info("photo-agent", "Organized " + std::to_string(total) + " photo(s) from " + path);
        return result;
    }

    json analyze(const std::string& photo_path) {
        if (photo_path.empty()) throw AgentHandlerError("photo_path required");
        fs::path p(photo_path);
        if (!fs::is_regular_file(p)) throw AgentHandlerError("photo not found: " + photo_path);
        auto info = stat_file(p);
        ++analyzed_;
        return json{
            {"file_name", p.filename().string()},
            {"file_size", info.size},
            {"month", year_month(info.mtime)},
            {"format", to_lower(p.extension().string())},
            {"supported", is_photo(p)}
        };
    }

    json create_client_folder(const std::string& client_name) {
        if (client_name.empty()) throw AgentHandlerError("client_name required");
        if (client_name.find('/') != std::string::npos || client_name == "." || client_name == "..") {
            throw AgentHandlerError("invalid client name: " + client_name);
        }
        fs::path folder = fs::path(photo_dir_) / "clients" / client_name;
        std::error_code ec;
        bool created = fs::create_directories(folder, ec);
        if (ec) throw AgentHandlerError("cannot create " + folder.string() + ": " + ec.message());
        log_info("photo-agent", (created ? "Created " : "Reusing ") + folder.string());
        return json{{"client_name", client_name}, {"folder", folder.string()}, {"created", created}};
    }

    json stats() const {
        return json{{"photos_organized", organized_.load()}, {"photos_analyzed", analyzed_.load()},
                    {"errors", errors_.load()}};
    }

    void on_event(const Message& msg, AgentContext& ctx) {
        if (msg.topic == "crm.new_client") {
            std::string client = msg.payload.value("client_id", std::string());
            if (client.empty()) throw AgentHandlerError("crm.new_client without client_id");
            ctx.memory.store(MemoryType::Episodic, "client:" + client, msg.payload, std::nullopt,
                             {{"source", "crm"}});
        } else if (msg.topic == "calendar.session_scheduled") {
            std::string session = msg.payload.value("session_id", std::string());
            if (session.empty()) throw AgentHandlerError("calendar.session_scheduled without session_id");
            ctx.memory.store(MemoryType::Working, "session:" + session, msg.payload, std::chrono::hours(24));
        }
    }

    std::string photo_dir_;
    std::atomic<int> organized_{0};
    std::atomic<int> analyzed_{0};
    std::atomic<int> errors_{0};
};
}

int main(int argc, char** argv) {
    FleetConfig cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& e) {
        log_error("photo-agent", std::string("bad configuration: ") + e.what());
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));

    RuntimeConfig rc = RuntimeConfig::from(cfg);
    std::string photo_dir = getenv_or("PHOTO_DIR", "./data/photos");
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--id" && i + 1 < argc) rc.agent_id = argv[++i];
        else if (a == "--photo-dir" && i + 1 < argc) photo_dir = argv[++i];
    }
    log_info("photo-agent", "Starting. BROKER_URL=" + cfg.broker_url + " PHOTO_DIR=" + photo_dir);

    try {
        HttpBus bus(cfg.broker_url, std::string(), RetryPolicy::from(cfg));
        MemoryManagerOptions mopts;
        mopts.sweep_interval = cfg.working_sweep_interval;
        MemoryManager memory(std::make_shared<SqliteDurableStore>(cfg.memory_db_path), mopts);
        memory.start_sweeper();

        AgentRuntime runtime(std::make_shared<PhotoAgent>(photo_dir), bus, memory, rc);
        runtime.start();

        std::signal(SIGTERM, [](int){ g_stop = 1; });
        std::signal(SIGINT, [](int){ g_stop = 1; });
        while (!g_stop && runtime.state() == RuntimeState::Running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        runtime.stop();
        return runtime.state() == RuntimeState::Failed ? 1 : 0;
    } catch (const std::exception& e) {
        log_error("photo-agent", e.what());
        return 1;
    }
}
