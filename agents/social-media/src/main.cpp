#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/agent_sdk/include/agent_runtime.hpp"
#include "../../../shared/cpp/bus/include/http_bus.hpp"
#include "../../../shared/cpp/common/include/config.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/ids.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include "../../../shared/cpp/memory/include/memory_manager.hpp"

using json = nlohmann::json;

namespace {
volatile std::sig_atomic_t g_stop = 0;

struct CampaignTemplate {
    std::string title;
    std::string description;
    std::string audience;
    std::vector<std::string> locations;
};

const std::map<std::string, CampaignTemplate> kTemplates = {
    {"couple", {"Romantic Session", "Capture the unique moments of your love", "couples", {"park", "beach", "countryside"}}},
    {"family", {"Family Memories", "Keep the special family moments forever", "families", {"home", "park", "studio"}}},
    {"maternity", {"Waiting with Love", "Celebrate this unique stage of life", "expectant parents", {"studio", "home", "garden"}}}
};

// Southern-hemisphere seasons by calendar month.
std::string current_season() {
    std::time_t now = std::time(nullptr);
    std::tm tm {};
    localtime_r(&now, &tm);
    int month = tm.tm_mon + 1;
    if (month == 12 || month <= 2) return "summer";
    if (month <= 5) return "autumn";
    if (month <= 8) return "winter";
    return "spring";
}

class SocialMediaAgent : public Agent {
public:
    std::string type() const override { return "social-media-agent"; }
    std::set<std::string> capabilities() const override { return {"social_media", "marketing"}; }
    std::vector<std::string> topics() const override { return {"photos.organized", "crm.new_client"}; }

    json receive(const Message& msg, AgentContext& ctx) override {
        if (msg.kind == MessageKind::Event) {
            on_event(msg, ctx);
            return json();
        }
        const json input = msg.payload.value("input", json::object());
        std::string task_type = input.value("type", std::string("suggest_content"));
        if (task_type == "suggest_content") return suggest_content(ctx);
        if (task_type == "create_campaign") return create_campaign(input.value("service_type", std::string("couple")), ctx);
        if (task_type == "schedule_posts") return schedule_posts(input, ctx);
        if (task_type == "prepare_campaign_posts") {
            return prepare_campaign_posts(input.value("service_type", std::string("couple")), ctx);
        }
        if (task_type == "get_stats") {
            return json{{"campaigns_created", campaigns_.load()}, {"content_suggestions", suggestions_.load()},
                        {"posts_scheduled", scheduled_.load()}};
        }
        throw AgentHandlerError("unknown task type: " + task_type);
    }

private:
    json suggest_content(AgentContext& ctx) {
        std::vector<std::string> out;
        if (auto recent = ctx.memory.find(MemoryType::Working, "recent_photos")) {
            int n = recent->value.value("organized_count", 0);
            out.push_back("Share behind the scenes: " + std::to_string(n) + " moments captured recently");
            out.push_back("Show a before/after of the editing process");
        }
        static const std::map<std::string, std::vector<std::string>> seasonal = {
            {"spring", {"Use the soft natural light of spring", "Flowers and vivid colours as a backdrop"}},
            {"summer", {"Golden hour for romantic shots", "Beach sessions at sunset"}},
            {"autumn", {"Golden leaves as a natural backdrop", "Warm earthy tones"}},
            {"winter", {"Cosy indoor sessions", "Elegant outfits and textures"}}
        };
        std::string season = current_season();
        for (const auto& s : seasonal.at(season)) out.push_back(s);
        suggestions_ += (int)out.size();
        return json{{"season", season}, {"suggestions", out}};
    }

    json create_campaign(const std::string& service_type, AgentContext& ctx) {
        auto it = kTemplates.find(service_type);
        if (it == kTemplates.end()) throw AgentHandlerError("unknown service type: " + service_type);
        const auto& t = it->second;
        std::string id = "camp_" + generate_id().substr(0, 12);
        std::string places;
        for (const auto& l : t.locations) places += (places.empty() ? "" : ", ") + l;
        json campaign = {
            {"id", id},
            {"service_type", service_type},
            {"title", t.title},
            {"description", t.description},
            {"target_audience", t.audience},
            {"status", "draft"},
            {"suggested_content", {"Tips for " + t.audience, "Behind the scenes of " + to_lower(t.title),
                                   "Ideal locations: " + places}},
            {"timeline", json::array({
                {{"week", 1}, {"activity", "Create visual content"}},
                {{"week", 2}, {"activity", "Launch"}},
                {{"week", 3}, {"activity", "Increase posting"}},
                {{"week", 4}, {"activity", "Review results"}}
            })}
        };
        ctx.memory.store(MemoryType::Semantic, "campaign:" + id, campaign, std::nullopt,
                         {{"service_type", service_type}, {"agent", ctx.agent_id}});
        ctx.bus.publish("marketing.campaign_created", json{{"campaign_id", id}, {"service_type", service_type}});
        ++campaigns_;
        return campaign;
    }

    // One post a day from the content suggestions, starting tomorrow.
    json schedule_posts(const json& input, AgentContext& ctx) {
        json suggested = suggest_content(ctx)["suggestions"];
        int every_days = input.value("every_days", 1);
        if (every_days < 1) throw AgentHandlerError("every_days must be >= 1");
        json posts = json::array();
        int day = 0;
        for (const auto& s : suggested) {
            day += every_days;
            posts.push_back({{"day", day}, {"content", s}, {"status", "scheduled"}});
        }
        std::string key = "post_schedule:" + input.value("workflow_id", generate_id());
        ctx.memory.store(MemoryType::Working, key, posts, std::chrono::hours(24 * 7));
        scheduled_ += (int)posts.size();
        return json{{"schedule_key", key}, {"posts", posts}};
    }

    json prepare_campaign_posts(const std::string& service_type, AgentContext& ctx) {
        auto it = kTemplates.find(service_type);
        if (it == kTemplates.end()) throw AgentHandlerError("unknown service type: " + service_type);
        const auto& t = it->second;
        json posts = json::array();
        posts.push_back({{"kind", "teaser"}, {"text", t.title + ": coming soon for " + t.audience}});
        for (const auto& l : t.locations) {
            posts.push_back({{"kind", "location"}, {"text", t.description + " at the " + l}});
        }
        posts.push_back({{"kind", "call_to_action"}, {"text", "Book your " + to_lower(t.title) + " today"}});
        ctx.memory.store(MemoryType::Semantic, "campaign_posts:" + service_type, posts, std::nullopt,
                         {{"agent", ctx.agent_id}});
        return json{{"service_type", service_type}, {"posts", posts}};
    }

    void on_event(const Message& msg, AgentContext& ctx) {
        if (msg.topic == "photos.organized") {
            ctx.memory.store(MemoryType::Working, "recent_photos", msg.payload, std::chrono::hours(24));
        } else if (msg.topic == "crm.new_client") {
            std::string client = msg.payload.value("client_id", std::string());
            if (client.empty()) throw AgentHandlerError("crm.new_client without client_id");
            ctx.memory.store(MemoryType::Emotional, "client_mood:" + client,
                             json{{"sentiment", msg.payload.value("sentiment", std::string("neutral"))}},
                             std::nullopt, {{"source", "crm"}});
        }
    }

    std::atomic<int> campaigns_{0};
    std::atomic<int> suggestions_{0};
    std::atomic<int> scheduled_{0};
};
}

int main(int argc, char** argv) {
    FleetConfig cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& e) {
        log_error("social-media-agent", std::string("bad configuration: ") + e.what());
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));

    RuntimeConfig rc = RuntimeConfig::from(cfg);
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--id" && i + 1 < argc) rc.agent_id = argv[++i];
    }
    log_info("social-media-agent", "Starting. BROKER_URL=" + cfg.broker_url);

    try {
        HttpBus bus(cfg.broker_url, std::string(), RetryPolicy::from(cfg));
        MemoryManagerOptions mopts;
        mopts.sweep_interval = cfg.working_sweep_interval;
        MemoryManager memory(std::make_shared<SqliteDurableStore>(cfg.memory_db_path), mopts);
        memory.start_sweeper();

        AgentRuntime runtime(std::make_shared<SocialMediaAgent>(), bus, memory, rc);
        runtime.start();

        std::signal(SIGTERM, [](int){ g_stop = 1; });
        std::signal(SIGINT, [](int){ g_stop = 1; });
        while (!g_stop && runtime.state() == RuntimeState::Running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        runtime.stop();
        return runtime.state() == RuntimeState::Failed ? 1 : 0;
    } catch (const std::exception& e) {
        log_error("social-media-agent", e.what());
        return 1;
    }
}
