#pragma once
#include <vector>
#include <unordered_map>
#include <functional>
#include <string>
#include <cstdint>
#include <cstddef>
#include <utility>

// Publish/subscribe bus used for telemetry. Handlers run synchronously on emit.
class EventBus {
public:
    using EventHandler = std::function<void(const void* data)>;

    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        handlers_[event_type].push_back([handler = std::move(handler)](const void* data) {
            handler(*static_cast<const T*>(data));
        });
    }

    template<typename T>
    void emit(const std::string& event_type, const T& data) {
        ++emit_counts_[event_type];
        auto it = handlers_.find(event_type);
        if (it == handlers_.end()) return;
        for (auto& handler : it->second) {
            handler(&data);
        }
    }

    void unsubscribe_all(const std::string& event_type) { handlers_.erase(event_type); }

    bool has_subscribers(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t get_subscriber_count(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    // Number of emits for a type, whether or not anyone listened
    size_t get_emit_count(const std::string& event_type) const {
        auto it = emit_counts_.find(event_type);
        return it != emit_counts_.end() ? it->second : 0;
    }

private:
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
    std::unordered_map<std::string, size_t> emit_counts_;
};

// Simulation events
struct ForcePassEvent {
    const char* strategy;
    double elapsed_us;
    size_t body_count;
};

struct AdvanceEvent {
    double delta_time;
    size_t body_count_before;
    size_t body_count_after;
    size_t merge_count;
    size_t collision_steps;
};

struct BodiesMergedEvent {
    uint64_t first_id;
    uint64_t second_id;
    uint64_t product_id;
    double product_mass;
    double time_in_tick;     // seconds into the tick; settle merges report the current time
};

struct ThetaAdjustedEvent {
    double old_theta;
    double new_theta;
    double bh_cost_per_body_ns;
    double grid_cost_per_body_ns;
};

// Event type constants to avoid string typos
namespace Events {
    constexpr const char* FORCE_PASS = "force_pass";
    constexpr const char* ADVANCE = "advance";
    constexpr const char* BODIES_MERGED = "bodies_merged";
    constexpr const char* THETA_ADJUSTED = "theta_adjusted";
}
