#include "loopguard/isolation/request_isolation.h"

#include <algorithm>
#include <cstdio>
#include <random>

namespace loopguard {

namespace {

std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> hex_dist(0, 15);
    static thread_local std::uniform_int_distribution<> y_dist(8, 11);

    auto hex_char = [](int val) -> char {
        return static_cast<char>(val < 10 ? ('0' + val) : ('a' + val - 10));
    };

    std::string uuid;
    uuid.reserve(36);

    // xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    for (int i = 0; i < 8; ++i) uuid += hex_char(hex_dist(gen));
    uuid += '-';
    for (int i = 0; i < 4; ++i) uuid += hex_char(hex_dist(gen));
    uuid += "-4";
    for (int i = 0; i < 3; ++i) uuid += hex_char(hex_dist(gen));
    uuid += '-';
    uuid += hex_char(y_dist(gen));
    for (int i = 0; i < 3; ++i) uuid += hex_char(hex_dist(gen));
    uuid += '-';
    for (int i = 0; i < 12; ++i) uuid += hex_char(hex_dist(gen));

    return uuid;
}

// FNV-1a, 64 bit
std::string path_hash(const std::string& path) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : path) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return buffer;
}

} // namespace

std::string generate_context_id(const RequestDescriptor& request) {
    return "ctx_" + generate_uuid() + "_" + request.method + "_" + path_hash(request.path);
}

nlohmann::json ContextInfo::to_json() const {
    nlohmann::json statics = nlohmann::json::array();
    for (const auto& p : tracked_static_properties) {
        statics.push_back({
            {"owner", p.owner},
            {"property", p.property},
            {"original", p.original ? *p.original : nlohmann::json(nullptr)}
        });
    }
    nlohmann::json access_log = nlohmann::json::array();
    for (const auto& access : accesses) {
        access_log.push_back(access.to_json());
    }
    return nlohmann::json{
        {"id", id},
        {"method", method},
        {"path", path},
        {"memory_start", memory_at_start},
        {"static_properties", std::move(statics)},
        {"accesses", std::move(access_log)}
    };
}

nlohmann::json StaticPropertyViolation::to_json() const {
    return nlohmann::json{
        {"context_id", context_id},
        {"class", owner},
        {"property", property},
        {"at", to_seconds(at.time_since_epoch())}
    };
}

nlohmann::json ContextLeak::to_json() const {
    return nlohmann::json{
        {"context_id", context_id},
        {"duration", to_seconds(duration)},
        {"memory_growth", memory_growth}
    };
}

// ============================================================================
// RequestIsolation
// ============================================================================

RequestIsolation::RequestIsolation(IsolationConfig config, SharedState& state, const IClock& clock,
                                   IMemoryMeter& meter, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , state_(state)
    , clock_(clock)
    , meter_(meter)
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.isolation")) {
    config_.validate().throw_if_invalid("request isolation");
}

std::string RequestIsolation::create_context(const RequestDescriptor& request) {
    std::string id = generate_context_id(request);
    while (contexts_.count(id) != 0) {
        id = generate_context_id(request);
    }

    Context context;
    context.info.id = id;
    context.info.method = request.method;
    context.info.path = request.path;
    context.info.started_at = clock_.now();
    context.info.memory_at_start = meter_.current_bytes();
    context.state_backup = state_.snapshot();
    context.first_access = state_.next_access_sequence();

    contexts_.emplace(id, std::move(context));
    state_.reset_for_request(config_.preserved_server_keys, config_.preserved_env_keys);

    logger_->trace("Request context created", {{"context_id", id}, {"path", request.path}});
    return id;
}

void RequestIsolation::destroy_context(const std::string& context_id) {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        return;
    }

    Context context = std::move(it->second);
    contexts_.erase(it);

    state_.restore(context.state_backup);
    restore_static_properties(context.info.tracked_static_properties);
    meter_.collect();
    if (contexts_.empty()) {
        state_.clear_access_log();
    }

    logger_->trace("Request context destroyed", {
        {"context_id", context_id},
        {"duration_ms", std::to_string(
            std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - context.info.started_at).count())}
    });
}

bool RequestIsolation::has_context(const std::string& context_id) const {
    return contexts_.count(context_id) != 0;
}

std::optional<ContextInfo> RequestIsolation::get_context_info(const std::string& context_id) const {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        return std::nullopt;
    }
    ContextInfo info = it->second.info;
    info.accesses = state_.accesses_since(it->second.first_access);
    return info;
}

bool RequestIsolation::track_static_property(const std::string& context_id, const std::string& owner,
                                             const std::string& property) {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        logger_->warn("Static property tracked outside a request context", {
            {"context_id", context_id},
            {"property", owner + "::" + property}
        });
        return false;
    }

    if (is_allowed(owner, property)) {
        return true;
    }

    auto& tracked = it->second.info.tracked_static_properties;
    for (const auto& p : tracked) {
        // The first recorded value is the one to restore
        if (p.owner == owner && p.property == property) {
            return true;
        }
    }
    tracked.push_back(TrackedStaticProperty{owner, property, state_.get_static(owner, property)});

    if (violations_.size() >= kMaxViolations) {
        violations_.pop_front();
    }
    violations_.push_back(StaticPropertyViolation{context_id, owner, property, clock_.now()});
    ++violation_count_;
    logger_->warn("Static property changed outside the allow-list", {
        {"context_id", context_id},
        {"property", owner + "::" + property}
    });
    return true;
}

void RequestIsolation::allow_class(const std::string& owner, std::vector<std::string> properties) {
    config_.allowed_static_properties[owner] = std::move(properties);
}

bool RequestIsolation::is_allowed(const std::string& owner, const std::string& property) const {
    auto it = config_.allowed_static_properties.find(owner);
    if (it == config_.allowed_static_properties.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), property) != allowed.end();
}

std::vector<StaticPropertyViolation> RequestIsolation::violations() const {
    return {violations_.begin(), violations_.end()};
}

void RequestIsolation::restore_static_properties(const std::vector<TrackedStaticProperty>& properties) {
    for (const auto& p : properties) {
        if (p.original) {
            state_.set_static(p.owner, p.property, *p.original);
        } else {
            state_.erase_static(p.owner, p.property);
        }
    }
}

std::vector<ContextLeak> RequestIsolation::check_context_leaks() const {
    std::vector<ContextLeak> leaks;
    const TimePoint now = clock_.now();
    const size_t memory_now = meter_.current_bytes();

    for (const auto& [id, context] : contexts_) {
        const Duration duration = now - context.info.started_at;
        const int64_t growth = static_cast<int64_t>(memory_now) - static_cast<int64_t>(context.info.memory_at_start);

        const bool too_old = duration > config_.max_context_duration;
        const bool too_large = config_.max_memory_growth > 0 &&
                               growth > static_cast<int64_t>(config_.max_memory_growth);
        if (too_old || too_large) {
            leaks.push_back(ContextLeak{id, duration, growth});
        }
    }
    return leaks;
}

// ============================================================================
// IsolationScope
// ============================================================================

IsolationScope::IsolationScope(IRequestIsolation& isolation, const RequestDescriptor& request)
    : isolation_(isolation)
    , id_(isolation.create_context(request)) {
}

IsolationScope::~IsolationScope() {
    try {
        isolation_.destroy_context(id_);
    } catch (const std::exception& e) {
        LoggerFactory::get_logger("loopguard.isolation")->error("Request context restore failed", {
            {"context_id", id_},
            {"error", e.what()}
        });
    }
}

} // namespace loopguard
