#pragma once

#include "loopguard/config/guard_config.h"
#include "loopguard/core/clock.h"
#include "loopguard/isolation/shared_state.h"
#include "loopguard/memory/memory_meter.h"
#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loopguard {

// ============================================================================
// Request isolation types
// ============================================================================

/**
 * @brief The parts of an incoming request the sandbox needs
 */
struct RequestDescriptor {
    std::string method = "GET";
    std::string path = "/";
};

struct TrackedStaticProperty {
    std::string owner;
    std::string property;
    std::optional<nlohmann::json> original;   ///< nullopt when the property did not exist
};

/**
 * @brief Read-only view of a live request context
 */
struct ContextInfo {
    std::string id;
    std::string method;
    std::string path;
    TimePoint started_at;
    size_t memory_at_start = 0;
    std::vector<TrackedStaticProperty> tracked_static_properties;
    std::vector<StateAccess> accesses;    ///< Superglobal accesses since the context was created

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief A static property changed during a request without being allow-listed
 */
struct StaticPropertyViolation {
    std::string context_id;
    std::string owner;
    std::string property;
    TimePoint at;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief A context that outlived the configured limits
 */
struct ContextLeak {
    std::string context_id;
    Duration duration{};
    int64_t memory_growth = 0;     ///< Bytes, negative when memory shrank

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Per-request hook pair used by the request pipeline
 */
class IRequestIsolation {
public:
    virtual ~IRequestIsolation() = default;

    /**
     * @brief Snapshot shared state, reset it for a new request
     * @return Unique context identifier
     */
    virtual std::string create_context(const RequestDescriptor& request) = 0;

    /**
     * @brief Restore the state captured by create_context; unknown ids are ignored
     */
    virtual void destroy_context(const std::string& context_id) = 0;

    [[nodiscard]] virtual bool has_context(const std::string& context_id) const = 0;
    [[nodiscard]] virtual std::optional<ContextInfo> get_context_info(const std::string& context_id) const = 0;
};

// ============================================================================
// RequestIsolation
// ============================================================================

/**
 * @brief Keeps one request's changes to SharedState from reaching the next
 *
 * Each context owns the snapshot taken when it was created, so contexts
 * may be destroyed in any order. Callers must destroy every context on
 * every exit path; IsolationScope does that from a destructor.
 */
class RequestIsolation : public IRequestIsolation {
public:
    RequestIsolation(IsolationConfig config, SharedState& state, const IClock& clock, IMemoryMeter& meter,
                     std::shared_ptr<Logger> logger = nullptr);

    std::string create_context(const RequestDescriptor& request) override;
    void destroy_context(const std::string& context_id) override;
    [[nodiscard]] bool has_context(const std::string& context_id) const override;
    [[nodiscard]] std::optional<ContextInfo> get_context_info(const std::string& context_id) const override;

    /**
     * @brief Remember the current value of a static property
     *
     * When the context is destroyed the property gets this value back, or
     * is removed if it did not exist yet. Allow-listed properties are left
     * alone; any other property is also recorded as a violation, once per
     * context.
     *
     * @return false if the context is unknown
     */
    bool track_static_property(const std::string& context_id, const std::string& owner,
                               const std::string& property);

    /**
     * @brief Let static properties of `owner` persist across requests
     * @param properties Allowed names; empty allows every property
     */
    void allow_class(const std::string& owner, std::vector<std::string> properties = {});
    [[nodiscard]] bool is_allowed(const std::string& owner, const std::string& property) const;

    /// Most recent violations, oldest first
    [[nodiscard]] std::vector<StaticPropertyViolation> violations() const;
    [[nodiscard]] size_t violation_count() const noexcept { return violation_count_; }

    /**
     * @brief Contexts older than `max_context_duration`, or grown past
     *        `max_memory_growth` when that limit is set
     *
     * Reported contexts are left alive.
     */
    [[nodiscard]] std::vector<ContextLeak> check_context_leaks() const;

    [[nodiscard]] size_t active_contexts() const noexcept { return contexts_.size(); }
    [[nodiscard]] const IsolationConfig& config() const noexcept { return config_; }

private:
    static constexpr size_t kMaxViolations = 1000;

    struct Context {
        ContextInfo info;
        SharedState::Snapshot state_backup;
        uint64_t first_access = 0;
    };

    IsolationConfig config_;
    SharedState& state_;
    const IClock& clock_;
    IMemoryMeter& meter_;
    std::shared_ptr<Logger> logger_;
    std::unordered_map<std::string, Context> contexts_;

    std::deque<StaticPropertyViolation> violations_;
    size_t violation_count_ = 0;

    void restore_static_properties(const std::vector<TrackedStaticProperty>& properties);
};

/**
 * @brief Create a context on construction, destroy it on scope exit
 *
 * @code
 * IsolationScope scope(isolation, {"POST", "/orders"});
 * handle(request);   // state is restored even if this throws
 * @endcode
 */
class IsolationScope {
public:
    IsolationScope(IRequestIsolation& isolation, const RequestDescriptor& request);
    ~IsolationScope();

    IsolationScope(const IsolationScope&) = delete;
    IsolationScope& operator=(const IsolationScope&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    IRequestIsolation& isolation_;
    std::string id_;
};

/**
 * @brief `ctx_<uuid>_<METHOD>_<path hash>`
 */
[[nodiscard]] std::string generate_context_id(const RequestDescriptor& request);

} // namespace loopguard
