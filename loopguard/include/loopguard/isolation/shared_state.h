#pragma once

#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loopguard {

enum class StateOperation : int {
    Exists,
    Get,
    Set,
    Unset
};

[[nodiscard]] const char* to_string(StateOperation operation) noexcept;

/**
 * @brief One script-side access to a superglobal
 */
struct StateAccess {
    uint64_t sequence = 0;          ///< Monotonic per SharedState
    std::string superglobal;
    std::string key;
    StateOperation operation = StateOperation::Get;
    bool rejected = false;          ///< Write to a read-only superglobal

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Process-wide mutable state the hosted scripts can see
 *
 * Holds the superglobal arrays (`_GET`, `_POST`, `_SERVER`, ...) as JSON
 * objects plus class static properties keyed by `Owner::property`. A server
 * keeps exactly one instance and hands it by reference to the request
 * isolation layer, which is the only component allowed to reset or restore
 * it around a request.
 *
 * Script-side access goes through contains(), get(), set() and unset(), and
 * is recorded in a bounded access log. `_SERVER` and `_ENV` are read-only
 * to scripts; the host fills them with load().
 */
class SharedState {
public:
    struct Snapshot {
        std::map<std::string, nlohmann::json> superglobals;
    };

    static constexpr size_t kAccessLogCapacity = 4096;

    /// Every superglobal kept by SharedState, without the leading '$'
    [[nodiscard]] static const std::vector<std::string>& superglobal_names();

    /// `_SERVER` and `_ENV`
    [[nodiscard]] static bool is_read_only(const std::string& superglobal_name);

    explicit SharedState(std::shared_ptr<Logger> logger = nullptr);

    // ========================================================================
    // Superglobals
    // ========================================================================

    /**
     * @brief One superglobal array
     * @throws std::out_of_range for names outside superglobal_names()
     */
    [[nodiscard]] const nlohmann::json& superglobal(const std::string& name) const;

    /**
     * @brief Host-side population of a whole array, read-only ones included
     * @throws std::invalid_argument if `values` is not an object
     */
    void load(const std::string& superglobal_name, nlohmann::json values);

    [[nodiscard]] bool contains(const std::string& superglobal_name, const std::string& key) const;
    [[nodiscard]] std::optional<nlohmann::json> get(const std::string& superglobal_name,
                                                    const std::string& key) const;

    /**
     * @return false, with a warning logged, when the array is read-only
     */
    bool set(const std::string& superglobal_name, const std::string& key, nlohmann::json value);

    /**
     * @return false when the array is read-only or the key is absent
     */
    bool unset(const std::string& superglobal_name, const std::string& key);

    // ========================================================================
    // Access log
    // ========================================================================

    /// Sequence number the next recorded access will get
    [[nodiscard]] uint64_t next_access_sequence() const noexcept { return next_sequence_; }

    [[nodiscard]] std::vector<StateAccess> accesses_since(uint64_t sequence) const;
    void clear_access_log() noexcept { access_log_.clear(); }

    // ========================================================================
    // Static properties
    // ========================================================================

    void set_static(const std::string& owner, const std::string& property, nlohmann::json value);
    [[nodiscard]] std::optional<nlohmann::json> get_static(const std::string& owner,
                                                           const std::string& property) const;
    bool erase_static(const std::string& owner, const std::string& property);
    [[nodiscard]] size_t static_count() const noexcept { return statics_.size(); }

    // ========================================================================
    // Request lifecycle
    // ========================================================================

    /**
     * @brief Copy of every superglobal
     *
     * Static properties are not part of the snapshot; they are restored
     * individually through tracking.
     */
    [[nodiscard]] Snapshot snapshot() const;

    void restore(const Snapshot& snapshot);

    /**
     * @brief Empty the request superglobals
     *
     * `_GET`, `_POST`, `_FILES`, `_COOKIE`, `_SESSION` and `_REQUEST` are
     * cleared; `_SERVER` and `_ENV` keep only the listed keys.
     */
    void reset_for_request(const std::vector<std::string>& preserved_server_keys,
                           const std::vector<std::string>& preserved_env_keys);

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::map<std::string, nlohmann::json> superglobals_;
    std::map<std::string, nlohmann::json> statics_;
    std::shared_ptr<Logger> logger_;

    mutable std::deque<StateAccess> access_log_;
    mutable uint64_t next_sequence_ = 0;

    nlohmann::json& array(const std::string& name);
    void record(const std::string& superglobal_name, const std::string& key, StateOperation operation,
                bool rejected = false) const;

    static std::string static_key(const std::string& owner, const std::string& property);
};

} // namespace loopguard
