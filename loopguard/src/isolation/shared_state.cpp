#include "loopguard/isolation/shared_state.h"

#include <stdexcept>

namespace loopguard {

namespace {

nlohmann::json keep_keys(const nlohmann::json& source, const std::vector<std::string>& keys) {
    nlohmann::json kept = nlohmann::json::object();
    if (!source.is_object()) {
        return kept;
    }
    for (const auto& key : keys) {
        auto it = source.find(key);
        if (it != source.end()) {
            kept[key] = *it;
        }
    }
    return kept;
}

} // namespace

const char* to_string(StateOperation operation) noexcept {
    switch (operation) {
        case StateOperation::Exists: return "exists";
        case StateOperation::Get:    return "get";
        case StateOperation::Set:    return "set";
        case StateOperation::Unset:  return "unset";
    }
    return "unknown";
}

nlohmann::json StateAccess::to_json() const {
    return nlohmann::json{
        {"sequence", sequence},
        {"superglobal", superglobal},
        {"key", key},
        {"operation", to_string(operation)},
        {"rejected", rejected}
    };
}

const std::vector<std::string>& SharedState::superglobal_names() {
    static const std::vector<std::string> names = {
        "_GET", "_POST", "_FILES", "_COOKIE", "_SESSION", "_REQUEST", "_SERVER", "_ENV"
    };
    return names;
}

bool SharedState::is_read_only(const std::string& superglobal_name) {
    return superglobal_name == "_SERVER" || superglobal_name == "_ENV";
}

SharedState::SharedState(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.shared_state")) {
    for (const auto& name : superglobal_names()) {
        superglobals_.emplace(name, nlohmann::json::object());
    }
}

nlohmann::json& SharedState::array(const std::string& name) {
    auto it = superglobals_.find(name);
    if (it == superglobals_.end()) {
        throw std::out_of_range("Unknown superglobal: " + name);
    }
    return it->second;
}

const nlohmann::json& SharedState::superglobal(const std::string& name) const {
    auto it = superglobals_.find(name);
    if (it == superglobals_.end()) {
        throw std::out_of_range("Unknown superglobal: " + name);
    }
    return it->second;
}

void SharedState::load(const std::string& superglobal_name, nlohmann::json values) {
    if (!values.is_object()) {
        throw std::invalid_argument("$" + superglobal_name + " must be loaded from an object");
    }
    array(superglobal_name) = std::move(values);
}

void SharedState::record(const std::string& superglobal_name, const std::string& key, StateOperation operation,
                         bool rejected) const {
    if (access_log_.size() >= kAccessLogCapacity) {
        access_log_.pop_front();
    }
    access_log_.push_back(StateAccess{next_sequence_++, superglobal_name, key, operation, rejected});
}

bool SharedState::contains(const std::string& superglobal_name, const std::string& key) const {
    const auto& values = superglobal(superglobal_name);
    record(superglobal_name, key, StateOperation::Exists);
    return values.contains(key);
}

std::optional<nlohmann::json> SharedState::get(const std::string& superglobal_name,
                                               const std::string& key) const {
    const auto& values = superglobal(superglobal_name);
    record(superglobal_name, key, StateOperation::Get);
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return *it;
}

bool SharedState::set(const std::string& superglobal_name, const std::string& key, nlohmann::json value) {
    auto& values = array(superglobal_name);
    if (is_read_only(superglobal_name)) {
        record(superglobal_name, key, StateOperation::Set, true);
        logger_->warn("Write to read-only superglobal rejected", {
            {"superglobal", "$" + superglobal_name},
            {"key", key}
        });
        return false;
    }
    record(superglobal_name, key, StateOperation::Set);
    values[key] = std::move(value);
    return true;
}

bool SharedState::unset(const std::string& superglobal_name, const std::string& key) {
    auto& values = array(superglobal_name);
    if (is_read_only(superglobal_name)) {
        record(superglobal_name, key, StateOperation::Unset, true);
        logger_->warn("Write to read-only superglobal rejected", {
            {"superglobal", "$" + superglobal_name},
            {"key", key}
        });
        return false;
    }
    record(superglobal_name, key, StateOperation::Unset);
    return values.erase(key) > 0;
}

std::vector<StateAccess> SharedState::accesses_since(uint64_t sequence) const {
    std::vector<StateAccess> accesses;
    for (const auto& access : access_log_) {
        if (access.sequence >= sequence) {
            accesses.push_back(access);
        }
    }
    return accesses;
}

std::string SharedState::static_key(const std::string& owner, const std::string& property) {
    return owner + "::" + property;
}

void SharedState::set_static(const std::string& owner, const std::string& property, nlohmann::json value) {
    statics_[static_key(owner, property)] = std::move(value);
}

std::optional<nlohmann::json> SharedState::get_static(const std::string& owner,
                                                      const std::string& property) const {
    auto it = statics_.find(static_key(owner, property));
    if (it == statics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SharedState::erase_static(const std::string& owner, const std::string& property) {
    return statics_.erase(static_key(owner, property)) > 0;
}

SharedState::Snapshot SharedState::snapshot() const {
    return Snapshot{superglobals_};
}

void SharedState::restore(const Snapshot& snapshot) {
    superglobals_ = snapshot.superglobals;
    for (const auto& name : superglobal_names()) {
        superglobals_.try_emplace(name, nlohmann::json::object());
    }
}

void SharedState::reset_for_request(const std::vector<std::string>& preserved_server_keys,
                                    const std::vector<std::string>& preserved_env_keys) {
    for (const char* name : {"_GET", "_POST", "_FILES", "_COOKIE", "_SESSION", "_REQUEST"}) {
        superglobals_[name] = nlohmann::json::object();
    }
    superglobals_["_SERVER"] = keep_keys(superglobals_["_SERVER"], preserved_server_keys);
    superglobals_["_ENV"] = keep_keys(superglobals_["_ENV"], preserved_env_keys);
}

nlohmann::json SharedState::to_json() const {
    nlohmann::json j;
    for (const auto& [name, value] : superglobals_) {
        j["superglobals"][name] = value;
    }
    for (const auto& [key, value] : statics_) {
        j["statics"][key] = value;
    }
    return j;
}

} // namespace loopguard
