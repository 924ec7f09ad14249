#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rally/foundation/rally_result.hpp"

namespace rally::foundation {

/// YAML configuration store.
///
/// The document is flattened into dotted keys on load, so
/// @code
///   rating:
///     multipliers:
///       underdog:
///         heavy:
///           narrow: 25
/// @endcode
/// is read back with get<double>("rating.multipliers.underdog.heavy.narrow").
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous entries.
    /// @return Success or ConfigLoadFailed.
    RallyResult<void> load(const std::filesystem::path& path);

    /// Typed lookup by dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    RallyResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys that start with the given prefix, sorted.
    [[nodiscard]] std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RallyResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RallyResult<T>::err(
            RallyError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RallyResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RallyResult<T>::err(
            RallyError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace rally::foundation
