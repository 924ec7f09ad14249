#include "rally/foundation/config_manager.hpp"

#include <algorithm>

namespace rally::foundation {

RallyResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return RallyResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return RallyResult<void>::err(
            RallyError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(std::string(key));
}

std::vector<std::string> ConfigManager::keysWithPrefix(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, node] : entries_) {
        if (key.starts_with(prefix)) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace rally::foundation
