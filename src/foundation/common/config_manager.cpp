#include "gcb/foundation/config_manager.hpp"

#include <set>
#include <sstream>

namespace gcb::foundation {

namespace {

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

} // namespace

GatewayResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed,
                         "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }
}

GatewayResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed,
                         std::string("YAML parse error: ") + e.what()));
    }
}

GatewayResult<void> ConfigManager::loadRoot(const YAML::Node& root) {
    if (root && !root.IsMap() && !root.IsNull()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    if (root && root.IsMap()) {
        flatten("", root);
    }
    return GatewayResult<void>::ok();
}

GatewayResult<std::vector<std::string>> ConfigManager::getList(std::string_view key) const {
    using ListResult = GatewayResult<std::vector<std::string>>;

    YAML::Node node;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(std::string(key));
        if (it == entries_.end()) {
            return ListResult::err(
                GatewayError(ErrorCode::ConfigKeyNotFound,
                             std::string("config key not found: ") + std::string(key)));
        }
        node = YAML::Clone(it->second);
    }

    std::vector<std::string> out;
    try {
        if (node.IsNull()) {
            return ListResult::ok(std::move(out));
        }
        if (node.IsSequence()) {
            for (const auto& item : node) {
                auto value = trim(item.as<std::string>());
                if (!value.empty()) {
                    out.push_back(std::move(value));
                }
            }
            return ListResult::ok(std::move(out));
        }
        if (node.IsScalar()) {
            std::istringstream lines(node.as<std::string>());
            std::string line;
            while (std::getline(lines, line)) {
                auto value = trim(line);
                if (!value.empty() && value.front() != '#') {
                    out.push_back(std::move(value));
                }
            }
            return ListResult::ok(std::move(out));
        }
    } catch (const YAML::BadConversion&) {
        // fall through to the mismatch error below
    }
    return ListResult::err(
        GatewayError(ErrorCode::ConfigTypeMismatch,
                     std::string("expected a list for key: ") + std::string(key)));
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::string base(prefix);
    if (!base.empty()) {
        base += '.';
    }

    std::set<std::string> names;
    std::lock_guard lock(mutex_);
    for (const auto& [key, node] : entries_) {
        if (key.size() <= base.size() || key.compare(0, base.size(), base) != 0) {
            continue;
        }
        auto rest = key.substr(base.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked unlocked so a watcher may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace gcb::foundation
