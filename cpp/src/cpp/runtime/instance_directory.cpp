#include <opbridge/runtime/instance_directory.h>
#include <opbridge/runtime/pattern_matcher.h>
#include <opbridge/util/string_utils.h>

#include <algorithm>

namespace opbridge {

    std::string_view InstanceDirectory::normalize_path(std::string_view path) {
        path = trim(path);
        while (!path.empty() && path.front() == '/') path.remove_prefix(1);
        return path;
    }

    const InstanceDirectory::Entry &InstanceDirectory::add(std::string_view path, std::string_view id,
                                                           Instance instance) {
        if (!instance.valid()) throw_error<std::invalid_argument>("cannot add an invalid instance at '{}'", path);
        auto normalized = normalize_path(path);
        if (normalized.empty()) throw std::invalid_argument("InstanceDirectory::add: path cannot be empty");
        if (try_resolve_path(normalized).has_value()) {
            throw_error<std::invalid_argument>("an instance is already registered at '{}'", normalized);
        }
        if (!id.empty() && try_resolve_id(id).has_value()) {
            throw_error<std::invalid_argument>("an instance is already registered with id '{}'", id);
        }
        _entries.push_back(Entry{std::string(normalized), std::string(id), instance});
        return _entries.back();
    }

    bool InstanceDirectory::remove(std::string_view path) {
        auto normalized = normalize_path(path);
        auto it = std::find_if(_entries.begin(), _entries.end(),
                               [normalized](const Entry &entry) { return entry.path == normalized; });
        if (it == _entries.end()) return false;
        _entries.erase(it);
        return true;
    }

    const InstanceDirectory::Entry *InstanceDirectory::find_entry(const Instance &instance) const {
        for (const auto &entry : _entries) {
            if (entry.instance == instance) return &entry;
        }
        return nullptr;
    }

    std::optional<Instance> InstanceDirectory::try_resolve_path(std::string_view path) const {
        auto normalized = normalize_path(path);
        if (normalized.empty()) return std::nullopt;
        for (const auto &entry : _entries) {
            if (entry.path == normalized) return entry.instance;
        }
        return std::nullopt;
    }

    std::optional<Instance> InstanceDirectory::try_resolve_id(std::string_view id) const {
        id = trim(id);
        if (id.empty()) return std::nullopt;
        for (const auto &entry : _entries) {
            if (entry.id == id) return entry.instance;
        }
        return std::nullopt;
    }

    std::vector<Instance> InstanceDirectory::find_by_pattern(std::string_view pattern, bool use_regex) const {
        PatternMatcher matcher(pattern, use_regex);
        std::vector<Instance> matches;
        for (const auto &entry : _entries) {
            std::string_view path = entry.path;
            auto separator = path.rfind('/');
            auto name = separator == std::string_view::npos ? path : path.substr(separator + 1);
            if (matcher.matches(path) || matcher.matches(name)) matches.push_back(entry.instance);
        }
        return matches;
    }

    std::string InstanceDirectory::describe(const Instance &instance) const {
        if (const auto *entry = find_entry(instance); entry != nullptr) return entry->path;
        return instance.label();
    }

    void AssetDirectory::add(std::string_view path, Instance instance) {
        if (!instance.valid()) throw_error<std::invalid_argument>("cannot add an invalid asset at '{}'", path);
        if (!validate_path(path)) throw_error<std::invalid_argument>("invalid asset path '{}'", path);
        if (try_resolve(path).has_value()) throw_error<std::invalid_argument>("an asset is already registered at '{}'", path);
        _assets.emplace_back(std::string(trim(path)), instance);
    }

    std::optional<Instance> AssetDirectory::try_resolve(std::string_view identifier) const {
        identifier = trim(identifier);
        for (const auto &[path, instance] : _assets) {
            if (path == identifier) return instance;
        }
        return std::nullopt;
    }

}  // namespace opbridge
