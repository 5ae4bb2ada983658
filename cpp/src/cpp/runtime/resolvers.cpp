#include <opbridge/runtime/resolvers.h>
#include <opbridge/util/string_utils.h>

namespace opbridge {

    std::optional<Instance> ObjectResolver::try_resolve(std::string_view identifier) const {
        if (identifier.empty()) return std::nullopt;
        if (auto instance = try_resolve_path(identifier); instance.has_value()) return instance;
        return try_resolve_id(identifier);
    }

    bool AssetResolver::validate_path(std::string_view path) const {
        path = trim(path);
        if (path.empty() || path.front() == '/' || path.back() == '/') return false;
        if (path.find('\\') != std::string_view::npos) return false;
        size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            if (end == std::string_view::npos) end = path.size();
            auto segment = path.substr(start, end - start);
            if (segment.empty() || segment == "." || segment == "..") return false;
            start = end + 1;
        }
        return true;
    }

    std::optional<const value::TypeMeta *> RegistryTypeResolver::try_resolve(std::string_view identifier) const {
        identifier = trim(identifier);
        if (identifier.empty()) return std::nullopt;
        if (auto *meta = _registry.get_by_name(identifier); meta != nullptr) return meta;
        for (const auto &name : _registry.type_names()) {
            if (iequals(name, identifier)) return _registry.get_by_name(name);
        }
        return std::nullopt;
    }

}  // namespace opbridge
