#include <opbridge/types/value/type_registry.h>

#include <algorithm>

namespace opbridge::value {

    TypeRegistry::TypeRegistry() {
        register_scalar<bool>();
        register_scalar<int8_t>();
        register_scalar<int16_t>();
        register_scalar<int32_t>();
        register_scalar<int64_t>();
        register_scalar<uint8_t>();
        register_scalar<uint16_t>();
        register_scalar<uint32_t>();
        register_scalar<uint64_t>();
        register_scalar<float>();
        register_scalar<double>();
        register_scalar<std::string>();
        // long long is a distinct type from int64_t on LP64 platforms
        if constexpr (!std::is_same_v<long long, int64_t>) {
            _by_type.emplace(std::type_index(typeid(long long)), scalar_type_meta<long long>());
            _by_type.emplace(std::type_index(typeid(unsigned long long)), scalar_type_meta<unsigned long long>());
        }
        index(dynamic_type_meta(), typeid(DynamicValue));
    }

    TypeRegistry& TypeRegistry::instance() {
        static TypeRegistry registry;
        return registry;
    }

    const TypeMeta* TypeRegistry::get_by_name(std::string_view name) const {
        auto it = _by_name.find(std::string(name));
        return it != _by_name.end() ? it->second : nullptr;
    }

    std::vector<std::string> TypeRegistry::type_names() const {
        std::vector<std::string> names;
        names.reserve(_by_name.size());
        for (const auto& [name, meta] : _by_name) names.push_back(name);
        std::sort(names.begin(), names.end());
        return names;
    }

    void TypeRegistry::index(const TypeMeta* meta, std::type_index type) {
        if (_by_name.contains(meta->name)) {
            throw_error<std::invalid_argument>("a type named '{}' is already registered", meta->name);
        }
        if (_by_type.contains(type)) {
            throw_error<std::invalid_argument>("C++ type '{}' is already registered as '{}'", type.name(),
                                               _by_type.at(type)->name);
        }
        _by_name.emplace(meta->name, meta);
        _by_type.emplace(type, meta);
    }

    const BundleTypeMeta* TypeRegistry::register_bundle(std::unique_ptr<BundleTypeMeta> meta, std::type_index type) {
        index(meta.get(), type);
        return _bundles.emplace_back(std::move(meta)).get();
    }

    const EnumTypeMeta* TypeRegistry::register_enum(std::unique_ptr<EnumTypeMeta> meta, std::type_index type) {
        index(meta.get(), type);
        return _enums.emplace_back(std::move(meta)).get();
    }

    const ListTypeMeta* TypeRegistry::register_list(std::unique_ptr<ListTypeMeta> meta, std::type_index type) {
        index(meta.get(), type);
        return _lists.emplace_back(std::move(meta)).get();
    }

    const RefTypeMeta* TypeRegistry::register_ref(std::unique_ptr<RefTypeMeta> meta, std::type_index type) {
        index(meta.get(), type);
        return _refs.emplace_back(std::move(meta)).get();
    }

    const OpaqueTypeMeta* TypeRegistry::register_opaque(std::unique_ptr<OpaqueTypeMeta> meta, std::type_index type) {
        index(meta.get(), type);
        return _opaques.emplace_back(std::move(meta)).get();
    }

}  // namespace opbridge::value
