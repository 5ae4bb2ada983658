#pragma once

#include <opbridge/opbridge_export.h>
#include <opbridge/types/value/bundle_type.h>
#include <opbridge/types/value/enum_type.h>
#include <opbridge/types/value/list_type.h>
#include <opbridge/types/value/opaque_type.h>
#include <opbridge/types/value/ref_type.h>
#include <opbridge/types/value/scalar_type.h>
#include <opbridge/util/errors.h>

#include <array>
#include <concepts>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace opbridge::value {

    template<typename T>
    class BundleTypeBuilder;

    template<typename E>
        requires std::is_scoped_enum_v<E>
    class EnumTypeBuilder;

    /**
     * TypeRegistry - Owns the type descriptors of a live object graph
     *
     * Composite descriptors are declared once, at startup, through the builders:
     *
     *   auto& types = TypeRegistry::instance();
     *   types.bundle<Vec3>("Vec3")
     *       .serialized_field("x", &Vec3::x)
     *       .serialized_field("y", &Vec3::y)
     *       .build();
     *
     * Descriptors are addressed by C++ type (meta_for<T>) and by name (get_by_name).
     * Primitive scalars and the DynamicValue pass-through type are always present.
     * A registry may also be created locally, which is how tests isolate their types.
     */
    class OPBRIDGE_EXPORT TypeRegistry {
    public:
        TypeRegistry();

        TypeRegistry(const TypeRegistry&) = delete;
        TypeRegistry& operator=(const TypeRegistry&) = delete;

        static TypeRegistry& instance();

        // ========== Builders ==========

        template<typename T>
        [[nodiscard]] BundleTypeBuilder<T> bundle(std::string name);

        template<typename E>
            requires std::is_scoped_enum_v<E>
        [[nodiscard]] EnumTypeBuilder<E> enumeration(std::string name);

        template<typename E>
        const ListTypeMeta* dynamic_list() { return dynamic_list<E>(meta_for<E>()); }

        // element_type may be nullptr, the list then only ever holds default elements
        template<typename E>
        const ListTypeMeta* dynamic_list(const TypeMeta* element_type);

        template<typename E, size_t N>
        const ListTypeMeta* fixed_list() { return fixed_list<E, N>(meta_for<E>()); }

        template<typename E, size_t N>
        const ListTypeMeta* fixed_list(const TypeMeta* element_type);

        // Reference to a live T, T must already be registered as a bundle
        template<typename T>
        const RefTypeMeta* ref();

        template<typename T>
        const OpaqueTypeMeta* opaque(std::string name,
                                     std::function<void(T&, const DynamicValue&)> decode,
                                     std::function<DynamicValue(const T&)> encode = {});

        // ========== Lookup ==========

        template<typename T>
        [[nodiscard]] const TypeMeta* find() const {
            auto it = _by_type.find(std::type_index(typeid(T)));
            return it != _by_type.end() ? it->second : nullptr;
        }

        /**
         * Descriptor of T. Pointers to registered bundles, std::vector and std::array
         * of described elements are described on first use; anything else must have
         * been registered explicitly.
         */
        template<typename T>
        [[nodiscard]] const TypeMeta* meta_for();

        template<typename T>
        [[nodiscard]] const BundleTypeMeta* bundle_meta_for() const {
            auto* meta = find<T>();
            if (meta == nullptr || meta->kind != TypeKind::Bundle) {
                throw_error<std::invalid_argument>("type '{}' is not registered as a bundle", typeid(T).name());
            }
            return static_cast<const BundleTypeMeta*>(meta);
        }

        [[nodiscard]] const TypeMeta* get_by_name(std::string_view name) const;
        [[nodiscard]] bool contains(std::string_view name) const { return get_by_name(name) != nullptr; }
        [[nodiscard]] std::vector<std::string> type_names() const;

        // ========== Ownership (used by the builders) ==========

        const BundleTypeMeta* register_bundle(std::unique_ptr<BundleTypeMeta> meta, std::type_index type);
        const EnumTypeMeta* register_enum(std::unique_ptr<EnumTypeMeta> meta, std::type_index type);
        const ListTypeMeta* register_list(std::unique_ptr<ListTypeMeta> meta, std::type_index type);
        const RefTypeMeta* register_ref(std::unique_ptr<RefTypeMeta> meta, std::type_index type);
        const OpaqueTypeMeta* register_opaque(std::unique_ptr<OpaqueTypeMeta> meta, std::type_index type);

    private:
        template<PrimitiveScalar T>
        void register_scalar() { index(scalar_type_meta<T>(), typeid(T)); }

        // Adds ``meta`` to both lookups, rejecting a name or type that is already taken
        void index(const TypeMeta* meta, std::type_index type);

        std::unordered_map<std::type_index, const TypeMeta*> _by_type;
        std::unordered_map<std::string, const TypeMeta*> _by_name;

        std::vector<std::unique_ptr<BundleTypeMeta>> _bundles;
        std::vector<std::unique_ptr<EnumTypeMeta>> _enums;
        std::vector<std::unique_ptr<ListTypeMeta>> _lists;
        std::vector<std::unique_ptr<RefTypeMeta>> _refs;
        std::vector<std::unique_ptr<OpaqueTypeMeta>> _opaques;
    };

    // ============================================================================
    // BundleTypeBuilder
    // ============================================================================

    /**
     * BundleTypeBuilder - Declares the members of a composite type T
     *
     * - serialized_field: a field carrying the serializable marker, visible to callers
     * - private_field: a field that exists but is invisible to callers
     * - property / readonly_property: a named accessor pair over a value of type V
     */
    template<typename T>
    class BundleTypeBuilder {
    public:
        BundleTypeBuilder(TypeRegistry& registry, std::string name)
            : _registry(registry), _meta(std::make_unique<BundleTypeMeta>()) {
            _meta->name = std::move(name);
        }

        template<typename M>
        BundleTypeBuilder& serialized_field(std::string name, M T::*member) {
            return serialized_field(std::move(name), member, _registry.template meta_for<M>());
        }

        template<typename M>
        BundleTypeBuilder& serialized_field(std::string name, M T::*member, const TypeMeta* type) {
            return add_field(std::move(name), member, type,
                             MemberFlags::Readable | MemberFlags::Writable | MemberFlags::Serializable);
        }

        template<typename M>
        BundleTypeBuilder& private_field(std::string name, M T::*member) {
            return add_field(std::move(name), member, _registry.template meta_for<M>(),
                             MemberFlags::Readable | MemberFlags::Writable);
        }

        template<typename V, typename Getter, typename Setter>
        BundleTypeBuilder& property(std::string name, Getter getter, Setter setter) {
            MemberMeta member = make_property<V>(std::move(name), std::move(getter));
            member.flags = member.flags | MemberFlags::Writable;
            member.setter = [setter = std::move(setter)](void* object, const void* value) {
                std::invoke(setter, *static_cast<T*>(object), *static_cast<const V*>(value));
            };
            return add_member(std::move(member));
        }

        template<typename V, typename Getter>
        BundleTypeBuilder& readonly_property(std::string name, Getter getter) {
            return add_member(make_property<V>(std::move(name), std::move(getter)));
        }

        template<typename B>
        BundleTypeBuilder& base() {
            static_assert(std::derived_from<T, B> && !std::same_as<T, B>, "base must be a base class of T");
            _meta->base = _registry.template bundle_meta_for<B>();
            _meta->to_base = [](void* object) -> void* { return static_cast<B*>(static_cast<T*>(object)); };
            return *this;
        }

        BundleTypeBuilder& identity(std::function<ReferenceDescriptor(const T&)> fn) {
            _meta->identify = [fn = std::move(fn)](const void* object) { return fn(*static_cast<const T*>(object)); };
            return *this;
        }

        BundleTypeBuilder& structural_decoder(std::function<void(T&, const DynamicValue&)> fn) {
            _meta->structural_decoder = [fn = std::move(fn)](void* dest, const DynamicValue& structural) {
                fn(*static_cast<T*>(dest), structural);
            };
            return *this;
        }

        const BundleTypeMeta* build() {
            if (!_meta) throw std::logic_error("BundleTypeBuilder::build() called twice");
            _meta->size = sizeof(T);
            _meta->alignment = alignof(T);
            _meta->flags = compute_type_flags<T>();
            _meta->kind = TypeKind::Bundle;
            _meta->ops = &BundleTypeOps<T>::ops;
            _meta->type_info = &typeid(T);
            return _registry.register_bundle(std::move(_meta), typeid(T));
        }

    private:
        template<typename M>
        BundleTypeBuilder& add_field(std::string name, M T::*member, const TypeMeta* type, MemberFlags flags) {
            check_member_type<M>(name, type);
            MemberMeta meta{.name = std::move(name), .kind = MemberKind::Field, .type = type, .flags = flags};
            meta.field_ptr = [member](void* object) -> void* { return &(static_cast<T*>(object)->*member); };
            return add_member(std::move(meta));
        }

        template<typename V, typename Getter>
        MemberMeta make_property(std::string name, Getter getter) {
            const TypeMeta* type = _registry.template meta_for<V>();
            check_member_type<V>(name, type);
            MemberMeta meta{.name = std::move(name), .kind = MemberKind::Property, .type = type,
                            .flags = MemberFlags::Readable};
            meta.getter = [getter = std::move(getter)](const void* object, void* out) {
                *static_cast<V*>(out) = std::invoke(getter, *static_cast<const T*>(object));
            };
            return meta;
        }

        template<typename M>
        void check_member_type(const std::string& name, const TypeMeta* type) const {
            if (type == nullptr) {
                throw_error<std::invalid_argument>("member '{}' of '{}' has no type", name, _meta->name);
            }
            if (type->type_info != nullptr && *type->type_info != typeid(M)) {
                throw_error<std::invalid_argument>("member '{}' of '{}' is described by '{}' which stores a different C++ type",
                                                   name, _meta->name, type->name);
            }
        }

        BundleTypeBuilder& add_member(MemberMeta member) {
            if (!_meta) throw std::logic_error("BundleTypeBuilder used after build()");
            if (_meta->name_to_index.contains(member.name)) {
                throw_error<std::invalid_argument>("member '{}' is declared twice on '{}'", member.name, _meta->name);
            }
            _meta->name_to_index.emplace(member.name, _meta->members.size());
            _meta->members.push_back(std::move(member));
            return *this;
        }

        TypeRegistry& _registry;
        std::unique_ptr<BundleTypeMeta> _meta;
    };

    // ============================================================================
    // EnumTypeBuilder
    // ============================================================================

    // Scoped enums only: a fixed underlying type makes every in-range raw value a valid E
    template<typename E>
        requires std::is_scoped_enum_v<E>
    class EnumTypeBuilder {
    public:
        EnumTypeBuilder(TypeRegistry& registry, std::string name)
            : _registry(registry), _meta(std::make_unique<EnumTypeMeta>()) {
            _meta->name = std::move(name);
        }

        EnumTypeBuilder& value(std::string name, E value) {
            if (_meta->find_symbol(name) != nullptr) {
                throw_error<std::invalid_argument>("symbol '{}' is declared twice on '{}'", name, _meta->name);
            }
            _meta->symbols.push_back({std::move(name), static_cast<int64_t>(static_cast<std::underlying_type_t<E>>(value))});
            return *this;
        }

        const EnumTypeMeta* build() {
            if (!_meta) throw std::logic_error("EnumTypeBuilder::build() called twice");
            _meta->size = sizeof(E);
            _meta->alignment = alignof(E);
            _meta->flags = compute_type_flags<E>();
            _meta->kind = TypeKind::Enum;
            _meta->ops = &EnumTypeOps<E>::ops;
            _meta->type_info = &typeid(E);
            _meta->min_raw = EnumTypeOps<E>::min_raw();
            _meta->max_raw = EnumTypeOps<E>::max_raw();
            _meta->store_raw = &EnumTypeOps<E>::store_raw;
            _meta->load_raw = &EnumTypeOps<E>::load_raw;
            return _registry.register_enum(std::move(_meta), typeid(E));
        }

    private:
        TypeRegistry& _registry;
        std::unique_ptr<EnumTypeMeta> _meta;
    };

    // ============================================================================
    // TypeRegistry template implementations
    // ============================================================================

    template<typename T>
    BundleTypeBuilder<T> TypeRegistry::bundle(std::string name) {
        return BundleTypeBuilder<T>(*this, std::move(name));
    }

    template<typename E>
        requires std::is_scoped_enum_v<E>
    EnumTypeBuilder<E> TypeRegistry::enumeration(std::string name) {
        return EnumTypeBuilder<E>(*this, std::move(name));
    }

    namespace detail {
        template<typename C>
        std::unique_ptr<ListTypeMeta> make_list_meta(const TypeMeta* element_type, TypeKind kind, size_t fixed_size,
                                                     std::string name) {
            auto meta = std::make_unique<ListTypeMeta>();
            meta->size = sizeof(C);
            meta->alignment = alignof(C);
            meta->flags = compute_type_flags<C>();
            meta->kind = kind;
            meta->ops = &ListTypeOps<C>::ops;
            meta->type_info = &typeid(C);
            meta->name = std::move(name);
            meta->element_type = element_type;
            meta->fixed_size = fixed_size;
            meta->length = &ListTypeOps<C>::length;
            meta->resize = kind == TypeKind::DynamicList ? &ListTypeOps<C>::resize : nullptr;
            meta->clear = &ListTypeOps<C>::clear;
            meta->element_at = &ListTypeOps<C>::element_at;
            meta->const_element_at = &ListTypeOps<C>::const_element_at;
            return meta;
        }

        inline std::string element_name(const TypeMeta* element_type) {
            return element_type != nullptr ? element_type->name : std::string("?");
        }
    }  // namespace detail

    template<typename E>
    const ListTypeMeta* TypeRegistry::dynamic_list(const TypeMeta* element_type) {
        using C = std::vector<E>;
        if (auto* existing = find<C>(); existing != nullptr) return static_cast<const ListTypeMeta*>(existing);
        return register_list(detail::make_list_meta<C>(element_type, TypeKind::DynamicList, 0,
                                                       "List[" + detail::element_name(element_type) + "]"),
                             typeid(C));
    }

    template<typename E, size_t N>
    const ListTypeMeta* TypeRegistry::fixed_list(const TypeMeta* element_type) {
        using C = std::array<E, N>;
        if (auto* existing = find<C>(); existing != nullptr) return static_cast<const ListTypeMeta*>(existing);
        return register_list(detail::make_list_meta<C>(element_type, TypeKind::List, N,
                                                       "Array[" + detail::element_name(element_type) + ", " +
                                                       std::to_string(N) + "]"),
                             typeid(C));
    }

    template<typename T>
    const RefTypeMeta* TypeRegistry::ref() {
        if (auto* existing = find<T*>(); existing != nullptr) return static_cast<const RefTypeMeta*>(existing);
        auto meta = std::make_unique<RefTypeMeta>();
        meta->target = bundle_meta_for<T>();
        meta->size = sizeof(T*);
        meta->alignment = alignof(T*);
        meta->flags = compute_type_flags<T*>();
        meta->kind = TypeKind::Ref;
        meta->ops = &RefTypeOps<T>::ops;
        meta->type_info = &typeid(T*);
        meta->name = "Ref[" + meta->target->name + "]";
        meta->store = &RefTypeOps<T>::store;
        meta->load = &RefTypeOps<T>::load;
        return register_ref(std::move(meta), typeid(T*));
    }

    template<typename T>
    const OpaqueTypeMeta* TypeRegistry::opaque(std::string name,
                                               std::function<void(T&, const DynamicValue&)> decode,
                                               std::function<DynamicValue(const T&)> encode) {
        auto meta = std::make_unique<OpaqueTypeMeta>();
        meta->size = sizeof(T);
        meta->alignment = alignof(T);
        meta->flags = compute_type_flags<T>();
        meta->kind = TypeKind::Opaque;
        meta->ops = &OpaqueTypeOps<T>::ops;
        meta->type_info = &typeid(T);
        meta->name = std::move(name);
        if (decode) {
            meta->decode = [decode = std::move(decode)](void* dest, const DynamicValue& structural) {
                decode(*static_cast<T*>(dest), structural);
            };
        }
        if (encode) {
            meta->encode = [encode = std::move(encode)](const void* src) { return encode(*static_cast<const T*>(src)); };
        }
        return register_opaque(std::move(meta), typeid(T));
    }

    template<typename T>
    const TypeMeta* TypeRegistry::meta_for() {
        if (auto* meta = find<T>(); meta != nullptr) return meta;
        if constexpr (std::is_pointer_v<T> && std::is_class_v<std::remove_pointer_t<T>>) {
            return ref<std::remove_pointer_t<T>>();
        } else if constexpr (is_std_vector<T>::value) {
            return dynamic_list<typename T::value_type>();
        } else if constexpr (is_std_array<T>::value) {
            return fixed_list<typename T::value_type, std::tuple_size_v<T>>();
        } else {
            throw_error<std::invalid_argument>("no type descriptor registered for '{}'", typeid(T).name());
        }
    }

}  // namespace opbridge::value
