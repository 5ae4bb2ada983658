#ifndef OPBRIDGE_VALUE_TYPE_META_H
#define OPBRIDGE_VALUE_TYPE_META_H

#include <opbridge/types/value/dynamic_value.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace opbridge::value {

    struct TypeMeta;

    /**
     * TypeOps - Dispatch table behind every described type
     *
     * Each entry receives untyped storage plus the owning TypeMeta, which lets the
     * converters and the member applier work on values whose C++ type they never see.
     *
     * ``copy_assign``/``move_assign``/``assign_exact`` write into storage that is
     * already constructed. Entries a type cannot support are left as nullptr.
     */
    struct TypeOps {
        // Storage lifetime
        void (*construct)(void* dest, const TypeMeta* meta);
        void (*destruct)(void* dest, const TypeMeta* meta);
        void (*copy_construct)(void* dest, const void* src, const TypeMeta* meta);
        void (*move_construct)(void* dest, void* src, const TypeMeta* meta);

        void (*copy_assign)(void* dest, const void* src, const TypeMeta* meta);
        void (*move_assign)(void* dest, void* src, const TypeMeta* meta);

        bool (*equals)(const void* a, const void* b, const TypeMeta* meta);

        // Human readable form, used in log lines and error messages
        std::string (*to_string)(const void* v, const TypeMeta* meta);

        // Back to the untyped payload form (inspect responses)
        DynamicValue (*to_dynamic)(const void* v, const TypeMeta* meta);

        // True when the dynamic value already has exactly this type's shape (optional)
        bool (*accepts_exact)(const DynamicValue& value, const TypeMeta* meta);
        // Stores a value accepted by accepts_exact without any coercion (optional)
        void (*assign_exact)(void* dest, const DynamicValue& value, const TypeMeta* meta);
    };

    // Capabilities derived from the C++ type at registration
    enum class TypeFlags : uint32_t {
        None = 0,
        DefaultConstructible = 1 << 0,
        Copyable = 1 << 1,
        Equatable = 1 << 2,
        TriviallyCopyable = 1 << 3,
    };

    inline TypeFlags operator|(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline TypeFlags operator&(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    inline bool has_flag(TypeFlags flags, TypeFlags test) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(test)) != 0;
    }

    template<typename T>
    constexpr TypeFlags compute_type_flags() {
        TypeFlags flags = TypeFlags::None;
        if constexpr (std::is_default_constructible_v<T>) flags = flags | TypeFlags::DefaultConstructible;
        if constexpr (std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>) flags = flags | TypeFlags::Copyable;
        if constexpr (std::is_trivially_copyable_v<T>) flags = flags | TypeFlags::TriviallyCopyable;
        if constexpr (requires(const T& a, const T& b) { { a == b } -> std::convertible_to<bool>; }) {
            flags = flags | TypeFlags::Equatable;
        }
        return flags;
    }

    /**
     * TypeKind - Selects the converter responsible for a target type and the
     * derived TypeMeta struct carrying its extra metadata.
     */
    enum class TypeKind : uint8_t {
        Scalar,      // Primitive: bool, integers, floating point, string
        Enum,        // Enumeration with named symbols over an integral type
        List,        // Fixed-size array (std::array<T, N>)
        DynamicList, // Variable-length sequence (std::vector<T>)
        Bundle,      // Composite with named members
        Ref,         // Reference to a live object owned elsewhere
        Opaque,      // Anything else, decoded from its structural form
    };

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(TypeKind kind);

    /**
     * TypeMeta - Runtime description of a registered type
     *
     * Instances are owned by the TypeRegistry and live for the whole process, so
     * raw ``const TypeMeta*`` handles are passed around freely. Kinds with extra
     * metadata (enums, lists, bundles, refs, opaque types) derive from this struct.
     */
    struct TypeMeta {
        size_t size{0};
        size_t alignment{alignof(std::max_align_t)};
        TypeFlags flags{TypeFlags::None};
        TypeKind kind{TypeKind::Scalar};
        const TypeOps* ops{nullptr};
        const std::type_info* type_info{nullptr};
        std::string name;  // registered name, reported in errors and log lines

        [[nodiscard]] bool is_default_constructible() const {
            return has_flag(flags, TypeFlags::DefaultConstructible) && ops->construct != nullptr;
        }

        [[nodiscard]] bool is_move_assignable() const { return ops->move_assign != nullptr; }

        [[nodiscard]] bool is_copyable() const {
            return has_flag(flags, TypeFlags::Copyable);
        }

        [[nodiscard]] bool is_equatable() const {
            return has_flag(flags, TypeFlags::Equatable);
        }

        template<typename T>
        [[nodiscard]] bool is_type() const {
            return type_info != nullptr && *type_info == typeid(T);
        }

        // Each *_at wrapper is a no-op (or a neutral result) when the entry is missing
        void construct_at(void* storage) const { if (ops->construct != nullptr) ops->construct(storage, this); }
        void destruct_at(void* storage) const { if (ops->destruct != nullptr) ops->destruct(storage, this); }

        void copy_construct_at(void* storage, const void* source) const {
            if (ops->copy_construct != nullptr) ops->copy_construct(storage, source, this);
        }

        void move_construct_at(void* storage, void* source) const {
            if (ops->move_construct != nullptr) ops->move_construct(storage, source, this);
        }

        void copy_assign_at(void* target, const void* source) const {
            if (ops->copy_assign != nullptr) ops->copy_assign(target, source, this);
        }

        void move_assign_at(void* target, void* source) const {
            if (ops->move_assign != nullptr) ops->move_assign(target, source, this);
        }

        [[nodiscard]] bool equals_at(const void* lhs, const void* rhs) const {
            return ops->equals != nullptr && ops->equals(lhs, rhs, this);
        }

        [[nodiscard]] std::string to_string_at(const void* v) const {
            return ops->to_string ? ops->to_string(v, this) : "<" + name + ">";
        }

        [[nodiscard]] DynamicValue to_dynamic_at(const void* v) const {
            return ops->to_dynamic ? ops->to_dynamic(v, this) : DynamicValue{};
        }

        [[nodiscard]] bool accepts_exact(const DynamicValue& value) const {
            return ops->accepts_exact != nullptr && ops->assign_exact != nullptr && ops->accepts_exact(value, this);
        }

        void assign_exact_at(void* dest, const DynamicValue& value) const {
            if (ops->assign_exact) ops->assign_exact(dest, value, this);
        }

        [[nodiscard]] const std::string& type_name() const { return name; }
    };

    /**
     * TypedPtr - Type-erased pointer with type information
     */
    struct TypedPtr {
        void* ptr{nullptr};
        const TypeMeta* meta{nullptr};

        [[nodiscard]] bool valid() const { return ptr && meta; }

        template<typename T>
        [[nodiscard]] T* as() const { return static_cast<T*>(ptr); }
    };

    struct ConstTypedPtr {
        const void* ptr{nullptr};
        const TypeMeta* meta{nullptr};

        [[nodiscard]] bool valid() const { return ptr && meta; }

        template<typename T>
        [[nodiscard]] const T* as() const { return static_cast<const T*>(ptr); }
    };

    /**
     * ObjectTypeOps - TypeOps for an arbitrary C++ type T
     *
     * Lifecycle entries are nullptr when T does not support them; everything else
     * (to_string, to_dynamic) is supplied by the kind-specific descriptor.
     */
    template<typename T>
    struct ObjectTypeOps {
        static void construct(void* dest, const TypeMeta*) { new (dest) T{}; }

        static void destruct(void* dest, const TypeMeta*) { static_cast<T*>(dest)->~T(); }

        static void copy_construct(void* dest, const void* src, const TypeMeta*) {
            new (dest) T(*static_cast<const T*>(src));
        }

        static void move_construct(void* dest, void* src, const TypeMeta*) {
            new (dest) T(std::move(*static_cast<T*>(src)));
        }

        static void copy_assign(void* dest, const void* src, const TypeMeta*) {
            *static_cast<T*>(dest) = *static_cast<const T*>(src);
        }

        static void move_assign(void* dest, void* src, const TypeMeta*) {
            *static_cast<T*>(dest) = std::move(*static_cast<T*>(src));
        }

        static bool equals(const void* a, const void* b, const TypeMeta*) {
            if constexpr (requires(const T& x, const T& y) { { x == y } -> std::convertible_to<bool>; }) {
                return *static_cast<const T*>(a) == *static_cast<const T*>(b);
            } else {
                return a == b;
            }
        }

        // DefaultEquals = false leaves ``equals`` to the caller (containers compare element-wise)
        template<bool DefaultEquals = true>
        static constexpr TypeOps make_ops(std::string (*to_string)(const void*, const TypeMeta*),
                                          DynamicValue (*to_dynamic)(const void*, const TypeMeta*)) {
            TypeOps ops{};
            if constexpr (std::is_default_constructible_v<T>) ops.construct = &construct;
            ops.destruct = &destruct;
            if constexpr (std::is_copy_constructible_v<T>) ops.copy_construct = &copy_construct;
            if constexpr (std::is_move_constructible_v<T>) ops.move_construct = &move_construct;
            if constexpr (std::is_copy_assignable_v<T>) ops.copy_assign = &copy_assign;
            if constexpr (std::is_move_assignable_v<T>) ops.move_assign = &move_assign;
            if constexpr (DefaultEquals) ops.equals = &equals;
            ops.to_string = to_string;
            ops.to_dynamic = to_dynamic;
            return ops;
        }
    };

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_TYPE_META_H
