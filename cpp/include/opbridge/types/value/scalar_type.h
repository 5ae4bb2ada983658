#ifndef OPBRIDGE_VALUE_SCALAR_TYPE_H
#define OPBRIDGE_VALUE_SCALAR_TYPE_H

#include <opbridge/types/value/type_meta.h>
#include <opbridge/util/string_utils.h>

#include <cstdint>
#include <string>
#include <type_traits>

namespace opbridge::value {

    /**
     * PrimitiveKind - The concrete storage of a Scalar type
     */
    enum class PrimitiveKind : uint8_t {
        Bool,
        Int8,
        Int16,
        Int32,
        Int64,
        UInt8,
        UInt16,
        UInt32,
        UInt64,
        Float32,
        Float64,
        String,
    };

    template<typename T>
    constexpr PrimitiveKind primitive_kind_of() {
        if constexpr (std::is_same_v<T, bool>) return PrimitiveKind::Bool;
        else if constexpr (std::is_same_v<T, std::string>) return PrimitiveKind::String;
        else if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == 4 || sizeof(T) == 8, "unsupported floating point width");
            return sizeof(T) == 4 ? PrimitiveKind::Float32 : PrimitiveKind::Float64;
        } else if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) == 1) return PrimitiveKind::Int8;
            else if constexpr (sizeof(T) == 2) return PrimitiveKind::Int16;
            else if constexpr (sizeof(T) == 4) return PrimitiveKind::Int32;
            else return PrimitiveKind::Int64;
        } else {
            if constexpr (sizeof(T) == 1) return PrimitiveKind::UInt8;
            else if constexpr (sizeof(T) == 2) return PrimitiveKind::UInt16;
            else if constexpr (sizeof(T) == 4) return PrimitiveKind::UInt32;
            else return PrimitiveKind::UInt64;
        }
    }

    template<typename T>
    concept PrimitiveScalar = std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                              std::is_arithmetic_v<T>;

    struct ScalarTypeMeta : TypeMeta {
        PrimitiveKind primitive;

        [[nodiscard]] bool is_integral() const {
            return primitive != PrimitiveKind::Bool && primitive != PrimitiveKind::String &&
                   primitive != PrimitiveKind::Float32 && primitive != PrimitiveKind::Float64;
        }

        [[nodiscard]] bool is_floating_point() const {
            return primitive == PrimitiveKind::Float32 || primitive == PrimitiveKind::Float64;
        }
    };

    /**
     * ScalarTypeOps - Generate TypeOps for a primitive scalar type T
     *
     * Only bool, int64_t, double and std::string accept a dynamic value without
     * coercion; narrower widths always go through the primitive converter.
     */
    template<PrimitiveScalar T>
    struct ScalarTypeOps {
        static std::string to_string(const void* v, const TypeMeta*) {
            const T& value = *static_cast<const T*>(v);
            if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_integral_v<T>) {
                return std::to_string(value);
            } else if constexpr (std::is_floating_point_v<T>) {
                return format_double(static_cast<double>(value));
            } else {
                return value;
            }
        }

        static DynamicValue to_dynamic(const void* v, const TypeMeta*) {
            return DynamicValue(*static_cast<const T*>(v));
        }

        static bool accepts_exact(const DynamicValue& value, const TypeMeta*) {
            if constexpr (std::is_same_v<T, bool>) return value.is_bool();
            else if constexpr (std::is_same_v<T, int64_t>) return value.is_int();
            else if constexpr (std::is_same_v<T, double>) return value.is_float();
            else if constexpr (std::is_same_v<T, std::string>) return value.is_string();
            else return false;
        }

        static void assign_exact(void* dest, const DynamicValue& value, const TypeMeta*) {
            if constexpr (std::is_same_v<T, bool>) *static_cast<T*>(dest) = value.as_bool();
            else if constexpr (std::is_same_v<T, int64_t>) *static_cast<T*>(dest) = value.as_int();
            else if constexpr (std::is_same_v<T, double>) *static_cast<T*>(dest) = value.as_float();
            else if constexpr (std::is_same_v<T, std::string>) *static_cast<T*>(dest) = value.as_string();
        }

        static constexpr TypeOps make_ops() {
            TypeOps ops = ObjectTypeOps<T>::make_ops(&to_string, &to_dynamic);
            ops.accepts_exact = &accepts_exact;
            ops.assign_exact = &assign_exact;
            return ops;
        }

        static const TypeOps ops;
    };

    template<PrimitiveScalar T>
    const TypeOps ScalarTypeOps<T>::ops = ScalarTypeOps<T>::make_ops();

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view primitive_type_name(PrimitiveKind kind);

    /**
     * The process-wide descriptor for the primitive type T. The same instance is
     * shared by every TypeRegistry.
     */
    template<PrimitiveScalar T>
    const ScalarTypeMeta* scalar_type_meta() {
        static const ScalarTypeMeta meta = [] {
            ScalarTypeMeta m{};
            m.size = sizeof(T);
            m.alignment = alignof(T);
            m.flags = compute_type_flags<T>();
            m.kind = TypeKind::Scalar;
            m.ops = &ScalarTypeOps<T>::ops;
            m.type_info = &typeid(T);
            m.primitive = primitive_kind_of<T>();
            m.name = std::string(primitive_type_name(m.primitive));
            return m;
        }();
        return &meta;
    }

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_SCALAR_TYPE_H
