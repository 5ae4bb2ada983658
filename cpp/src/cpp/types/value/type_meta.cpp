#include <opbridge/types/value/enum_type.h>
#include <opbridge/types/value/opaque_type.h>
#include <opbridge/types/value/scalar_type.h>
#include <opbridge/util/string_utils.h>

namespace opbridge::value {

    std::string_view to_string(TypeKind kind) {
        switch (kind) {
            case TypeKind::Scalar: return "Scalar";
            case TypeKind::Enum: return "Enum";
            case TypeKind::List: return "List";
            case TypeKind::DynamicList: return "DynamicList";
            case TypeKind::Bundle: return "Bundle";
            case TypeKind::Ref: return "Ref";
            case TypeKind::Opaque: return "Opaque";
        }
        return "Unknown";
    }

    std::string_view primitive_type_name(PrimitiveKind kind) {
        switch (kind) {
            case PrimitiveKind::Bool: return "bool";
            case PrimitiveKind::Int8: return "int8";
            case PrimitiveKind::Int16: return "int16";
            case PrimitiveKind::Int32: return "int32";
            case PrimitiveKind::Int64: return "int64";
            case PrimitiveKind::UInt8: return "uint8";
            case PrimitiveKind::UInt16: return "uint16";
            case PrimitiveKind::UInt32: return "uint32";
            case PrimitiveKind::UInt64: return "uint64";
            case PrimitiveKind::Float32: return "float";
            case PrimitiveKind::Float64: return "double";
            case PrimitiveKind::String: return "string";
        }
        return "unknown";
    }

    const EnumSymbol* EnumTypeMeta::find_symbol(std::string_view name) const {
        for (const auto& symbol : symbols) {
            if (iequals(symbol.name, name)) return &symbol;
        }
        return nullptr;
    }

    const EnumSymbol* EnumTypeMeta::find_symbol(int64_t raw) const {
        for (const auto& symbol : symbols) {
            if (symbol.value == raw) return &symbol;
        }
        return nullptr;
    }

    namespace {
        bool accepts_any(const DynamicValue&, const TypeMeta*) { return true; }

        void assign_dynamic(void* dest, const DynamicValue& value, const TypeMeta*) {
            *static_cast<DynamicValue*>(dest) = value;
        }

        TypeOps make_dynamic_ops() {
            TypeOps ops = OpaqueTypeOps<DynamicValue>::ops;
            ops.accepts_exact = &accepts_any;
            ops.assign_exact = &assign_dynamic;
            return ops;
        }
    }  // namespace

    const OpaqueTypeMeta* dynamic_type_meta() {
        static const TypeOps ops = make_dynamic_ops();
        static const OpaqueTypeMeta meta = [] {
            OpaqueTypeMeta m{};
            m.size = sizeof(DynamicValue);
            m.alignment = alignof(DynamicValue);
            m.flags = compute_type_flags<DynamicValue>();
            m.kind = TypeKind::Opaque;
            m.ops = &ops;
            m.type_info = &typeid(DynamicValue);
            m.name = "dynamic";
            m.decode = [](void* dest, const DynamicValue& structural) { *static_cast<DynamicValue*>(dest) = structural; };
            m.encode = [](const void* src) { return *static_cast<const DynamicValue*>(src); };
            return m;
        }();
        return &meta;
    }

}  // namespace opbridge::value
