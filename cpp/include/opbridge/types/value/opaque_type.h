#ifndef OPBRIDGE_VALUE_OPAQUE_TYPE_H
#define OPBRIDGE_VALUE_OPAQUE_TYPE_H

#include <opbridge/types/value/type_meta.h>

#include <functional>
#include <string>

namespace opbridge::value {

    /**
     * OpaqueTypeMeta - Extended TypeMeta for types with no dedicated converter
     *
     * Values reach such a type only through a structural round trip: the dynamic
     * value is reduced to its structural form and handed to ``decode``.
     */
    struct OpaqueTypeMeta : TypeMeta {
        std::function<void(void* dest, const DynamicValue& structural)> decode;
        std::function<DynamicValue(const void* src)> encode;
    };

    template<typename T>
    struct OpaqueTypeOps {
        static std::string to_string(const void* v, const TypeMeta* meta) {
            return to_dynamic(v, meta).to_string();
        }

        static DynamicValue to_dynamic(const void* v, const TypeMeta* meta) {
            auto* opaque = static_cast<const OpaqueTypeMeta*>(meta);
            return opaque->encode ? opaque->encode(v) : DynamicValue{};
        }

        static constexpr TypeOps make_ops() { return ObjectTypeOps<T>::make_ops(&to_string, &to_dynamic); }

        static const TypeOps ops;
    };

    template<typename T>
    const TypeOps OpaqueTypeOps<T>::ops = OpaqueTypeOps<T>::make_ops();

    /**
     * The pass-through type: holds any DynamicValue as-is. Every dynamic value
     * already has its shape, so conversion to it is always the identity.
     */
    [[nodiscard]] OPBRIDGE_EXPORT const OpaqueTypeMeta* dynamic_type_meta();

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_OPAQUE_TYPE_H
