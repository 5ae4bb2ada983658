#ifndef OPBRIDGE_VALUE_REF_TYPE_H
#define OPBRIDGE_VALUE_REF_TYPE_H

#include <opbridge/types/value/bundle_type.h>

#include <string>

namespace opbridge::value {

    /**
     * RefTypeMeta - Extended TypeMeta for references to live objects
     *
     * Storage is a ``T*`` where T is the C++ type described by ``target``. The
     * referenced object is owned by the live object graph, never by the value.
     */
    struct RefTypeMeta : TypeMeta {
        const BundleTypeMeta* target;
        void (*store)(void* dest, void* object);
        void* (*load)(const void* src);

        [[nodiscard]] bool is_null_at(const void* src) const { return load(src) == nullptr; }
    };

    template<typename T>
    struct RefTypeOps {
        static void store(void* dest, void* object) { *static_cast<T**>(dest) = static_cast<T*>(object); }

        static void* load(const void* src) {
            return const_cast<void*>(static_cast<const void*>(*static_cast<T* const*>(src)));
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            auto* object = load(v);
            if (object == nullptr) return "null";
            auto* target = static_cast<const RefTypeMeta*>(meta)->target;
            auto descriptor = target->describe(object);
            return "<" + target->name + (descriptor.has_path() ? " " + descriptor.path : std::string{}) + ">";
        }

        static DynamicValue to_dynamic(const void* v, const TypeMeta* meta) {
            auto* object = load(v);
            if (object == nullptr) return {};
            auto* target = static_cast<const RefTypeMeta*>(meta)->target;
            auto descriptor = target->describe(object);
            if (descriptor.empty()) return Mapping{{"$type", target->name}};
            return descriptor;
        }

        static constexpr TypeOps make_ops() { return ObjectTypeOps<T*>::make_ops(&to_string, &to_dynamic); }

        static const TypeOps ops;
    };

    template<typename T>
    const TypeOps RefTypeOps<T>::ops = RefTypeOps<T>::make_ops();

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_REF_TYPE_H
