#ifndef OPBRIDGE_VALUE_INSTANCE_H
#define OPBRIDGE_VALUE_INSTANCE_H

#include <opbridge/types/value/bundle_type.h>

#include <string>

namespace opbridge::value {

    /**
     * Instance - A transient handle on a live object
     *
     * The object is owned by the live object graph; ``meta`` describes its most
     * derived registered type. Handles are only held for the duration of a request.
     */
    struct Instance {
        void* ptr{nullptr};
        const BundleTypeMeta* meta{nullptr};

        [[nodiscard]] bool valid() const { return ptr != nullptr && meta != nullptr; }

        template<typename T>
        [[nodiscard]] T* as() const { return static_cast<T*>(ptr); }

        // Pointer to the ``target`` sub-object, nullptr when the instance is not a ``target``
        [[nodiscard]] void* cast_to(const BundleTypeMeta* target) const {
            return valid() ? meta->cast_to(ptr, target) : nullptr;
        }

        [[nodiscard]] ReferenceDescriptor describe() const {
            return valid() ? meta->describe(ptr) : ReferenceDescriptor{};
        }

        // Locator path when known, else the opaque id, else the type name
        [[nodiscard]] std::string label() const {
            if (!valid()) return "<null>";
            auto descriptor = describe();
            if (descriptor.has_path()) return descriptor.path;
            if (descriptor.has_id()) return descriptor.id;
            return meta->name;
        }

        bool operator==(const Instance& other) const { return ptr == other.ptr; }

        template<typename T>
        static Instance of(T& object, const BundleTypeMeta* meta) {
            return {static_cast<void*>(&object), meta};
        }
    };

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_INSTANCE_H
