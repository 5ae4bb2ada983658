#ifndef OPBRIDGE_VALUE_BUNDLE_TYPE_H
#define OPBRIDGE_VALUE_BUNDLE_TYPE_H

#include <opbridge/types/value/type_meta.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace opbridge::value {

    enum class MemberKind : uint8_t {
        Property,   // accessed through a getter/setter pair
        Field,      // direct storage inside the instance
    };

    enum class MemberFlags : uint8_t {
        None = 0,
        Readable = 1 << 0,
        Writable = 1 << 1,
        Serializable = 1 << 2,  // opt-in visibility marker for fields
    };

    inline MemberFlags operator|(MemberFlags a, MemberFlags b) {
        return static_cast<MemberFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
    }

    inline bool has_flag(MemberFlags flags, MemberFlags test) {
        return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(test)) != 0;
    }

    /**
     * MemberMeta - Metadata for a single named member of a bundle
     *
     * Properties carry a getter and (when writable) a setter; both exchange values
     * through constructed storage of ``type``. Fields expose their storage directly.
     */
    struct MemberMeta {
        std::string name;
        MemberKind kind;
        const TypeMeta* type;
        MemberFlags flags;

        std::function<void*(void* object)> field_ptr;
        std::function<void(const void* object, void* out)> getter;
        std::function<void(void* object, const void* value)> setter;

        [[nodiscard]] bool is_property() const { return kind == MemberKind::Property; }
        [[nodiscard]] bool is_field() const { return kind == MemberKind::Field; }
        [[nodiscard]] bool is_readable() const { return has_flag(flags, MemberFlags::Readable); }
        [[nodiscard]] bool is_writable() const { return has_flag(flags, MemberFlags::Writable); }
        [[nodiscard]] bool is_serializable() const { return has_flag(flags, MemberFlags::Serializable); }

        // Visible to external callers: properties always, fields only with the marker
        [[nodiscard]] bool is_visible() const { return is_property() || is_serializable(); }
    };

    struct BundleTypeMeta;

    /**
     * MemberPtr - A member together with the (base-adjusted) object it belongs to
     */
    struct MemberPtr {
        const MemberMeta* member{nullptr};
        void* object{nullptr};

        [[nodiscard]] bool valid() const { return member != nullptr; }
    };

    /**
     * BundleTypeMeta - Extended TypeMeta for composite types
     *
     * Members are declared once at registration time. A bundle may name a base
     * bundle, in which case the base's members are visible through it and
     * ``to_base`` adjusts an instance pointer to the base sub-object.
     */
    struct BundleTypeMeta : TypeMeta {
        std::vector<MemberMeta> members;
        std::unordered_map<std::string, size_t> name_to_index;

        const BundleTypeMeta* base{nullptr};
        std::function<void*(void* object)> to_base;

        // Stable identity of a live instance, used for labels and reference output
        std::function<ReferenceDescriptor(const void* object)> identify;

        // Optional decoder from the generic structural form (opaque fallback)
        std::function<void(void* dest, const DynamicValue& structural)> structural_decoder;

        [[nodiscard]] size_t member_count() const { return members.size(); }

        [[nodiscard]] const MemberMeta* member_by_name(std::string_view name) const {
            auto it = name_to_index.find(std::string(name));
            return it != name_to_index.end() ? &members[it->second] : nullptr;
        }

        /**
         * Find ``name`` on this bundle or its bases, returning the member with the
         * object pointer adjusted to the declaring bundle.
         */
        [[nodiscard]] OPBRIDGE_EXPORT MemberPtr find_member(void* object, std::string_view name) const;

        [[nodiscard]] OPBRIDGE_EXPORT bool is_a(const BundleTypeMeta* other) const;

        // Adjust ``object`` (an instance of this bundle) to ``target``, nullptr when unrelated
        [[nodiscard]] OPBRIDGE_EXPORT void* cast_to(void* object, const BundleTypeMeta* target) const;

        /**
         * Visit every member, bases first, with the object pointer adjusted to the
         * declaring bundle.
         */
        OPBRIDGE_EXPORT void for_each_member(void* object,
                                             const std::function<void(const MemberMeta&, void*)>& fn) const;

        [[nodiscard]] OPBRIDGE_EXPORT ReferenceDescriptor describe(const void* object) const;

        // Readable properties and serializable fields
        [[nodiscard]] OPBRIDGE_EXPORT Mapping members_to_dynamic(const void* object) const;
        [[nodiscard]] OPBRIDGE_EXPORT DynamicValue member_to_dynamic(const void* object, const MemberMeta& member) const;
    };

    template<typename T>
    struct BundleTypeOps {
        static std::string to_string(const void* v, const TypeMeta* meta) {
            return meta->name + to_dynamic(v, meta).to_string();
        }

        static DynamicValue to_dynamic(const void* v, const TypeMeta* meta) {
            return static_cast<const BundleTypeMeta*>(meta)->members_to_dynamic(v);
        }

        static constexpr TypeOps make_ops() { return ObjectTypeOps<T>::make_ops(&to_string, &to_dynamic); }

        static const TypeOps ops;
    };

    template<typename T>
    const TypeOps BundleTypeOps<T>::ops = BundleTypeOps<T>::make_ops();

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_BUNDLE_TYPE_H
