#include <opbridge/types/value/bundle_type.h>
#include <opbridge/types/value/value.h>

namespace opbridge::value {

    MemberPtr BundleTypeMeta::find_member(void* object, std::string_view name) const {
        for (const BundleTypeMeta* meta = this; meta != nullptr; meta = meta->base) {
            if (auto* member = meta->member_by_name(name); member != nullptr) return {member, object};
            if (meta->base != nullptr) object = object != nullptr ? meta->to_base(object) : nullptr;
        }
        return {};
    }

    bool BundleTypeMeta::is_a(const BundleTypeMeta* other) const {
        for (const BundleTypeMeta* meta = this; meta != nullptr; meta = meta->base) {
            if (meta == other) return true;
        }
        return false;
    }

    void* BundleTypeMeta::cast_to(void* object, const BundleTypeMeta* target) const {
        for (const BundleTypeMeta* meta = this; meta != nullptr; meta = meta->base) {
            if (meta == target) return object;
            if (meta->base != nullptr) object = meta->to_base(object);
        }
        return nullptr;
    }

    void BundleTypeMeta::for_each_member(void* object,
                                         const std::function<void(const MemberMeta&, void*)>& fn) const {
        if (base != nullptr) base->for_each_member(to_base(object), fn);
        for (const auto& member : members) fn(member, object);
    }

    ReferenceDescriptor BundleTypeMeta::describe(const void* object) const {
        for (const BundleTypeMeta* meta = this; meta != nullptr; meta = meta->base) {
            if (meta->identify) return meta->identify(object);
            if (meta->base != nullptr) object = meta->to_base(const_cast<void*>(object));
        }
        return {};
    }

    DynamicValue BundleTypeMeta::member_to_dynamic(const void* object, const MemberMeta& member) const {
        if (member.is_field()) {
            return member.type->to_dynamic_at(member.field_ptr(const_cast<void*>(object)));
        }
        Value current(member.type);
        member.getter(object, current.data());
        return current.to_dynamic();
    }

    Mapping BundleTypeMeta::members_to_dynamic(const void* object) const {
        Mapping result;
        for_each_member(const_cast<void*>(object), [&](const MemberMeta& member, void* owner) {
            if (!member.is_visible() || !member.is_readable()) return;
            result.insert_or_assign(member.name, member_to_dynamic(owner, member));
        });
        return result;
    }

}  // namespace opbridge::value
