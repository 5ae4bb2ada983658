#include <opbridge/conversion/member_applier.h>
#include <opbridge/util/log.h>

#include <fmt/format.h>

namespace opbridge {

    using value::DynamicValue;
    using value::Mapping;
    using value::Sequence;

    std::string_view to_string(ApplyStatus status) {
        switch (status) {
            case ApplyStatus::Ok: return "Ok";
            case ApplyStatus::NotFound: return "NotFound";
            case ApplyStatus::Unsupported: return "Unsupported";
            case ApplyStatus::ConversionFailed: return "ConversionFailed";
        }
        return "Unknown";
    }

    void ApplyResult::write_to(Mapping &response) const {
        Sequence updated_names;
        updated_names.reserve(updated.size());
        for (const auto &name : updated) updated_names.emplace_back(name);
        response.insert_or_assign("updated", std::move(updated_names));

        if (!failed.empty()) {
            Mapping failures;
            for (const auto &[name, message] : failed) failures.emplace(name, message);
            response.insert_or_assign("failed", std::move(failures));
        }
        if (partial_success()) response.insert_or_assign("partialSuccess", true);
    }

    ApplyOutcome MemberApplier::apply_member(const value::Instance &target, std::string_view name,
                                             const DynamicValue &raw) const {
        if (!target.valid()) return ApplyOutcome::failure(ApplyStatus::NotFound, "target instance is null");

        auto found = target.meta->find_member(target.ptr, name);
        if (!found.valid()) {
            return ApplyOutcome::failure(ApplyStatus::NotFound,
                                         fmt::format("Property or field '{}' not found on {}", name, target.meta->name));
        }

        const auto &member = *found.member;
        if (member.is_property()) {
            if (!member.is_writable()) {
                return ApplyOutcome::failure(ApplyStatus::Unsupported,
                                             fmt::format("Property '{}' on {} is read-only", name, target.meta->name));
            }
        } else if (!member.is_serializable()) {
            log_warning("Field '{}' on {} exists but is not marked serializable", name, target.meta->name);
            return ApplyOutcome::failure(ApplyStatus::NotFound,
                                         fmt::format("Property or field '{}' not found on {}", name, target.meta->name));
        }
        if (member.is_field() && !member.type->is_move_assignable()) {
            return ApplyOutcome::failure(ApplyStatus::Unsupported,
                                         fmt::format("Field '{}' on {} cannot be assigned", name, target.meta->name));
        }

        auto converted = _engine.try_convert(raw, member.type);
        if (!converted.ok()) {
            return ApplyOutcome::failure(ApplyStatus::ConversionFailed,
                                         fmt::format("Cannot convert {} to '{}' for '{}': {}", raw.to_string(),
                                                     member.type->name, name, *converted.error));
        }

        if (member.is_property()) {
            member.setter(found.object, converted.value.data());
        } else {
            member.type->move_assign_at(member.field_ptr(found.object), converted.value.data());
        }
        return ApplyOutcome::success();
    }

    ApplyResult MemberApplier::apply_members(const value::Instance &target, const Mapping &changes) const {
        ApplyResult result;
        for (const auto &[name, raw] : changes) {
            try {
                auto outcome = apply_member(target, name, raw);
                if (outcome.ok()) {
                    result.updated.insert(name);
                } else {
                    log_warning("Failed to set '{}' on {}: {}", name, target.label(), outcome.message);
                    result.failed.emplace(name, std::move(outcome.message));
                }
            } catch (const std::exception &e) {
                log_warning("Failed to set '{}' on {}: {}", name, target.label(), e.what());
                result.failed.emplace(name, e.what());
            }
        }
        return result;
    }

}  // namespace opbridge
