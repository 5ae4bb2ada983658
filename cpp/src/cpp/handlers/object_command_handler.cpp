#include <opbridge/config/bridge_config.h>
#include <opbridge/handlers/object_command_handler.h>
#include <opbridge/runtime/batch.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>

#include <algorithm>

namespace opbridge {

    using value::DynamicValue;
    using value::Mapping;
    using value::Sequence;

    namespace {

        HandlerServices with_default_validator(HandlerServices services) {
            if (!services.validator) {
                auto validator = std::make_shared<StandardPayloadValidator>();
                ObjectCommandHandler::register_schemas(*validator);
                services.validator = std::move(validator);
            }
            return services;
        }

        void require_target(const Mapping &payload, ValidationResult &result) {
            auto present = [&payload](std::string_view key) {
                auto it = payload.find(key);
                return it != payload.end() && it->second.is_string() && !it->second.as_string().empty();
            };
            if (!present("id") && !present("path")) result.add_error("Either 'id' or 'path' is required");
        }

        void require_positive_max_results(const Mapping &payload, ValidationResult &result) {
            auto it = payload.find("maxResults");
            if (it != payload.end() && it->second.is_int() && it->second.as_int() <= 0) {
                result.add_error("maxResults must be greater than zero");
            }
        }

        bool contains_name(const Sequence &names, std::string_view name) {
            return std::any_of(names.begin(), names.end(), [name](const DynamicValue &entry) {
                return entry.is_string() && entry.as_string() == name;
            });
        }

    }  // namespace

    ObjectCommandHandler::ObjectCommandHandler(HandlerServices services)
        : CommandHandler(with_default_validator(std::move(services))) {}

    const std::vector<std::string> &ObjectCommandHandler::supported_operations() const {
        static const std::vector<std::string> operations{"inspect", "update", "find", "inspectMultiple",
                                                         "updateMultiple"};
        return operations;
    }

    void ObjectCommandHandler::register_schemas(StandardPayloadValidator &validator) {
        validator.register_operation("inspect", OperationSchema{}
                                                    .parameter("id", ParameterKind::String)
                                                    .parameter("path", ParameterKind::String)
                                                    .parameter("members", ParameterKind::Sequence)
                                                    .validator(require_target)
                                                    .describe("Read the visible members of one object"));
        validator.register_operation("update", OperationSchema{}
                                                   .require("changes", ParameterKind::Mapping)
                                                   .parameter("id", ParameterKind::String)
                                                   .parameter("path", ParameterKind::String)
                                                   .validator(require_target)
                                                   .describe("Write members of one object"));
        validator.register_operation("find", OperationSchema{}
                                                 .require("pattern", ParameterKind::String)
                                                 .parameter("useRegex", ParameterKind::Bool, false)
                                                 .parameter("maxResults", ParameterKind::Integer)
                                                 .validator(require_positive_max_results)
                                                 .describe("List the objects matching a pattern"));
        validator.register_operation("inspectMultiple", OperationSchema{}
                                                            .require("pattern", ParameterKind::String)
                                                            .parameter("useRegex", ParameterKind::Bool, false)
                                                            .parameter("maxResults", ParameterKind::Integer)
                                                            .parameter("members", ParameterKind::Sequence)
                                                            .validator(require_positive_max_results)
                                                            .describe("Read the visible members of matching objects"));
        validator.register_operation("updateMultiple", OperationSchema{}
                                                           .require("pattern", ParameterKind::String)
                                                           .require("changes", ParameterKind::Mapping)
                                                           .parameter("useRegex", ParameterKind::Bool, false)
                                                           .parameter("maxResults", ParameterKind::Integer)
                                                           .parameter("stopOnError", ParameterKind::Bool, false)
                                                           .validator(require_positive_max_results)
                                                           .describe("Write members of matching objects"));
    }

    Mapping ObjectCommandHandler::execute_operation(const std::string &operation, const Mapping &payload) {
        if (operation == "inspect") return inspect(payload);
        if (operation == "update") return update(payload);
        if (operation == "find") return find(payload);
        if (operation == "inspectMultiple") return inspect_multiple(payload);
        if (operation == "updateMultiple") return update_multiple(payload);
        throw_error<UnsupportedOperationError>("Unknown object operation: {}", operation);
    }

    // ============================================================================
    // Single target
    // ============================================================================

    Mapping ObjectCommandHandler::inspect_instance(const Instance &instance, const Sequence *filter) const {
        Mapping members = instance.meta->members_to_dynamic(instance.ptr);
        if (filter != nullptr) {
            std::erase_if(members, [filter](const auto &entry) { return !contains_name(*filter, entry.first); });
        }
        return Mapping{
            {"target", objects().describe(instance)},
            {"type", instance.meta->name},
            {"members", std::move(members)},
        };
    }

    Mapping ObjectCommandHandler::update_instance(const Instance &instance, const Mapping &changes) const {
        Mapping response{{"target", objects().describe(instance)}};
        member_applier().apply_members(instance, changes).write_to(response);
        return response;
    }

    Mapping ObjectCommandHandler::inspect(const Mapping &payload) const {
        return create_success_response(inspect_instance(resolve_object_from_payload(payload), get_sequence(payload, "members")));
    }

    Mapping ObjectCommandHandler::update(const Mapping &payload) const {
        const auto *changes = get_mapping(payload, "changes");
        if (changes == nullptr) throw_error<ValidationError>("'changes' must be a mapping");
        return create_success_response(update_instance(resolve_object_from_payload(payload), *changes));
    }

    // ============================================================================
    // Pattern targets
    // ============================================================================

    size_t ObjectCommandHandler::max_results(const Mapping &payload) {
        auto requested = get_int(payload, "maxResults", static_cast<int64_t>(BridgeConfig::instance().default_max_results));
        if (requested <= 0) throw_error<ValidationError>("maxResults must be greater than zero, got {}", requested);
        return static_cast<size_t>(requested);
    }

    Mapping ObjectCommandHandler::find(const Mapping &payload) const {
        auto set = resolve_targets(objects(), get_string(payload, "pattern", ""), get_bool(payload, "useRegex"),
                                   max_results(payload));
        Sequence targets;
        targets.reserve(set.targets.size());
        for (const auto &instance : set.targets) targets.emplace_back(objects().describe(instance));
        return create_success_response(Mapping{
            {"targets", std::move(targets)},
            {"totalCount", set.total_count},
            {"truncated", set.truncated},
        });
    }

    Mapping ObjectCommandHandler::inspect_multiple(const Mapping &payload) const {
        auto set = resolve_targets(objects(), get_string(payload, "pattern", ""), get_bool(payload, "useRegex"),
                                   max_results(payload));
        const auto *filter = get_sequence(payload, "members");
        auto batch = run_batched(
            set.targets, [this, filter](const Instance &instance) { return inspect_instance(instance, filter); },
            false, [this](const Instance &instance) { return objects().describe(instance); });

        auto response = batch.to_mapping();
        response.insert_or_assign("totalCount", set.total_count);
        response.insert_or_assign("truncated", set.truncated);
        return create_success_response(std::move(response));
    }

    Mapping ObjectCommandHandler::update_multiple(const Mapping &payload) const {
        const auto *changes = get_mapping(payload, "changes");
        if (changes == nullptr) throw_error<ValidationError>("'changes' must be a mapping");

        auto set = resolve_targets(objects(), get_string(payload, "pattern", ""), get_bool(payload, "useRegex"),
                                   max_results(payload));
        auto batch = run_batched(
            set.targets, [this, changes](const Instance &instance) { return update_instance(instance, *changes); },
            get_bool(payload, "stopOnError"), [this](const Instance &instance) { return objects().describe(instance); });

        auto response = batch.to_mapping();
        response.insert_or_assign("totalCount", set.total_count);
        response.insert_or_assign("truncated", set.truncated);
        return create_success_response(std::move(response));
    }

    void register_default_handlers(CommandRegistry &registry, const HandlerServices &services) {
        registry.emplace<ObjectCommandHandler>("objectManage", services);
    }

}  // namespace opbridge
