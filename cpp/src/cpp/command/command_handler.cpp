#include <opbridge/command/command_handler.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/log.h>
#include <opbridge/util/string_utils.h>

#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>

namespace opbridge {

    using value::DynamicValue;
    using value::Mapping;
    using value::Sequence;

    bool OperationHandler::supports(std::string_view operation) const {
        const auto &operations = supported_operations();
        return std::find(operations.begin(), operations.end(), operation) != operations.end();
    }

    std::string_view to_string(PipelineState state) {
        switch (state) {
            case PipelineState::Idle: return "Idle";
            case PipelineState::Validating: return "Validating";
            case PipelineState::Dispatching: return "Dispatching";
            case PipelineState::AwaitingSideEffect: return "AwaitingSideEffect";
            case PipelineState::Completed: return "Completed";
            case PipelineState::Failed: return "Failed";
        }
        return "Unknown";
    }

    CommandHandler::CommandHandler(HandlerServices services)
        : _services(std::move(services)),
          _engine(ConversionContext{.objects = _services.objects.get(), .assets = _services.assets.get()}),
          _applier(_engine) {}

    // ============================================================================
    // Pipeline
    // ============================================================================

    Mapping CommandHandler::execute(const std::optional<Mapping> &payload) {
        _state = PipelineState::Validating;
        try {
            if (!payload.has_value()) throw_error<ValidationError>("Payload cannot be null");
            validate_payload(*payload);
            const auto operation = get_operation(*payload);

            Mapping working = *payload;
            if (_services.validator) {
                auto validation = _services.validator->validate(working, operation);
                if (!validation.is_valid) {
                    auto message = fmt::format("Payload validation failed: {}", fmt::join(validation.errors, "; "));
                    throw ValidationError(message, std::move(validation.errors));
                }
                if (validation.normalized_payload.has_value()) working = std::move(*validation.normalized_payload);
            }

            if (!supports(operation)) {
                throw_error<UnsupportedOperationError>(
                    "Operation '{}' is not supported by {} handler. Supported operations: {}", operation, category(),
                    fmt::join(supported_operations(), ", "));
            }

            _state = PipelineState::Dispatching;
            Mapping result = execute_operation(operation, working);

            if (is_mutating(operation)) {
                _state = PipelineState::AwaitingSideEffect;
                if (auto side_effect = wait_for_side_effect(operation); side_effect.has_value()) {
                    result.insert_or_assign("sideEffect", std::move(*side_effect));
                }
            }

            result.try_emplace("success", true);
            _state = PipelineState::Completed;
            return result;
        } catch (const std::exception &e) {
            _state = PipelineState::Failed;
            log_debug("{} handler failed: {}", category(), e.what());
            return create_error_response(e.what(), error_type_name(e));
        } catch (...) {
            _state = PipelineState::Failed;
            log_error("{} handler failed with a non-standard exception", category());
            return create_error_response("unknown error", "HandlerExecutionError");
        }
    }

    bool CommandHandler::is_mutating(std::string_view operation) const {
        return std::find(read_only_operations.begin(), read_only_operations.end(), operation) ==
               read_only_operations.end();
    }

    void CommandHandler::validate_payload(const Mapping &payload) const {
        if (!payload.contains("operation")) throw_error<ValidationError>("'operation' parameter is required");
    }

    std::optional<Mapping> CommandHandler::wait_for_side_effect(std::string_view operation) {
        if (!_side_effect_waiter) return std::nullopt;
        return _side_effect_waiter(operation);
    }

    Mapping CommandHandler::create_error_response(std::string_view error, std::string_view error_type) const {
        return Mapping{
            {"success", false},
            {"error", error},
            {"errorType", error_type},
            {"category", category()},
        };
    }

    // ============================================================================
    // Payload helpers
    // ============================================================================

    std::string CommandHandler::get_operation(const Mapping &payload) {
        auto operation = get_string(payload, "operation");
        if (!operation.has_value() || operation->empty()) {
            throw_error<ValidationError>("'operation' parameter cannot be null or empty");
        }
        return *operation;
    }

    std::optional<std::string> CommandHandler::get_string(const Mapping &payload, std::string_view key) {
        auto it = payload.find(key);
        if (it == payload.end() || it->second.is_null()) return std::nullopt;
        return it->second.to_string();
    }

    std::string CommandHandler::get_string(const Mapping &payload, std::string_view key,
                                           std::string_view default_value) {
        auto found = get_string(payload, key);
        return found.has_value() ? std::move(*found) : std::string(default_value);
    }

    bool CommandHandler::get_bool(const Mapping &payload, std::string_view key, bool default_value) {
        auto it = payload.find(key);
        if (it == payload.end()) return default_value;
        const auto &value = it->second;
        if (value.is_bool()) return value.as_bool();
        if (value.is_string()) {
            auto text = trim(value.as_string());
            if (iequals(text, "true")) return true;
            if (iequals(text, "false")) return false;
        }
        return default_value;
    }

    int64_t CommandHandler::get_int(const Mapping &payload, std::string_view key, int64_t default_value) {
        auto it = payload.find(key);
        if (it == payload.end()) return default_value;
        const auto &value = it->second;
        if (value.is_int()) return value.as_int();
        if (value.is_float() && std::isfinite(value.as_float()) && std::abs(value.as_float()) < 9.0e18) {
            return static_cast<int64_t>(value.as_float());
        }
        if (value.is_string()) return parse_int64(value.as_string()).value_or(default_value);
        return default_value;
    }

    double CommandHandler::get_double(const Mapping &payload, std::string_view key, double default_value) {
        auto it = payload.find(key);
        if (it == payload.end()) return default_value;
        const auto &value = it->second;
        if (value.is_number()) return value.as_number();
        if (value.is_string()) return parse_double(value.as_string()).value_or(default_value);
        return default_value;
    }

    const Mapping *CommandHandler::get_mapping(const Mapping &payload, std::string_view key) {
        auto it = payload.find(key);
        return it != payload.end() ? it->second.get_if<Mapping>() : nullptr;
    }

    const Sequence *CommandHandler::get_sequence(const Mapping &payload, std::string_view key) {
        auto it = payload.find(key);
        return it != payload.end() ? it->second.get_if<Sequence>() : nullptr;
    }

    Mapping CommandHandler::create_success_response(Mapping data) {
        data.insert_or_assign("success", true);
        return data;
    }

    Mapping CommandHandler::create_failure_response(std::string_view error, Mapping data) {
        data.insert_or_assign("success", false);
        data.insert_or_assign("error", std::string(error));
        return data;
    }

    // ============================================================================
    // Resolver helpers
    // ============================================================================

    const ObjectResolver &CommandHandler::objects() const {
        if (!_services.objects) throw_error<HandlerExecutionError>("{} handler has no object resolver", category());
        return *_services.objects;
    }

    Instance CommandHandler::resolve_object(std::string_view identifier) const {
        return objects().resolve(identifier);
    }

    std::optional<Instance> CommandHandler::try_resolve_object(std::string_view identifier) const {
        return objects().try_resolve(identifier);
    }

    Instance CommandHandler::resolve_object_from_payload(const Mapping &payload) const {
        if (auto id = get_string(payload, "id"); id.has_value() && !id->empty()) {
            if (auto instance = objects().try_resolve_id(*id); instance.has_value()) return *instance;
            throw_error<TargetNotFoundError>("{} not found: {}", objects().resource_kind(), *id);
        }
        if (auto path = get_string(payload, "path"); path.has_value() && !path->empty()) {
            if (auto instance = objects().try_resolve_path(*path); instance.has_value()) return *instance;
            throw_error<TargetNotFoundError>("{} not found: {}", objects().resource_kind(), *path);
        }
        throw_error<ValidationError>("Either 'id' or 'path' is required");
    }

    Instance CommandHandler::resolve_asset(std::string_view identifier) const {
        if (!_services.assets) throw_error<HandlerExecutionError>("{} handler has no asset resolver", category());
        return _services.assets->resolve(identifier);
    }

    const value::TypeMeta *CommandHandler::resolve_type(std::string_view name) const {
        if (!_services.types) throw_error<HandlerExecutionError>("{} handler has no type resolver", category());
        return _services.types->resolve(name);
    }

}  // namespace opbridge
