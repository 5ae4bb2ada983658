#ifndef OPBRIDGE_COMMAND_COMMAND_HANDLER_H
#define OPBRIDGE_COMMAND_COMMAND_HANDLER_H

#include <opbridge/command/payload_validator.h>
#include <opbridge/conversion/conversion_engine.h>
#include <opbridge/conversion/member_applier.h>
#include <opbridge/opbridge_export.h>
#include <opbridge/runtime/resolvers.h>
#include <opbridge/types/value/dynamic_value.h>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace opbridge {

    /**
     * OperationHandler - A named group of operations reachable through the registry
     *
     * execute() never throws: every failure is reported through the response
     * envelope ``{success: false, error, errorType, category}``.
     */
    class OPBRIDGE_EXPORT OperationHandler {
    public:
        virtual ~OperationHandler() = default;

        [[nodiscard]] virtual value::Mapping execute(const std::optional<value::Mapping>& payload) = 0;

        [[nodiscard]] virtual const std::vector<std::string>& supported_operations() const = 0;
        [[nodiscard]] virtual std::string_view category() const = 0;
        [[nodiscard]] virtual std::string_view version() const { return "1.0.0"; }

        [[nodiscard]] bool supports(std::string_view operation) const;
    };

    enum class PipelineState : uint8_t {
        Idle,
        Validating,
        Dispatching,
        AwaitingSideEffect,
        Completed,
        Failed,
    };

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(PipelineState state);

    // Called after a mutating operation; a returned mapping is reported under ``sideEffect``
    using SideEffectWaiter = std::function<std::optional<value::Mapping>(std::string_view operation)>;

    /**
     * Collaborators shared by the handlers of one host. Every member is optional;
     * helpers needing a missing collaborator raise HandlerExecutionError.
     */
    struct HandlerServices {
        std::shared_ptr<const PayloadValidator> validator;
        std::shared_ptr<const ObjectResolver> objects;
        std::shared_ptr<const AssetResolver> assets;
        std::shared_ptr<const TypeResolver> types;
    };

    /**
     * CommandHandler - The execution pipeline every operation handler runs through
     *
     * execute() performs, in order:
     * 1. Reject an absent payload and one without a non-empty ``operation``.
     * 2. Run the payload validator; a normalized payload replaces the original.
     * 3. Reject operations outside supported_operations().
     * 4. Dispatch to execute_operation().
     * 5. For mutating operations, run the side effect waiter.
     * 6. Add ``success: true`` unless the operation already decided it.
     *
     * Subclasses implement execute_operation() and report expected failures either
     * by throwing a BridgeError or by returning create_failure_response().
     */
    class OPBRIDGE_EXPORT CommandHandler : public OperationHandler {
    public:
        explicit CommandHandler(HandlerServices services = {});

        CommandHandler(const CommandHandler&) = delete;
        CommandHandler& operator=(const CommandHandler&) = delete;

        [[nodiscard]] value::Mapping execute(const std::optional<value::Mapping>& payload) final;

        static constexpr std::array<std::string_view, 5> read_only_operations{
            "inspect", "list", "find", "findMultiple", "inspectMultiple"};

        // Everything outside read_only_operations is treated as mutating
        [[nodiscard]] virtual bool is_mutating(std::string_view operation) const;

        // The default waiter does nothing, a host that must observe side effects installs its own
        void set_side_effect_waiter(SideEffectWaiter waiter) { _side_effect_waiter = std::move(waiter); }

        [[nodiscard]] PipelineState state() const { return _state; }
        [[nodiscard]] const HandlerServices& services() const { return _services; }
        [[nodiscard]] ConversionEngine& engine() { return _engine; }
        [[nodiscard]] const ConversionEngine& engine() const { return _engine; }

    protected:
        [[nodiscard]] virtual value::Mapping execute_operation(const std::string& operation,
                                                               const value::Mapping& payload) = 0;

        // Structural checks made before the validator runs
        virtual void validate_payload(const value::Mapping& payload) const;

        [[nodiscard]] virtual std::optional<value::Mapping> wait_for_side_effect(std::string_view operation);

        [[nodiscard]] virtual value::Mapping create_error_response(std::string_view error,
                                                                   std::string_view error_type) const;

        [[nodiscard]] const MemberApplier& member_applier() const { return _applier; }

        // ========== Payload helpers ==========

        [[nodiscard]] static std::string get_operation(const value::Mapping& payload);

        // Absent and null entries yield nullopt, non-string values their textual form
        [[nodiscard]] static std::optional<std::string> get_string(const value::Mapping& payload, std::string_view key);
        [[nodiscard]] static std::string get_string(const value::Mapping& payload, std::string_view key,
                                                    std::string_view default_value);
        [[nodiscard]] static bool get_bool(const value::Mapping& payload, std::string_view key,
                                           bool default_value = false);
        [[nodiscard]] static int64_t get_int(const value::Mapping& payload, std::string_view key,
                                             int64_t default_value = 0);
        [[nodiscard]] static double get_double(const value::Mapping& payload, std::string_view key,
                                               double default_value = 0.0);
        [[nodiscard]] static const value::Mapping* get_mapping(const value::Mapping& payload, std::string_view key);
        [[nodiscard]] static const value::Sequence* get_sequence(const value::Mapping& payload, std::string_view key);

        [[nodiscard]] static value::Mapping create_success_response(value::Mapping data = {});
        [[nodiscard]] static value::Mapping create_failure_response(std::string_view error, value::Mapping data = {});

        // ========== Resolver helpers ==========

        [[nodiscard]] Instance resolve_object(std::string_view identifier) const;
        [[nodiscard]] std::optional<Instance> try_resolve_object(std::string_view identifier) const;

        // Resolves ``id`` when present, else ``path``; ValidationError when neither is given
        [[nodiscard]] Instance resolve_object_from_payload(const value::Mapping& payload) const;

        [[nodiscard]] Instance resolve_asset(std::string_view identifier) const;
        [[nodiscard]] const value::TypeMeta* resolve_type(std::string_view name) const;

        [[nodiscard]] const ObjectResolver& objects() const;

    private:
        HandlerServices _services;
        ConversionEngine _engine;
        MemberApplier _applier;
        SideEffectWaiter _side_effect_waiter;
        PipelineState _state{PipelineState::Idle};
    };

}  // namespace opbridge

#endif  // OPBRIDGE_COMMAND_COMMAND_HANDLER_H
