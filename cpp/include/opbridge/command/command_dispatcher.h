#ifndef OPBRIDGE_COMMAND_COMMAND_DISPATCHER_H
#define OPBRIDGE_COMMAND_COMMAND_DISPATCHER_H

#include <opbridge/command/command_registry.h>
#include <opbridge/opbridge_export.h>

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace opbridge {

    struct OperationRequest {
        // Registry name of the operation group
        std::string tool;
        // Optional when the payload already carries ``operation``
        std::string operation;
        std::optional<value::Mapping> payload;
    };

    /**
     * CommandDispatcher - The outward entry point: routes a request to its handler
     *
     * execute() never throws. An unknown tool is reported with errorType
     * UnsupportedOperationError and category ``dispatcher``.
     */
    class OPBRIDGE_EXPORT CommandDispatcher {
    public:
        static constexpr std::string_view category{"dispatcher"};

        explicit CommandDispatcher(CommandRegistry& registry) : _registry(registry) {}

        [[nodiscard]] value::Mapping execute(OperationRequest request) const;

        // Failure envelope for ``e`` under the dispatcher category, also used for requests rejected before routing
        [[nodiscard]] static value::Mapping failure(const std::exception &e);

        [[nodiscard]] value::Mapping statistics() const { return _registry.statistics().to_mapping(); }

        [[nodiscard]] CommandRegistry& registry() const { return _registry; }

    private:
        CommandRegistry& _registry;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_COMMAND_COMMAND_DISPATCHER_H
