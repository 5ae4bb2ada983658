#include <opbridge/command/command_dispatcher.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/log.h>

namespace opbridge {

    using value::Mapping;

    Mapping CommandDispatcher::failure(const std::exception &e) {
        return Mapping{
            {"success", false},
            {"error", e.what()},
            {"errorType", error_type_name(e)},
            {"category", category},
        };
    }

    Mapping CommandDispatcher::execute(OperationRequest request) const {
        try {
            auto &handler = _registry.get_handler(request.tool);

            if (!request.operation.empty()) {
                if (!request.payload.has_value()) request.payload.emplace();
                auto [it, inserted] = request.payload->try_emplace("operation", request.operation);
                if (!inserted && it->second.is_null()) {
                    it->second = request.operation;
                } else if (!inserted && !(it->second.is_string() && it->second.as_string() == request.operation)) {
                    throw_error<ValidationError>("Operation '{}' conflicts with payload operation '{}'",
                                                 request.operation, it->second.to_string());
                }
            }
            return handler.execute(request.payload);
        } catch (const std::exception &e) {
            log_debug("Dispatch of '{}' failed: {}", request.tool, e.what());
            return failure(e);
        }
    }

}  // namespace opbridge
