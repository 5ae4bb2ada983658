/*
 * The entry point into the python _opbridge module. The module serves the
 * process-wide command registry; handlers are installed by the registry
 * initializer on import and resolve objects against a module-owned directory.
 */
#include <opbridge/command/command_dispatcher.h>
#include <opbridge/config/bridge_config.h>
#include <opbridge/handlers/object_command_handler.h>
#include <opbridge/python/dynamic_conversion.h>
#include <opbridge/runtime/instance_directory.h>
#include <opbridge/types/error_type.h>

#include <fmt/format.h>

#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace {

    using namespace opbridge;

    std::shared_ptr<InstanceDirectory> &module_directory() {
        static auto directory = std::make_shared<InstanceDirectory>();
        return directory;
    }

    RegistryInitializer &module_initializer() {
        static RegistryInitializer initializer = [] {
            RegistryInitializer result(CommandRegistry::instance());
            result.add_registrar([](CommandRegistry &registry) {
                register_default_handlers(registry, HandlerServices{.objects = module_directory()});
            });
            return result;
        }();
        return initializer;
    }

    nb::object execute(const std::string &tool, nb::handle payload, const std::string &operation) {
        module_initializer().initialize();
        OperationRequest request{.tool = tool, .operation = operation, .payload = std::nullopt};
        if (!payload.is_none()) {
            try {
                request.payload = python::mapping_from_python(payload);
            } catch (const std::exception &e) {
                return python::to_python(
                    CommandDispatcher::failure(ValidationError(fmt::format("Invalid payload: {}", e.what()))));
            }
        }
        CommandDispatcher dispatcher(CommandRegistry::instance());
        return python::to_python(dispatcher.execute(std::move(request)));
    }

    nb::object configure(nb::handle settings) {
        auto config = BridgeConfig::from_mapping(python::mapping_from_python(settings), BridgeConfig::instance());
        BridgeConfig::set(config);
        return python::to_python(config.to_mapping());
    }

}  // namespace

NB_MODULE(_opbridge, m) {
    using namespace nb::literals;

    m.doc() = "Command routing and value coercion for live object graphs";

    module_initializer().initialize();

    m.def("execute", &execute, "tool"_a, "payload"_a = nb::none(), "operation"_a = "",
          "Run an operation through the registered handler for ``tool``, returns the response dict");
    m.def("statistics", [] { return python::to_python(CommandRegistry::instance().statistics().to_mapping()); },
          "Registry statistics");
    m.def("registered_tools", [] { return CommandRegistry::instance().registered_names(); },
          "Names of the registered handlers");
    m.def("configure", &configure, "settings"_a, "Overlay settings onto the bridge configuration");
    m.def("reinitialize", [] { return module_initializer().reinitialize(); },
          "Clear the registry and run the handler registration again");
}
