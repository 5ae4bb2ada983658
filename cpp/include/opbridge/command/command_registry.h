#ifndef OPBRIDGE_COMMAND_COMMAND_REGISTRY_H
#define OPBRIDGE_COMMAND_COMMAND_REGISTRY_H

#include <opbridge/command/command_handler.h>
#include <opbridge/opbridge_export.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace opbridge {

    struct HandlerEntry {
        std::string name;
        std::string category;
        std::string version;
        std::vector<std::string> supported_operations;
    };

    struct OPBRIDGE_EXPORT RegistryStatistics {
        size_t total_handlers{0};
        bool initialized{false};
        std::vector<HandlerEntry> entries;

        // {totalHandlers, initialized, entries: [{name, category, version, supportedOperations}]}
        [[nodiscard]] value::Mapping to_mapping() const;
    };

    /**
     * CommandRegistry - Maps operation group names to the handlers serving them
     *
     * Entries are written during a guarded initialization pass (see
     * RegistryInitializer) and only read afterwards. The registry is not safe for
     * concurrent mutation during lookup.
     */
    class OPBRIDGE_EXPORT CommandRegistry {
    public:
        CommandRegistry() = default;

        CommandRegistry(const CommandRegistry&) = delete;
        CommandRegistry& operator=(const CommandRegistry&) = delete;

        static CommandRegistry& instance();

        /**
         * Insert or replace the handler for ``name``, the last registration wins.
         * Throws std::invalid_argument for an empty name or a null handler.
         */
        void register_handler(std::string name, std::unique_ptr<OperationHandler> handler);

        template<typename H, typename... Args>
        H& emplace(std::string name, Args&&... args) {
            auto handler = std::make_unique<H>(std::forward<Args>(args)...);
            auto& ref = *handler;
            register_handler(std::move(name), std::move(handler));
            return ref;
        }

        [[nodiscard]] OperationHandler* try_get_handler(std::string_view name) const noexcept;

        // Throws UnsupportedOperationError naming the available handlers
        [[nodiscard]] OperationHandler& get_handler(std::string_view name) const;

        [[nodiscard]] bool is_registered(std::string_view name) const { return try_get_handler(name) != nullptr; }
        [[nodiscard]] std::vector<std::string> registered_names() const;
        [[nodiscard]] size_t size() const { return _handlers.size(); }

        // Removes every entry and drops the initialized mark
        void clear();

        [[nodiscard]] RegistryStatistics statistics() const;

        [[nodiscard]] bool initialized() const { return _initialized; }
        void set_initialized(bool initialized) { _initialized = initialized; }

    private:
        std::map<std::string, std::unique_ptr<OperationHandler>, std::less<>> _handlers;
        bool _initialized{false};
    };

    using Registrar = std::function<void(CommandRegistry& registry)>;

    /**
     * RegistryInitializer - Runs the single initialization pass of a registry
     *
     * initialize() clears the registry and runs every registrar in order. It has
     * no effect while a pass is running or once one has completed; reinitialize()
     * forces a fresh pass. A failing registrar is logged, leaves the initializer
     * uninitialized and never propagates.
     */
    class OPBRIDGE_EXPORT RegistryInitializer {
    public:
        explicit RegistryInitializer(CommandRegistry& registry) : _registry(registry) {}

        void add_registrar(Registrar registrar);

        // True when this call ran a complete pass
        bool initialize();
        bool reinitialize();

        void reset();

        [[nodiscard]] bool is_initialized() const { return _has_initialized; }
        [[nodiscard]] bool is_initializing() const { return _is_initializing; }

        [[nodiscard]] CommandRegistry& registry() const { return _registry; }

    private:
        CommandRegistry& _registry;
        std::vector<Registrar> _registrars;
        bool _is_initializing{false};
        bool _has_initialized{false};
    };

}  // namespace opbridge

#endif  // OPBRIDGE_COMMAND_COMMAND_REGISTRY_H
