#include <opbridge/command/command_registry.h>
#include <opbridge/config/bridge_config.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/log.h>
#include <opbridge/util/scope.h>

#include <fmt/ranges.h>

namespace opbridge {

    using value::Mapping;
    using value::Sequence;

    Mapping RegistryStatistics::to_mapping() const {
        Sequence handler_entries;
        handler_entries.reserve(entries.size());
        for (const auto &entry : entries) {
            Sequence operations(entry.supported_operations.begin(), entry.supported_operations.end());
            handler_entries.emplace_back(Mapping{
                {"name", entry.name},
                {"category", entry.category},
                {"version", entry.version},
                {"supportedOperations", std::move(operations)},
            });
        }
        return Mapping{
            {"totalHandlers", total_handlers},
            {"initialized", initialized},
            {"entries", std::move(handler_entries)},
        };
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry &CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_handler(std::string name, std::unique_ptr<OperationHandler> handler) {
        if (name.empty()) throw std::invalid_argument("CommandRegistry::register_handler: name cannot be empty");
        if (!handler) throw_error<std::invalid_argument>("CommandRegistry::register_handler: null handler for '{}'", name);

        auto it = _handlers.find(name);
        if (it != _handlers.end()) {
            if (BridgeConfig::instance().warn_on_handler_overwrite) {
                log_warning("Handler for '{}' is already registered. Overwriting.", name);
            }
            it->second = std::move(handler);
            return;
        }
        _handlers.emplace(std::move(name), std::move(handler));
    }

    OperationHandler *CommandRegistry::try_get_handler(std::string_view name) const noexcept {
        auto it = _handlers.find(name);
        return it != _handlers.end() ? it->second.get() : nullptr;
    }

    OperationHandler &CommandRegistry::get_handler(std::string_view name) const {
        if (auto *handler = try_get_handler(name); handler != nullptr) return *handler;
        throw_error<UnsupportedOperationError>("No handler registered for tool: {}. Available handlers: {}", name,
                                               fmt::join(registered_names(), ", "));
    }

    std::vector<std::string> CommandRegistry::registered_names() const {
        std::vector<std::string> names;
        names.reserve(_handlers.size());
        for (const auto &[name, _] : _handlers) names.push_back(name);
        return names;
    }

    void CommandRegistry::clear() {
        _handlers.clear();
        _initialized = false;
    }

    RegistryStatistics CommandRegistry::statistics() const {
        RegistryStatistics stats{.total_handlers = _handlers.size(), .initialized = _initialized, .entries = {}};
        stats.entries.reserve(_handlers.size());
        for (const auto &[name, handler] : _handlers) {
            stats.entries.push_back(HandlerEntry{
                .name = name,
                .category = std::string(handler->category()),
                .version = std::string(handler->version()),
                .supported_operations = handler->supported_operations(),
            });
        }
        return stats;
    }

    // ============================================================================
    // RegistryInitializer
    // ============================================================================

    void RegistryInitializer::add_registrar(Registrar registrar) {
        if (!registrar) throw std::invalid_argument("RegistryInitializer::add_registrar: registrar is empty");
        _registrars.push_back(std::move(registrar));
    }

    bool RegistryInitializer::initialize() {
        if (_is_initializing || _has_initialized) return false;

        _is_initializing = true;
        auto guard = make_scope_exit([this] { _is_initializing = false; });

        try {
            _registry.clear();
            for (const auto &registrar : _registrars) registrar(_registry);
        } catch (const std::exception &e) {
            log_error("Failed to initialize command handlers: {}", e.what());
            return false;
        }

        _has_initialized = true;
        _registry.set_initialized(true);

        auto stats = _registry.statistics();
        log_info("Initialized {} command handlers", stats.total_handlers);
        for (const auto &entry : stats.entries) {
            log_debug("  - {}: {} (v{})", entry.name, entry.category, entry.version);
        }
        return true;
    }

    bool RegistryInitializer::reinitialize() {
        if (_is_initializing) return false;
        _has_initialized = false;
        return initialize();
    }

    void RegistryInitializer::reset() {
        _is_initializing = false;
        _has_initialized = false;
    }

}  // namespace opbridge
