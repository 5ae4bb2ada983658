#ifndef OPBRIDGE_HANDLERS_OBJECT_COMMAND_HANDLER_H
#define OPBRIDGE_HANDLERS_OBJECT_COMMAND_HANDLER_H

#include <opbridge/command/command_handler.h>
#include <opbridge/command/command_registry.h>
#include <opbridge/opbridge_export.h>

#include <string>
#include <vector>

namespace opbridge {

    /**
     * ObjectCommandHandler - Generic inspection and update of live objects
     *
     * Operations:
     * - inspect: ``id`` or ``path``, optional ``members`` filter
     * - update: ``id`` or ``path``, ``changes`` mapping of member name to value
     * - find: ``pattern``, ``useRegex``, ``maxResults``
     * - inspectMultiple: as find, plus ``members``
     * - updateMultiple: as find, plus ``changes`` and ``stopOnError``
     *
     * Without a validator in ``services`` the handler installs a
     * StandardPayloadValidator carrying its own schemas.
     */
    class OPBRIDGE_EXPORT ObjectCommandHandler : public CommandHandler {
    public:
        explicit ObjectCommandHandler(HandlerServices services);

        [[nodiscard]] const std::vector<std::string>& supported_operations() const override;
        [[nodiscard]] std::string_view category() const override { return "object"; }

        // Adds the schemas of every operation of this handler to ``validator``
        static void register_schemas(StandardPayloadValidator& validator);

    protected:
        [[nodiscard]] value::Mapping execute_operation(const std::string& operation,
                                                       const value::Mapping& payload) override;

    private:
        [[nodiscard]] value::Mapping inspect(const value::Mapping& payload) const;
        [[nodiscard]] value::Mapping update(const value::Mapping& payload) const;
        [[nodiscard]] value::Mapping find(const value::Mapping& payload) const;
        [[nodiscard]] value::Mapping inspect_multiple(const value::Mapping& payload) const;
        [[nodiscard]] value::Mapping update_multiple(const value::Mapping& payload) const;

        [[nodiscard]] value::Mapping inspect_instance(const Instance& instance, const value::Sequence* filter) const;
        [[nodiscard]] value::Mapping update_instance(const Instance& instance, const value::Mapping& changes) const;

        [[nodiscard]] static size_t max_results(const value::Mapping& payload);
    };

    /**
     * Registers the handlers shipped with the library: ``objectManage``.
     */
    OPBRIDGE_EXPORT void register_default_handlers(CommandRegistry& registry, const HandlerServices& services);

}  // namespace opbridge

#endif  // OPBRIDGE_HANDLERS_OBJECT_COMMAND_HANDLER_H
