#ifndef OPBRIDGE_CONVERSION_MEMBER_APPLIER_H
#define OPBRIDGE_CONVERSION_MEMBER_APPLIER_H

#include <opbridge/conversion/conversion_engine.h>
#include <opbridge/opbridge_export.h>
#include <opbridge/types/value/instance.h>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace opbridge {

    enum class ApplyStatus : uint8_t {
        Ok,
        NotFound,           // no writable property and no serializable field of that name
        Unsupported,        // the member exists but cannot be written
        ConversionFailed,   // the raw value could not be coerced to the member's type
    };

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(ApplyStatus status);

    struct ApplyOutcome {
        ApplyStatus status{ApplyStatus::Ok};
        std::string message;

        [[nodiscard]] bool ok() const { return status == ApplyStatus::Ok; }
        explicit operator bool() const { return ok(); }

        static ApplyOutcome success() { return {}; }
        static ApplyOutcome failure(ApplyStatus status, std::string message) { return {status, std::move(message)}; }
    };

    /**
     * Aggregate of a multi-member update. ``partial_success`` holds when some
     * members were written and some were not.
     */
    struct OPBRIDGE_EXPORT ApplyResult {
        std::set<std::string> updated;
        std::map<std::string, std::string> failed;

        [[nodiscard]] bool all_succeeded() const { return failed.empty(); }
        [[nodiscard]] bool partial_success() const { return !failed.empty() && !updated.empty(); }

        // Adds updated, failed (when non-empty) and partialSuccess (when it holds) to a response
        void write_to(value::Mapping &response) const;
    };

    /**
     * MemberApplier - Writes coerced values onto named members of live instances
     *
     * Resolution order for a member name:
     * 1. A writable property, assigned through its setter.
     * 2. A field carrying the serializable marker, assigned in place.
     * 3. Otherwise the member is reported as not found. Fields without the marker
     *    are invisible here even though they exist on the instance.
     */
    class OPBRIDGE_EXPORT MemberApplier {
    public:
        explicit MemberApplier(const ConversionEngine &engine) : _engine(engine) {}

        /**
         * Coerce ``raw`` to the member's type and assign it. Bad names and bad values
         * are reported through the outcome; exceptions thrown by a property setter
         * propagate.
         */
        [[nodiscard]] ApplyOutcome apply_member(const value::Instance &target, std::string_view name,
                                                const value::DynamicValue &raw) const;

        // Applies every entry independently, a failing member never stops the others
        [[nodiscard]] ApplyResult apply_members(const value::Instance &target, const value::Mapping &changes) const;

    private:
        const ConversionEngine &_engine;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_CONVERSION_MEMBER_APPLIER_H
