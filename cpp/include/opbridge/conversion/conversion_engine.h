#ifndef OPBRIDGE_CONVERSION_CONVERSION_ENGINE_H
#define OPBRIDGE_CONVERSION_CONVERSION_ENGINE_H

#include <opbridge/conversion/value_converter.h>
#include <opbridge/opbridge_export.h>
#include <opbridge/types/value/value.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace opbridge {

    class ObjectResolver;
    class AssetResolver;

    /**
     * Collaborators used to resolve live object references. Both are optional and
     * not owned; without them every reference converts to null.
     */
    struct ConversionContext {
        const ObjectResolver *objects{nullptr};
        const AssetResolver *assets{nullptr};
    };

    struct ConversionResult {
        value::Value value;
        std::optional<std::string> error;

        [[nodiscard]] bool ok() const { return !error.has_value(); }
    };

    /**
     * ConversionEngine - Coerces dynamic values into described types
     *
     * Conversion order:
     * 1. Null converts to the target's default value (a null reference for Ref types).
     * 2. A value that already has the target's exact shape is stored unchanged.
     * 3. Otherwise the converters are asked in descending priority order; the first
     *    applicable converter that completes wins.
     *
     * When every applicable converter throws, convert() and try_convert() yield the
     * target's default value, convert_into() raises ConversionError.
     */
    class OPBRIDGE_EXPORT ConversionEngine {
    public:
        // Installs the default chain: reference, sequence, composite, enum, primitive, structural
        explicit ConversionEngine(ConversionContext context = {});
        ~ConversionEngine();

        ConversionEngine(ConversionEngine &&) noexcept;
        ConversionEngine &operator=(ConversionEngine &&) noexcept;
        ConversionEngine(const ConversionEngine &) = delete;
        ConversionEngine &operator=(const ConversionEngine &) = delete;

        // Converters of equal priority keep their insertion order
        void add_converter(std::unique_ptr<ValueConverter> converter);

        [[nodiscard]] const std::vector<std::unique_ptr<ValueConverter>> &converters() const { return _converters; }

        [[nodiscard]] const ConversionContext &context() const { return _context; }
        void set_context(ConversionContext context) { _context = context; }

        // Never fails on a bad value: logs and returns the target's default instead
        [[nodiscard]] value::Value convert(const value::DynamicValue &value, const value::TypeMeta *target) const;

        // As convert(), reporting the failure instead of logging it
        [[nodiscard]] ConversionResult try_convert(const value::DynamicValue &value, const value::TypeMeta *target) const;

        // Write into constructed storage of target, throws ConversionError
        void convert_into(void *dest, const value::DynamicValue &value, const value::TypeMeta *target) const;

        // As convert_into(), but a failure logs and leaves the default value in dest
        void convert_tolerant_into(void *dest, const value::DynamicValue &value, const value::TypeMeta *target) const;

        static void assign_default(void *dest, const value::TypeMeta *target);

    private:
        ConversionContext _context;
        std::vector<std::unique_ptr<ValueConverter>> _converters;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_CONVERSION_CONVERSION_ENGINE_H
