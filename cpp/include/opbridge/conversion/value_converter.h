#ifndef OPBRIDGE_CONVERSION_VALUE_CONVERTER_H
#define OPBRIDGE_CONVERSION_VALUE_CONVERTER_H

#include <opbridge/types/value/type_meta.h>

#include <string_view>

namespace opbridge {

    class ConversionEngine;

    /**
     * ValueConverter - One narrow rule of the conversion chain
     *
     * The engine asks every converter, highest priority first, whether it applies
     * to (value, target) and lets the first applicable one write the result. A
     * converter that cannot complete throws, and the engine moves on to the next
     * applicable converter.
     */
    class ValueConverter {
    public:
        virtual ~ValueConverter() = default;

        [[nodiscard]] virtual int priority() const = 0;
        [[nodiscard]] virtual std::string_view name() const = 0;

        [[nodiscard]] virtual bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const = 0;

        /**
         * Write the conversion of ``value`` into ``dest``, constructed storage of ``target``.
         * Nested values are converted through ``engine``.
         */
        virtual void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                             const ConversionEngine &engine) const = 0;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_CONVERSION_VALUE_CONVERTER_H
