#ifndef OPBRIDGE_CONVERSION_CONVERTERS_H
#define OPBRIDGE_CONVERSION_CONVERTERS_H

#include <opbridge/conversion/value_converter.h>
#include <opbridge/opbridge_export.h>

#include <cstdint>
#include <optional>
#include <string>

namespace opbridge {

    /**
     * Resolves live object references. Accepts a ReferenceDescriptor, a Mapping
     * carrying ``$ref`` and/or ``$id`` (``globalObjectId`` and ``guid`` are read as
     * ``$id``), or a plain String taken as a locator path. A reference that does not
     * resolve, or resolves to an object of another kind, becomes a null reference.
     */
    class OPBRIDGE_EXPORT ReferenceConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 400;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "reference"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    // Sequence into std::vector / std::array, element by element
    class OPBRIDGE_EXPORT SequenceConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 300;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "sequence"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    // Mapping into a bundle, member by member; unknown keys are ignored
    class OPBRIDGE_EXPORT CompositeConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 200;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "composite"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    /**
     * Symbol names (case-insensitive) or underlying integers. Integers need not
     * match a declared symbol, they are stored as raw underlying values.
     */
    class OPBRIDGE_EXPORT EnumConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 150;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "enum"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    class OPBRIDGE_EXPORT PrimitiveConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 100;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "primitive"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    /**
     * Last resort for bundles and opaque types: the value is reduced to its
     * structural form and handed to the type's structural decoder.
     */
    class OPBRIDGE_EXPORT StructuralConverter : public ValueConverter {
    public:
        static constexpr int default_priority = 0;

        [[nodiscard]] int priority() const override { return default_priority; }
        [[nodiscard]] std::string_view name() const override { return "structural"; }
        [[nodiscard]] bool can_convert(const value::DynamicValue &value, const value::TypeMeta *target) const override;
        void convert(void *dest, const value::DynamicValue &value, const value::TypeMeta *target,
                     const ConversionEngine &engine) const override;
    };

    /**
     * Interpret ``value`` as a reference descriptor, nullopt when it has no
     * reference shape. An empty String yields an empty descriptor.
     */
    [[nodiscard]] OPBRIDGE_EXPORT std::optional<value::ReferenceDescriptor>
    extract_reference(const value::DynamicValue &value);

    // Primitive coercions shared by the converters and the payload validator, throw ConversionError
    [[nodiscard]] OPBRIDGE_EXPORT bool coerce_to_bool(const value::DynamicValue &value);
    [[nodiscard]] OPBRIDGE_EXPORT int64_t coerce_to_int64(const value::DynamicValue &value);
    [[nodiscard]] OPBRIDGE_EXPORT double coerce_to_double(const value::DynamicValue &value);

}  // namespace opbridge

#endif  // OPBRIDGE_CONVERSION_CONVERTERS_H
