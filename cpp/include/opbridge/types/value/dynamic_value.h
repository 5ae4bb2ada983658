#ifndef OPBRIDGE_VALUE_DYNAMIC_VALUE_H
#define OPBRIDGE_VALUE_DYNAMIC_VALUE_H

#include <opbridge/opbridge_export.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace opbridge::value {

    class DynamicValue;

    using Sequence = std::vector<DynamicValue>;
    using Mapping = std::map<std::string, DynamicValue, std::less<>>;

    /**
     * ReferenceDescriptor - Identifies a live object owned outside this library
     *
     * Either a stable opaque identifier, a locator path, or both. On the wire it is a
     * Mapping carrying ``$id`` and/or ``$ref``.
     */
    struct ReferenceDescriptor {
        static constexpr std::string_view id_key{"$id"};
        static constexpr std::string_view path_key{"$ref"};

        std::string id;
        std::string path;

        [[nodiscard]] bool has_id() const { return !id.empty(); }
        [[nodiscard]] bool has_path() const { return !path.empty(); }
        [[nodiscard]] bool empty() const { return id.empty() && path.empty(); }

        bool operator==(const ReferenceDescriptor &) const = default;
    };

    enum class DynamicKind : uint8_t {
        Null,
        Bool,
        Int,
        Float,
        String,
        Sequence,
        Mapping,
        Reference,
    };

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(DynamicKind kind);

    /**
     * DynamicValue - The untyped, JSON-like value carried by request payloads
     *
     * A closed variant of Null, Bool, Int, Float, String, Sequence, Mapping and
     * ReferenceDescriptor. Numbers keep their integral or floating nature as received.
     *
     * Usage:
     *   DynamicValue payload = Mapping{{"operation", "update"}, {"intensity", 2.5}};
     *   if (auto* op = payload.find("operation"); op && op->is_string()) { ... }
     */
    class OPBRIDGE_EXPORT DynamicValue {
    public:
        using storage_type = std::variant<std::monostate, bool, int64_t, double, std::string, Sequence, Mapping,
                                          ReferenceDescriptor>;

        DynamicValue() = default;
        DynamicValue(std::nullptr_t) {}
        DynamicValue(bool value) : _value(value) {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        DynamicValue(T value) : _value(static_cast<int64_t>(value)) {}

        template<std::floating_point T>
        DynamicValue(T value) : _value(static_cast<double>(value)) {}

        DynamicValue(const char *value) : _value(std::string(value)) {}
        DynamicValue(std::string_view value) : _value(std::string(value)) {}
        DynamicValue(std::string value) : _value(std::move(value)) {}
        DynamicValue(Sequence value) : _value(std::move(value)) {}
        DynamicValue(Mapping value) : _value(std::move(value)) {}
        DynamicValue(ReferenceDescriptor value) : _value(std::move(value)) {}

        [[nodiscard]] DynamicKind kind() const { return static_cast<DynamicKind>(_value.index()); }
        [[nodiscard]] std::string_view kind_name() const { return value::to_string(kind()); }

        [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(_value); }
        [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(_value); }
        [[nodiscard]] bool is_int() const { return std::holds_alternative<int64_t>(_value); }
        [[nodiscard]] bool is_float() const { return std::holds_alternative<double>(_value); }
        [[nodiscard]] bool is_number() const { return is_int() || is_float(); }
        [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(_value); }
        [[nodiscard]] bool is_sequence() const { return std::holds_alternative<Sequence>(_value); }
        [[nodiscard]] bool is_mapping() const { return std::holds_alternative<Mapping>(_value); }
        [[nodiscard]] bool is_reference() const { return std::holds_alternative<ReferenceDescriptor>(_value); }

        // Checked accessors, throw std::bad_variant_access on a kind mismatch
        [[nodiscard]] bool as_bool() const { return std::get<bool>(_value); }
        [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(_value); }
        [[nodiscard]] double as_float() const { return std::get<double>(_value); }
        [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(_value); }
        [[nodiscard]] const Sequence &as_sequence() const { return std::get<Sequence>(_value); }
        [[nodiscard]] Sequence &as_sequence() { return std::get<Sequence>(_value); }
        [[nodiscard]] const Mapping &as_mapping() const { return std::get<Mapping>(_value); }
        [[nodiscard]] Mapping &as_mapping() { return std::get<Mapping>(_value); }
        [[nodiscard]] const ReferenceDescriptor &as_reference() const { return std::get<ReferenceDescriptor>(_value); }

        // Int or Float widened to double
        [[nodiscard]] double as_number() const;

        template<typename T>
        [[nodiscard]] const T *get_if() const { return std::get_if<T>(&_value); }

        // Mapping lookup, nullptr when this is not a Mapping or the key is absent
        [[nodiscard]] const DynamicValue *find(std::string_view key) const;

        /**
         * Textual representation. Strings render as their raw text, every other kind
         * renders in a JSON-like form with strings quoted inside containers.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] const storage_type &storage() const { return _value; }

        bool operator==(const DynamicValue &other) const;

    private:
        storage_type _value;
    };

    // Reference descriptors become {"$id": .., "$ref": ..} Mappings, recursively
    [[nodiscard]] OPBRIDGE_EXPORT DynamicValue to_structural(const DynamicValue &value);

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_DYNAMIC_VALUE_H
