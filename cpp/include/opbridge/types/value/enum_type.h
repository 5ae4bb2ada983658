#ifndef OPBRIDGE_VALUE_ENUM_TYPE_H
#define OPBRIDGE_VALUE_ENUM_TYPE_H

#include <opbridge/types/value/type_meta.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace opbridge::value {

    struct EnumSymbol {
        std::string name;
        int64_t value;
    };

    /**
     * EnumTypeMeta - Extended TypeMeta for enumerations
     *
     * Symbols are informational: storage accepts any value of the underlying type,
     * including values that match no declared symbol.
     */
    struct EnumTypeMeta : TypeMeta {
        std::vector<EnumSymbol> symbols;
        int64_t min_raw;   // range of the underlying type
        int64_t max_raw;
        void (*store_raw)(void* dest, int64_t raw);
        int64_t (*load_raw)(const void* src);

        // Case-insensitive symbol lookup
        [[nodiscard]] OPBRIDGE_EXPORT const EnumSymbol* find_symbol(std::string_view name) const;
        [[nodiscard]] OPBRIDGE_EXPORT const EnumSymbol* find_symbol(int64_t raw) const;

        [[nodiscard]] bool fits_underlying(int64_t raw) const { return raw >= min_raw && raw <= max_raw; }
    };

    template<typename E>
        requires std::is_scoped_enum_v<E>
    struct EnumTypeOps {
        using underlying_type = std::underlying_type_t<E>;

        static void store_raw(void* dest, int64_t raw) {
            *static_cast<E*>(dest) = static_cast<E>(static_cast<underlying_type>(raw));
        }

        static int64_t load_raw(const void* src) {
            return static_cast<int64_t>(static_cast<underlying_type>(*static_cast<const E*>(src)));
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            auto raw = load_raw(v);
            if (auto* symbol = static_cast<const EnumTypeMeta*>(meta)->find_symbol(raw); symbol != nullptr) {
                return meta->name + "." + symbol->name;
            }
            return meta->name + "(" + std::to_string(raw) + ")";
        }

        // Declared symbols travel by name, undeclared values by their raw integer
        static DynamicValue to_dynamic(const void* v, const TypeMeta* meta) {
            auto raw = load_raw(v);
            if (auto* symbol = static_cast<const EnumTypeMeta*>(meta)->find_symbol(raw); symbol != nullptr) {
                return DynamicValue(symbol->name);
            }
            return DynamicValue(raw);
        }

        static constexpr TypeOps make_ops() { return ObjectTypeOps<E>::make_ops(&to_string, &to_dynamic); }

        static const TypeOps ops;

        static constexpr int64_t min_raw() {
            return static_cast<int64_t>(std::numeric_limits<underlying_type>::min());
        }

        static constexpr int64_t max_raw() {
            if constexpr (std::is_unsigned_v<underlying_type> && sizeof(underlying_type) >= sizeof(int64_t)) {
                return std::numeric_limits<int64_t>::max();
            } else {
                return static_cast<int64_t>(std::numeric_limits<underlying_type>::max());
            }
        }
    };

    template<typename E>
        requires std::is_scoped_enum_v<E>
    const TypeOps EnumTypeOps<E>::ops = EnumTypeOps<E>::make_ops();

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_ENUM_TYPE_H
