#ifndef OPBRIDGE_UTIL_STRING_UTILS_H
#define OPBRIDGE_UTIL_STRING_UTILS_H

#include <opbridge/opbridge_export.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace opbridge {

    [[nodiscard]] OPBRIDGE_EXPORT std::string to_lower(std::string_view value);

    // ASCII case-insensitive comparison
    [[nodiscard]] OPBRIDGE_EXPORT bool iequals(std::string_view lhs, std::string_view rhs);

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view trim(std::string_view value);

    [[nodiscard]] OPBRIDGE_EXPORT bool starts_with_icase(std::string_view value, std::string_view prefix);

    /**
     * Parse the whole of ``value`` (surrounding whitespace ignored) as a number.
     * Returns nullopt when any character is left unconsumed.
     */
    [[nodiscard]] OPBRIDGE_EXPORT std::optional<int64_t> parse_int64(std::string_view value);
    [[nodiscard]] OPBRIDGE_EXPORT std::optional<double> parse_double(std::string_view value);

    // Shortest representation that parses back to the same double, always keeping a decimal point
    [[nodiscard]] OPBRIDGE_EXPORT std::string format_double(double value);

} // namespace opbridge

#endif // OPBRIDGE_UTIL_STRING_UTILS_H
