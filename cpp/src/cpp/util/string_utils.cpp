#include <opbridge/util/string_utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace opbridge {

    std::string to_lower(std::string_view value) {
        std::string result(value);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    bool iequals(std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
                   return std::tolower(a) == std::tolower(b);
               });
    }

    std::string_view trim(std::string_view value) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!value.empty() && is_space(value.front())) value.remove_prefix(1);
        while (!value.empty() && is_space(value.back())) value.remove_suffix(1);
        return value;
    }

    bool starts_with_icase(std::string_view value, std::string_view prefix) {
        return value.size() >= prefix.size() && iequals(value.substr(0, prefix.size()), prefix);
    }

    std::optional<int64_t> parse_int64(std::string_view value) {
        value = trim(value);
        if (!value.empty() && value.front() == '+') value.remove_prefix(1);
        if (value.empty()) return std::nullopt;
        int64_t result{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
        return result;
    }

    std::optional<double> parse_double(std::string_view value) {
        value = trim(value);
        if (!value.empty() && value.front() == '+') value.remove_prefix(1);
        if (value.empty()) return std::nullopt;
        double result{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
        return result;
    }

    std::string format_double(double value) {
        auto text = fmt::format("{}", value);
        if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
        return text;
    }

}  // namespace opbridge
