#ifndef OPBRIDGE_RUNTIME_PATTERN_MATCHER_H
#define OPBRIDGE_RUNTIME_PATTERN_MATCHER_H

#include <opbridge/opbridge_export.h>

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace opbridge {

    /**
     * PatternMatcher - Compiled name pattern used to select batch targets
     *
     * Regex patterns are case-insensitive ECMAScript expressions searched anywhere in
     * the name, use ``^`` and ``$`` to anchor them. Wildcard patterns accept ``*`` (any run) and ``?`` (any single
     * character); a pattern without wildcards is an exact, case-sensitive match.
     *
     * Construction raises ValidationError for an invalid regex.
     */
    class OPBRIDGE_EXPORT PatternMatcher {
    public:
        PatternMatcher(std::string_view pattern, bool use_regex);

        [[nodiscard]] bool matches(std::string_view name) const;

        [[nodiscard]] const std::string &pattern() const { return _pattern; }
        [[nodiscard]] bool is_exact() const { return !_regex.has_value(); }

        [[nodiscard]] static bool has_wildcards(std::string_view pattern);
        // Anchored regex equivalent of a wildcard pattern
        [[nodiscard]] static std::string wildcard_to_regex(std::string_view pattern);

    private:
        std::string _pattern;
        std::optional<std::regex> _regex;
        bool _search{false};
    };

}  // namespace opbridge

#endif  // OPBRIDGE_RUNTIME_PATTERN_MATCHER_H
