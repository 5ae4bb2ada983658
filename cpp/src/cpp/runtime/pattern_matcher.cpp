#include <opbridge/runtime/pattern_matcher.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>

namespace opbridge {

    PatternMatcher::PatternMatcher(std::string_view pattern, bool use_regex)
        : _pattern(pattern), _search(use_regex) {
        if (_pattern.empty()) throw_error<ValidationError>("pattern cannot be empty");
        try {
            if (use_regex) {
                _regex.emplace(_pattern, std::regex::ECMAScript | std::regex::icase);
            } else if (has_wildcards(_pattern)) {
                _regex.emplace(wildcard_to_regex(_pattern), std::regex::ECMAScript | std::regex::icase);
            }
        } catch (const std::regex_error &e) {
            throw_error<ValidationError>("Invalid regex pattern: {} ({})", _pattern, e.what());
        }
    }

    bool PatternMatcher::matches(std::string_view name) const {
        if (!_regex.has_value()) return name == _pattern;
        if (_search) return std::regex_search(name.begin(), name.end(), *_regex);
        return std::regex_match(name.begin(), name.end(), *_regex);
    }

    bool PatternMatcher::has_wildcards(std::string_view pattern) {
        return pattern.find_first_of("*?") != std::string_view::npos;
    }

    std::string PatternMatcher::wildcard_to_regex(std::string_view pattern) {
        std::string result;
        result.reserve(pattern.size() * 2 + 2);
        result += '^';
        for (char c : pattern) {
            switch (c) {
                case '*': result += ".*"; break;
                case '?': result += '.'; break;
                case '.': case '\\': case '+': case '^': case '$': case '(': case ')':
                case '[': case ']': case '{': case '}': case '|':
                    result += '\\';
                    result += c;
                    break;
                default: result += c;
            }
        }
        result += '$';
        return result;
    }

}  // namespace opbridge
