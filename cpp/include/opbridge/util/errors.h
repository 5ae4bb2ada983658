#ifndef OPBRIDGE_UTIL_ERRORS_H
#define OPBRIDGE_UTIL_ERRORS_H

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace opbridge {

    /**
     * throw_error<E>(...) - Raise E with a message built in place
     *
     *   throw_error<TargetNotFoundError>("Object not found: {}", path);
     *
     * Error types that cannot be built from a message receive the arguments as-is.
     */
    template<typename Error = std::runtime_error, typename... Args>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] void throw_error(Args&&... args) {
        throw Error{std::forward<Args>(args)...};
    }

    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view message) {
        throw Error{std::string(message)};
    }

    template<typename Error = std::runtime_error, typename... Args>
        requires (std::constructible_from<Error, std::string> && sizeof...(Args) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Args...> format, Args&&... args) {
        throw Error{fmt::format(format, std::forward<Args>(args)...)};
    }

}  // namespace opbridge

#endif  // OPBRIDGE_UTIL_ERRORS_H
