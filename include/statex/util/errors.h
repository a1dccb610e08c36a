#ifndef STATEX_UTIL_ERRORS
#define STATEX_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>

namespace statex {

    struct StatexError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /// A mutator was invoked on a field that was built without one.
    struct UnsupportedOperation : StatexError {
        using StatexError::StatexError;
    };

    /// The declared reactive structure is invalid (unregistered callable, dependency cycle, bad record type).
    struct ConfigurationError : StatexError {
        using StatexError::StatexError;
    };

    /// A member, key, index or element could not be found.
    struct LookupError : StatexError {
        using StatexError::StatexError;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    template<typename ExpectedT>
    struct bad_expected_type : std::runtime_error {
        bad_expected_type(std::string_view rt_type_name)
            : std::runtime_error{fmt::format("Expected type '{}', got: {}", typeid(ExpectedT).name(), rt_type_name)}
        {}
    };

} // namespace statex

#endif // STATEX_UTIL_ERRORS
