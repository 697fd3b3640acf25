#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace http_connector {

    /// @brief Result<T> holds either a value of type T or an Error.
    /// @tparam T The type of the successful value.
    /// @note Used for internal fallible steps (socket acquisition, URL
    /// parsing). Request outcomes are delivered through the completion
    /// callback instead.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result.
        static Result err(Error error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Shorthand for err(Error{code, message}).
        static Result err(Error::Code code, std::string message) {
            return err(Error{code, std::move(message)});
        }

        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<T>(m_state);
        }

        T& value() & {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<T>(m_state);
        }

        /// @return The stored T, moved out of the Result.
        T&& value() && {
            assert(has_value() &&
                   "Result::value() called but this Result holds an Error");
            return std::get<T>(std::move(m_state));
        }

        const Error& error() const& {
            assert(has_error() &&
                   "Result::error() called but this Result holds a value");
            return std::get<Error>(m_state);
        }

        Error&& error() && {
            assert(has_error() &&
                   "Result::error() called but this Result holds a value");
            return std::get<Error>(std::move(m_state));
        }

        /// @brief Eager fallback: the stored value if present, otherwise
        /// fallback.
        T value_or(T fallback) const& {
            return has_value() ? value() : std::move(fallback);
        }

        T value_or(T fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::move(fallback);
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        std::variant<T, Error> m_state;
    };

}  // namespace http_connector
