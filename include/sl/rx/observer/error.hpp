//
// Created by usatiynyan.
//

#pragma once

#include <libassert/assert.hpp>

#include <concepts>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sl::rx {

// thrown for error types that are neither std::exception_ptr nor an exception themselves
template <typename ErrorT>
struct unhandled_error : std::runtime_error {
    explicit unhandled_error(ErrorT an_error)
        : std::runtime_error{ "sl::rx: unhandled observable error" }, error{ std::move(an_error) } {}

    ErrorT error;
};

template <typename ErrorTV>
[[noreturn]] void rethrow_error(ErrorTV&& error) {
    using ErrorT = std::decay_t<ErrorTV>;
    if constexpr (std::same_as<ErrorT, std::exception_ptr>) {
        ASSERT(error != nullptr);
        std::rethrow_exception(std::forward<ErrorTV>(error));
    } else if constexpr (std::derived_from<ErrorT, std::exception>) {
        throw ErrorT{ std::forward<ErrorTV>(error) };
    } else {
        throw unhandled_error<ErrorT>{ std::forward<ErrorTV>(error) };
    }
}

} // namespace sl::rx
