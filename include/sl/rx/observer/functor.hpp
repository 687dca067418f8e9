//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/model/observer.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

namespace sl::rx {
namespace detail {

template <typename ValueT, typename ErrorT, typename OnNextF, typename OnErrorF, typename OnCompletedF>
struct functor_observer final : observer<ValueT, ErrorT> {
    functor_observer(OnNextF on_next, OnErrorF on_error, OnCompletedF on_completed)
        : on_next_{ std::move(on_next) }, on_error_{ std::move(on_error) }, on_completed_{ std::move(on_completed) } {}

    void on_next(ValueT&& value) & override { on_next_(std::move(value)); }
    void on_error(ErrorT&& error) & override { on_error_(std::move(error)); }
    void on_completed() & override { on_completed_(); }

private:
    OnNextF on_next_;
    OnErrorF on_error_;
    OnCompletedF on_completed_;
};

} // namespace detail

template <typename ValueT, typename ErrorT, typename OnNextFV, typename OnErrorFV, typename OnCompletedFV>
    requires std::invocable<std::decay_t<OnNextFV>&, ValueT&&> && std::invocable<std::decay_t<OnErrorFV>&, ErrorT&&>
             && std::invocable<std::decay_t<OnCompletedFV>&>
observer_ptr<ValueT, ErrorT> as_observer(OnNextFV&& on_next, OnErrorFV&& on_error, OnCompletedFV&& on_completed) {
    using observer_type = detail::functor_observer<
        ValueT,
        ErrorT,
        std::decay_t<OnNextFV>,
        std::decay_t<OnErrorFV>,
        std::decay_t<OnCompletedFV>>;
    return std::make_shared<observer_type>(
        std::forward<OnNextFV>(on_next), std::forward<OnErrorFV>(on_error), std::forward<OnCompletedFV>(on_completed)
    );
}

} // namespace sl::rx
