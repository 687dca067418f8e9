//
// Created by usatiynyan.
// The notification source this library subscribes to.
// Implementations must not deliver overlapping notifications for one subscription
// and must deliver at most one of on_error/on_completed.
//

#pragma once

#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observer.hpp"
#include "sl/rx/observer/functor.hpp"

#include <concepts>
#include <utility>

namespace sl::rx {

template <typename ValueT, typename ErrorT>
struct observable {
    using value_type = ValueT;
    using error_type = ErrorT;

public:
    virtual ~observable() = default;

    // never returns nullptr, use empty_disposable() when there is nothing to release
    [[nodiscard]] virtual disposable_ptr subscribe(observer_ptr<ValueT, ErrorT> an_observer) & = 0;

    template <typename OnNextFV, typename OnErrorFV, typename OnCompletedFV>
        requires std::invocable<std::decay_t<OnNextFV>&, ValueT&&> && std::invocable<std::decay_t<OnErrorFV>&, ErrorT&&>
                 && std::invocable<std::decay_t<OnCompletedFV>&>
    [[nodiscard]] disposable_ptr subscribe(OnNextFV&& on_next, OnErrorFV&& on_error, OnCompletedFV&& on_completed) & {
        return subscribe(as_observer<ValueT, ErrorT>(
            std::forward<OnNextFV>(on_next), std::forward<OnErrorFV>(on_error), std::forward<OnCompletedFV>(on_completed)
        ));
    }
};

} // namespace sl::rx
