//
// Created by usatiynyan.
//
// Example:
// disposable_ptr handle = weak_subscribe(
//     source,
//     widget,
//     [](widget& self, int&& x) { self.redraw(x); },
//     [](widget& self) { self.close(); }
// );
// ...
// handle->dispose();
//

#pragma once

#include "sl/rx/cancel/bridge.hpp"
#include "sl/rx/model/cancellation.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observable.hpp"
#include "sl/rx/observer/weak.hpp"

#include <memory>
#include <utility>

namespace sl::rx {

// Disposing the returned handle terminates the observer and releases the upstream subscription.
template <typename TargetT, typename ValueT, typename ErrorT, template <typename> typename Atomic>
[[nodiscard]] disposable_ptr subscribe_weak(
    observable<ValueT, ErrorT>& source,
    std::shared_ptr<weak_observer<TargetT, ValueT, ErrorT, Atomic>> an_observer
) {
    ASSERT(an_observer != nullptr);
    an_observer->bind_subscription(source.subscribe(an_observer));
    return an_observer;
}

template <typename TargetT, typename ValueT, typename ErrorT, typename... CallbackFVs>
    requires WeakCallbacksFor<TargetT, ValueT, ErrorT, CallbackFVs...>
[[nodiscard]] disposable_ptr weak_subscribe(
    observable<ValueT, ErrorT>& source,
    const std::shared_ptr<TargetT>& target,
    CallbackFVs&&... callbacks
) {
    return subscribe_weak(
        source, make_weak_observer<ValueT, ErrorT>(target, std::forward<CallbackFVs>(callbacks)...)
    );
}

// vvv cancellation governs the lifetime, no handle is returned

template <typename TargetT, typename ValueT, typename ErrorT, typename OnNextFV>
    requires WeakCallbacksFor<TargetT, ValueT, ErrorT, OnNextFV>
void weak_subscribe(
    observable<ValueT, ErrorT>& source,
    const std::shared_ptr<TargetT>& target,
    OnNextFV&& on_next,
    cancellation_signal& signal
) {
    subscribe_cancellable(source, make_weak_observer<ValueT, ErrorT>(target, std::forward<OnNextFV>(on_next)), signal);
}

// on_terminal is either an error or a completion callback
template <typename TargetT, typename ValueT, typename ErrorT, typename OnNextFV, typename OnTerminalFV>
    requires WeakCallbacksFor<TargetT, ValueT, ErrorT, OnNextFV, OnTerminalFV>
void weak_subscribe(
    observable<ValueT, ErrorT>& source,
    const std::shared_ptr<TargetT>& target,
    OnNextFV&& on_next,
    OnTerminalFV&& on_terminal,
    cancellation_signal& signal
) {
    subscribe_cancellable(
        source,
        make_weak_observer<ValueT, ErrorT>(
            target, std::forward<OnNextFV>(on_next), std::forward<OnTerminalFV>(on_terminal)
        ),
        signal
    );
}

template <typename TargetT, typename ValueT, typename ErrorT, typename OnNextFV, typename OnErrorFV, typename OnCompletedFV>
    requires WeakCallbacksFor<TargetT, ValueT, ErrorT, OnNextFV, OnErrorFV, OnCompletedFV>
void weak_subscribe(
    observable<ValueT, ErrorT>& source,
    const std::shared_ptr<TargetT>& target,
    OnNextFV&& on_next,
    OnErrorFV&& on_error,
    OnCompletedFV&& on_completed,
    cancellation_signal& signal
) {
    subscribe_cancellable(
        source,
        make_weak_observer<ValueT, ErrorT>(
            target,
            std::forward<OnNextFV>(on_next),
            std::forward<OnErrorFV>(on_error),
            std::forward<OnCompletedFV>(on_completed)
        ),
        signal
    );
}

// ^^^ cancellation governs the lifetime, no handle is returned

} // namespace sl::rx
