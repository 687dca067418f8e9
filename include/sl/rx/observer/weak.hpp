//
// Created by usatiynyan.
// Observer that holds its target weakly, the subscription never extends the target's lifetime.
// Once the target is gone the next delivery disposes the upstream subscription.
//
// Example:
// auto an_observer = make_weak_observer<int>(widget, [](widget& self, int&& x) { self.redraw(x); });
// an_observer->bind_subscription(source.subscribe(an_observer));
//

#pragma once

#include "sl/rx/disposable/single_assignment.hpp"
#include "sl/rx/log/log.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observer.hpp"
#include "sl/rx/observer/error.hpp"
#include "sl/rx/thread/detail/sync.hpp"

#include <sl/meta/lifetime/defer.hpp>
#include <sl/meta/traits/unique.hpp>

#include <function2/function2.hpp>
#include <libassert/assert.hpp>

#include <concepts>
#include <cstdint>
#include <exception>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace sl::rx {

template <
    typename TargetT,
    typename ValueT,
    typename ErrorT = std::exception_ptr,
    template <typename> typename Atomic = detail::atomic>
struct weak_observer final
    : observer<ValueT, ErrorT>
    , disposable
    , meta::immovable {
    using target_type = TargetT;
    using value_type = ValueT;
    using error_type = ErrorT;

    using on_next_type = fu2::unique_function<void(TargetT&, ValueT&&)>;
    using on_error_type = fu2::unique_function<void(TargetT&, ErrorT&&)>;
    using on_completed_type = fu2::unique_function<void(TargetT&)>;

    enum observer_state : std::uint32_t {
        observer_state_active,
        observer_state_terminated,
    };

public:
    weak_observer(
        const std::shared_ptr<TargetT>& target,
        on_next_type on_next,
        on_error_type on_error,
        on_completed_type on_completed
    )
        : target_{ target }, on_next_{ std::move(on_next) }, on_error_{ std::move(on_error) },
          on_completed_{ std::move(on_completed) } {
        ASSERT(target != nullptr);
        ASSERT(static_cast<bool>(on_next_));
        ASSERT(static_cast<bool>(on_error_));
        ASSERT(static_cast<bool>(on_completed_));
    }

    // observer
    void on_next(ValueT&& value) & override { deliver_value(std::move(value)); }
    void on_error(ErrorT&& error) & override { deliver_error(std::move(error)); }
    void on_completed() & override { deliver_completed(); }

    // disposable
    void dispose() & noexcept override {
        std::ignore = try_terminate();
        upstream_.dispose();
    }

    // An exception from on_next propagates to the source and does not terminate the observer.
    void deliver_value(ValueT&& value) & {
        if (is_terminated()) {
            return;
        }
        if (const std::shared_ptr<TargetT> target = target_.lock()) {
            on_next_(*target, std::move(value));
            return;
        }
        log::logger()->debug("weak_observer: target expired, disposing subscription");
        dispose();
    }

    void deliver_error(ErrorT&& error) & {
        if (!try_terminate()) {
            log::logger()->trace("weak_observer: error after termination ignored");
            return;
        }
        meta::defer release{ [this] { upstream_.dispose(); } };

        if (const std::shared_ptr<TargetT> target = target_.lock()) {
            on_error_(*target, std::move(error));
        }
    }

    void deliver_completed() & {
        if (!try_terminate()) {
            log::logger()->trace("weak_observer: completion after termination ignored");
            return;
        }
        meta::defer release{ [this] { upstream_.dispose(); } };

        if (const std::shared_ptr<TargetT> target = target_.lock()) {
            on_completed_(*target);
        }
    }

    // Released right away if the observer has already terminated.
    void bind_subscription(disposable_ptr resource) & { upstream_.assign(std::move(resource)); }

    [[nodiscard]] bool is_terminated() const {
        return state_.load(std::memory_order::acquire) == observer_state_terminated;
    }

private:
    [[nodiscard]] bool try_terminate() & {
        auto expected = observer_state_active;
        return state_.compare_exchange_strong(
            expected, observer_state_terminated, std::memory_order::acq_rel, std::memory_order::acquire
        );
    }

private:
    std::weak_ptr<TargetT> target_;
    on_next_type on_next_;
    on_error_type on_error_;
    on_completed_type on_completed_;
    single_assignment_disposable<Atomic> upstream_;
    alignas(detail::cache_line_size) Atomic<observer_state> state_{ observer_state_active };
};

struct rethrow_on_error {
    template <typename TargetT, typename ErrorTV>
    [[noreturn]] void operator()(TargetT&, ErrorTV&& error) const {
        rethrow_error(std::forward<ErrorTV>(error));
    }
};

struct nop_on_completed {
    template <typename TargetT>
    constexpr void operator()(TargetT&) const {}
};

template <typename F, typename TargetT, typename ValueT>
concept OnNextFor = std::invocable<std::decay_t<F>&, TargetT&, ValueT&&>;

template <typename F, typename TargetT, typename ErrorT>
concept OnErrorFor = std::invocable<std::decay_t<F>&, TargetT&, ErrorT&&>;

template <typename F, typename TargetT>
concept OnCompletedFor = std::invocable<std::decay_t<F>&, TargetT&>;

template <
    typename ValueT,
    typename ErrorT = std::exception_ptr,
    template <typename> typename Atomic = detail::atomic,
    typename TargetT,
    OnNextFor<TargetT, ValueT> OnNextFV,
    OnErrorFor<TargetT, ErrorT> OnErrorFV,
    OnCompletedFor<TargetT> OnCompletedFV>
std::shared_ptr<weak_observer<TargetT, ValueT, ErrorT, Atomic>> make_weak_observer(
    const std::shared_ptr<TargetT>& target,
    OnNextFV&& on_next,
    OnErrorFV&& on_error,
    OnCompletedFV&& on_completed
) {
    return std::make_shared<weak_observer<TargetT, ValueT, ErrorT, Atomic>>(
        target, std::forward<OnNextFV>(on_next), std::forward<OnErrorFV>(on_error), std::forward<OnCompletedFV>(on_completed)
    );
}

template <
    typename ValueT,
    typename ErrorT = std::exception_ptr,
    template <typename> typename Atomic = detail::atomic,
    typename TargetT,
    OnNextFor<TargetT, ValueT> OnNextFV,
    OnErrorFor<TargetT, ErrorT> OnErrorFV>
std::shared_ptr<weak_observer<TargetT, ValueT, ErrorT, Atomic>>
    make_weak_observer(const std::shared_ptr<TargetT>& target, OnNextFV&& on_next, OnErrorFV&& on_error) {
    return make_weak_observer<ValueT, ErrorT, Atomic>(
        target, std::forward<OnNextFV>(on_next), std::forward<OnErrorFV>(on_error), nop_on_completed{}
    );
}

template <
    typename ValueT,
    typename ErrorT = std::exception_ptr,
    template <typename> typename Atomic = detail::atomic,
    typename TargetT,
    OnNextFor<TargetT, ValueT> OnNextFV,
    OnCompletedFor<TargetT> OnCompletedFV>
std::shared_ptr<weak_observer<TargetT, ValueT, ErrorT, Atomic>>
    make_weak_observer(const std::shared_ptr<TargetT>& target, OnNextFV&& on_next, OnCompletedFV&& on_completed) {
    return make_weak_observer<ValueT, ErrorT, Atomic>(
        target, std::forward<OnNextFV>(on_next), rethrow_on_error{}, std::forward<OnCompletedFV>(on_completed)
    );
}

template <
    typename ValueT,
    typename ErrorT = std::exception_ptr,
    template <typename> typename Atomic = detail::atomic,
    typename TargetT,
    OnNextFor<TargetT, ValueT> OnNextFV>
std::shared_ptr<weak_observer<TargetT, ValueT, ErrorT, Atomic>>
    make_weak_observer(const std::shared_ptr<TargetT>& target, OnNextFV&& on_next) {
    return make_weak_observer<ValueT, ErrorT, Atomic>(
        target, std::forward<OnNextFV>(on_next), rethrow_on_error{}, nop_on_completed{}
    );
}

template <typename TargetT, typename ValueT, typename ErrorT, typename... CallbackFVs>
concept WeakCallbacksFor = requires(const std::shared_ptr<TargetT>& target, CallbackFVs&&... callbacks) {
    make_weak_observer<ValueT, ErrorT>(target, std::forward<CallbackFVs>(callbacks)...);
};

} // namespace sl::rx
