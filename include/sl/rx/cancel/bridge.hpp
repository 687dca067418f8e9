//
// Created by usatiynyan.
// Ties an external one-shot cancellation signal to observer disposal.
// Natural termination releases the registration before the terminal delivery runs,
// cancellation disposes the observer; both paths are idempotent, so any interleaving is fine.
//

#pragma once

#include "sl/rx/log/log.hpp"
#include "sl/rx/model/cancellation.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observable.hpp"

#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>

#include <concepts>
#include <memory>
#include <utility>

namespace sl::rx {

template <typename ObserverT>
concept TerminableObserver = std::derived_from<ObserverT, disposable>
    && std::derived_from<ObserverT, observer<typename ObserverT::value_type, typename ObserverT::error_type>>
    && requires(
        ObserverT& an_observer,
        typename ObserverT::value_type&& value,
        typename ObserverT::error_type&& error,
        disposable_ptr resource
    ) {
           an_observer.deliver_value(std::move(value));
           an_observer.deliver_error(std::move(error));
           an_observer.deliver_completed();
           an_observer.bind_subscription(std::move(resource));
           { an_observer.is_terminated() } -> std::same_as<bool>;
       };

namespace detail {

template <TerminableObserver ObserverT>
struct cancellation_bridge : meta::immovable {
    using value_type = typename ObserverT::value_type;
    using error_type = typename ObserverT::error_type;

public:
    explicit cancellation_bridge(std::shared_ptr<ObserverT> an_observer) : observer_{ std::move(an_observer) } {}

    void attach(cancellation_signal& signal) & {
        registration_ = signal.attach([an_observer = observer_] {
            // the registration owning this closure may be destroyed during dispose()
            const std::shared_ptr<ObserverT> keep_alive = an_observer;
            log::logger()->debug("cancellation triggered, disposing subscription");
            keep_alive->dispose();
        });
        ASSERT(registration_ != nullptr);
    }

    void on_next(value_type&& value) & {
        observer_->deliver_value(std::move(value));
        if (observer_->is_terminated()) {
            registration_->release();
        }
    }

    void on_error(error_type&& error) & {
        registration_->release();
        observer_->deliver_error(std::move(error));
    }

    void on_completed() & {
        registration_->release();
        observer_->deliver_completed();
    }

private:
    std::shared_ptr<ObserverT> observer_;
    std::unique_ptr<cancellation_registration> registration_;
};

} // namespace detail

// The subscription lives until the source terminates, the target is gone or the signal is triggered.
template <TerminableObserver ObserverT>
void subscribe_cancellable(
    observable<typename ObserverT::value_type, typename ObserverT::error_type>& source,
    std::shared_ptr<ObserverT> an_observer,
    cancellation_signal& signal
) {
    using value_type = typename ObserverT::value_type;
    using error_type = typename ObserverT::error_type;

    ASSERT(an_observer != nullptr);

    if (!signal.can_be_triggered()) {
        an_observer->bind_subscription(source.subscribe(an_observer));
        return;
    }

    if (signal.is_triggered()) {
        log::logger()->debug("cancellation already triggered, subscription skipped");
        return;
    }

    auto bridge = std::make_shared<detail::cancellation_bridge<ObserverT>>(an_observer);
    bridge->attach(signal);

    // triggered in between, the attached callback has already disposed the observer
    if (an_observer->is_terminated()) {
        return;
    }

    an_observer->bind_subscription(source.subscribe(
        [bridge](value_type&& value) { bridge->on_next(std::move(value)); },
        [bridge](error_type&& error) { bridge->on_error(std::move(error)); },
        [bridge] { bridge->on_completed(); }
    ));
}

} // namespace sl::rx
