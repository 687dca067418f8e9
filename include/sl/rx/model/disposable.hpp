//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/thread/detail/sync.hpp"

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace sl::rx {

struct disposable {
    virtual ~disposable() = default;

    // Idempotent, must never throw.
    virtual void dispose() & noexcept = 0;
};

using disposable_ptr = std::shared_ptr<disposable>;

namespace detail {

struct empty_disposable final : disposable {
    void dispose() & noexcept override {}
};

template <typename F, template <typename> typename Atomic>
struct functor_disposable final : disposable {
    explicit functor_disposable(F functor) : functor_{ std::move(functor) } {}

    void dispose() & noexcept override {
        if (!disposed_.exchange(true, std::memory_order::acq_rel)) {
            functor_();
        }
    }

private:
    F functor_;
    Atomic<bool> disposed_{ false };
};

} // namespace detail

inline disposable_ptr empty_disposable() {
    static const disposable_ptr instance = std::make_shared<detail::empty_disposable>();
    return instance;
}

// functor is invoked at most once, on the first dispose()
template <template <typename> typename Atomic = detail::atomic, typename FV>
    requires std::invocable<std::decay_t<FV>&>
disposable_ptr make_disposable(FV&& f) {
    using F = std::decay_t<FV>;
    return std::make_shared<detail::functor_disposable<F, Atomic>>(std::forward<FV>(f));
}

} // namespace sl::rx
