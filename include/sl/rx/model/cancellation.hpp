//
// Created by usatiynyan.
//

#pragma once

#include <function2/function2.hpp>

#include <memory>

namespace sl::rx {

using cancellation_callback = fu2::unique_function<void()>;

struct cancellation_registration {
    virtual ~cancellation_registration() = default;

    // Idempotent, must never throw. Waits for a callback that is running on another thread.
    virtual void release() & noexcept = 0;
};

struct cancellation_signal {
    virtual ~cancellation_signal() = default;

    [[nodiscard]] virtual bool can_be_triggered() const noexcept = 0;
    [[nodiscard]] virtual bool is_triggered() const noexcept = 0;

    // callback runs inline if the signal is already triggered
    [[nodiscard]] virtual std::unique_ptr<cancellation_registration> attach(cancellation_callback callback) & = 0;
};

} // namespace sl::rx
