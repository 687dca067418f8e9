//
// Created by usatiynyan.
//

#include "sl/rx/cancel/stop_token.hpp"
#include "sl/rx/thread/detail/sync.hpp"

#include <libassert/assert.hpp>
#include <tl/optional.hpp>

#include <utility>

namespace sl::rx {
namespace {

class stop_callback_registration final : public cancellation_registration {
public:
    stop_callback_registration(const std::stop_token& token, cancellation_callback callback)
        : stop_callback_{ tl::in_place, token, std::move(callback) } {}

    void release() & noexcept override {
        if (!released_.exchange(true, std::memory_order::acq_rel)) {
            // blocks while the callback is running on another thread
            stop_callback_.reset();
        }
    }

private:
    tl::optional<std::stop_callback<cancellation_callback>> stop_callback_;
    detail::atomic<bool> released_{ false };
};

} // namespace

stop_token_signal::stop_token_signal(std::stop_token token) : token_{ std::move(token) } {}

bool stop_token_signal::can_be_triggered() const noexcept { return token_.stop_possible(); }

bool stop_token_signal::is_triggered() const noexcept { return token_.stop_requested(); }

std::unique_ptr<cancellation_registration> stop_token_signal::attach(cancellation_callback callback) & {
    ASSERT(static_cast<bool>(callback));
    return std::make_unique<stop_callback_registration>(token_, std::move(callback));
}

} // namespace sl::rx
