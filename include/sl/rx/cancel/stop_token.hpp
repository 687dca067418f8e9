//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/model/cancellation.hpp"

#include <memory>
#include <stop_token>

namespace sl::rx {

// A default-constructed std::stop_token can never be triggered.
class stop_token_signal final : public cancellation_signal {
public:
    explicit stop_token_signal(std::stop_token token);

    [[nodiscard]] bool can_be_triggered() const noexcept override;
    [[nodiscard]] bool is_triggered() const noexcept override;

    [[nodiscard]] std::unique_ptr<cancellation_registration> attach(cancellation_callback callback) & override;

private:
    std::stop_token token_;
};

} // namespace sl::rx
