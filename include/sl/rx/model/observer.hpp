//
// Created by usatiynyan.
//

#pragma once

#include <memory>

namespace sl::rx {

template <typename ValueT, typename ErrorT>
struct observer {
    virtual ~observer() = default;

    virtual void on_next(ValueT&&) & = 0;
    virtual void on_error(ErrorT&&) & = 0;
    virtual void on_completed() & = 0;
};

template <typename ValueT, typename ErrorT>
using observer_ptr = std::shared_ptr<observer<ValueT, ErrorT>>;

} // namespace sl::rx
