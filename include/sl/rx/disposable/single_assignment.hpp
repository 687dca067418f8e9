//
// Created by usatiynyan.
// Holds at most one upstream resource. The resource may show up only after the owner already terminated
// (e.g. the source errors synchronously inside subscribe), in which case it is released on arrival.
//

#pragma once

#include "sl/rx/log/log.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/thread/detail/sync.hpp"

#include <sl/meta/lifetime/defer.hpp>
#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>

#include <bit>
#include <cstdint>
#include <limits>

namespace sl::rx {

template <template <typename> typename Atomic = detail::atomic>
struct single_assignment_disposable final
    : disposable
    , meta::immovable {
    enum slot_state : std::uintptr_t {
        slot_state_empty = std::numeric_limits<std::uintptr_t>::min(),
        slot_state_disposed = std::numeric_limits<std::uintptr_t>::max(),
    };

private:
    struct resource_box {
        disposable_ptr resource;
    };

public:
    single_assignment_disposable() = default;

    // dropping the slot is not disposal, the resource is only unreferenced
    ~single_assignment_disposable() noexcept override {
        const std::uintptr_t state = state_.load(std::memory_order::acquire);
        if (state != slot_state_empty && state != slot_state_disposed) {
            delete std::bit_cast<resource_box*>(state);
        }
    }

    void assign(disposable_ptr resource) & {
        ASSERT(resource != nullptr);

        if (state_.load(std::memory_order::acquire) == slot_state_disposed) {
            release_late(*resource);
            return;
        }

        auto* box = new resource_box{ std::move(resource) };
        std::uintptr_t expected = slot_state_empty;
        if (state_.compare_exchange_strong(
                expected, std::bit_cast<std::uintptr_t>(box), std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            return;
        }

        meta::defer cleanup{ [box] { delete box; } };

        if (expected != slot_state_disposed) {
            PANIC("single_assignment_disposable is assigned twice");
        }
        release_late(*box->resource);
    }

    void dispose() & noexcept override {
        const std::uintptr_t state = state_.exchange(slot_state_disposed, std::memory_order::acq_rel);
        if (state == slot_state_empty || state == slot_state_disposed) {
            return;
        }

        auto* box = std::bit_cast<resource_box*>(state);
        meta::defer cleanup{ [box] { delete box; } };

        box->resource->dispose();
    }

    [[nodiscard]] bool is_disposed() const { return state_.load(std::memory_order::acquire) == slot_state_disposed; }

private:
    static void release_late(disposable& resource) {
        log::logger()->debug("resource assigned after disposal, releasing immediately");
        resource.dispose();
    }

private:
    alignas(detail::cache_line_size) Atomic<std::uintptr_t> state_{ slot_state_empty };
};

} // namespace sl::rx
