//
// Created by usatiynyan.
// Hot source: every notification goes to the observers subscribed at that moment.
// Notifications after the first error/complete are dropped.
// Every observer of a notification gets it even if an earlier one throws.
// The caller of next/error/complete is responsible for not overlapping them.
//

#pragma once

#include "sl/rx/log/log.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observable.hpp"
#include "sl/rx/model/observer.hpp"
#include "sl/rx/thread/detail/sync.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/monad/result.hpp>
#include <sl/meta/traits/unique.hpp>
#include <sl/meta/type/unit.hpp>

#include <libassert/assert.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <tuple>
#include <utility>
#include <vector>

namespace sl::rx {

template <typename ValueT, typename ErrorT = std::exception_ptr>
class subject final
    : public observable<ValueT, ErrorT>
    , meta::immovable {
    using terminal_type = meta::result<meta::unit, ErrorT>;

    struct entry {
        std::uint64_t id;
        observer_ptr<ValueT, ErrorT> an_observer;
    };

    struct state {
        observer_ptr<ValueT, ErrorT> extract(std::uint64_t id) {
            std::lock_guard lock{ m };
            const auto it = std::ranges::find(entries, id, &entry::id);
            if (it == entries.end()) {
                return nullptr;
            }
            observer_ptr<ValueT, ErrorT> extracted = std::move(it->an_observer);
            entries.erase(it);
            return extracted;
        }

        detail::mutex m;
        std::vector<entry> entries;
        std::uint64_t next_id = 0;
        meta::maybe<terminal_type> maybe_terminal;
    };

public:
    using observable<ValueT, ErrorT>::subscribe;

    subject() : state_{ std::make_shared<state>() } {}

    // Subscribing after termination replays the terminal notification inline and returns an empty disposable.
    [[nodiscard]] disposable_ptr subscribe(observer_ptr<ValueT, ErrorT> an_observer) & override {
        ASSERT(an_observer != nullptr);

        std::unique_lock lock{ state_->m };
        if (state_->maybe_terminal.has_value()) {
            terminal_type terminal = state_->maybe_terminal.value();
            lock.unlock();
            notify_terminal(*an_observer, std::move(terminal));
            return empty_disposable();
        }

        const std::uint64_t id = state_->next_id++;
        state_->entries.push_back(entry{ .id = id, .an_observer = std::move(an_observer) });
        lock.unlock();

        return make_disposable([weak_state = std::weak_ptr<state>{ state_ }, id] {
            if (const std::shared_ptr<state> a_state = weak_state.lock()) {
                // destroyed outside of the lock, observer destruction may re-enter the subject
                std::ignore = a_state->extract(id);
            }
        });
    }

    void next(const ValueT& value) {
        deliver_each(snapshot(), [&value](observer<ValueT, ErrorT>& an_observer) {
            ValueT copy = value;
            an_observer.on_next(std::move(copy));
        });
    }

    void error(ErrorT error) {
        deliver_each(terminate(terminal_type{ meta::err(error) }), [&error](observer<ValueT, ErrorT>& an_observer) {
            ErrorT copy = error;
            an_observer.on_error(std::move(copy));
        });
    }

    void complete() {
        deliver_each(terminate(terminal_type{}), [](observer<ValueT, ErrorT>& an_observer) {
            an_observer.on_completed();
        });
    }

    [[nodiscard]] std::size_t observer_count() const {
        std::lock_guard lock{ state_->m };
        return state_->entries.size();
    }

    [[nodiscard]] bool is_terminated() const {
        std::lock_guard lock{ state_->m };
        return state_->maybe_terminal.has_value();
    }

private:
    std::vector<observer_ptr<ValueT, ErrorT>> snapshot() const {
        std::lock_guard lock{ state_->m };
        std::vector<observer_ptr<ValueT, ErrorT>> observers;
        observers.reserve(state_->entries.size());
        for (const entry& an_entry : state_->entries) {
            observers.push_back(an_entry.an_observer);
        }
        return observers;
    }

    std::vector<observer_ptr<ValueT, ErrorT>> terminate(terminal_type terminal) {
        std::vector<entry> entries;
        {
            std::lock_guard lock{ state_->m };
            if (state_->maybe_terminal.has_value()) {
                return {};
            }
            state_->maybe_terminal.emplace(std::move(terminal));
            entries = std::exchange(state_->entries, {});
        }

        std::vector<observer_ptr<ValueT, ErrorT>> observers;
        observers.reserve(entries.size());
        for (entry& an_entry : entries) {
            observers.push_back(std::move(an_entry.an_observer));
        }
        return observers;
    }

    template <typename F>
    static void deliver_each(const std::vector<observer_ptr<ValueT, ErrorT>>& observers, F&& deliver) {
        std::exception_ptr first_failure;
        for (const observer_ptr<ValueT, ErrorT>& an_observer : observers) {
            try {
                deliver(*an_observer);
            } catch (...) {
                if (first_failure == nullptr) {
                    first_failure = std::current_exception();
                } else {
                    log::logger()->warn("subject: observer failed after an earlier failure, exception dropped");
                }
            }
        }
        if (first_failure != nullptr) {
            std::rethrow_exception(first_failure);
        }
    }

    static void notify_terminal(observer<ValueT, ErrorT>& an_observer, terminal_type terminal) {
        if (terminal.has_value()) {
            an_observer.on_completed();
        } else {
            an_observer.on_error(std::move(terminal).error());
        }
    }

private:
    std::shared_ptr<state> state_;
};

} // namespace sl::rx
