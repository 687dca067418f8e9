//
// Created by usatiynyan.
//

#include "test_support.hpp"

#include "sl/rx/source/subject.hpp"
#include "sl/rx/subscribe/weak.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace sl::rx {

TEST(subject, deliversToAllObservers) {
    subject<int> a_subject;
    std::vector<int> first;
    std::vector<int> second;
    const disposable_ptr a = a_subject.subscribe(
        [&first](int&& x) { first.push_back(x); }, [](std::exception_ptr&&) {}, [] {}
    );
    const disposable_ptr b = a_subject.subscribe(
        [&second](int&& x) { second.push_back(x); }, [](std::exception_ptr&&) {}, [] {}
    );
    ASSERT_EQ(a_subject.observer_count(), 2);

    a_subject.next(1);
    a_subject.next(2);

    ASSERT_EQ(first, (std::vector<int>{ 1, 2 }));
    ASSERT_EQ(second, (std::vector<int>{ 1, 2 }));
}

TEST(subject, disposeRemovesObserver) {
    subject<int> a_subject;
    std::vector<int> values;
    const disposable_ptr handle = a_subject.subscribe(
        [&values](int&& x) { values.push_back(x); }, [](std::exception_ptr&&) {}, [] {}
    );

    a_subject.next(1);
    handle->dispose();
    handle->dispose();
    a_subject.next(2);

    ASSERT_EQ(values, (std::vector<int>{ 1 }));
    ASSERT_EQ(a_subject.observer_count(), 0);
}

TEST(subject, completeClearsObservers) {
    subject<int> a_subject;
    int completed = 0;
    const disposable_ptr handle = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [&completed] {
        ++completed;
    });

    a_subject.complete();
    a_subject.complete();
    a_subject.error(test::make_error("late"));
    a_subject.next(1);

    ASSERT_EQ(completed, 1);
    ASSERT_TRUE(a_subject.is_terminated());
    ASSERT_EQ(a_subject.observer_count(), 0);
    handle->dispose();
}

TEST(subject, errorDeliversToEveryObserver) {
    subject<int, std::string> a_subject;
    std::vector<std::string> errors;
    const auto on_error = [&errors](std::string&& error) { errors.push_back(std::move(error)); };
    const disposable_ptr a = a_subject.subscribe([](int&&) {}, on_error, [] {});
    const disposable_ptr b = a_subject.subscribe([](int&&) {}, on_error, [] {});

    a_subject.error("boom");

    ASSERT_EQ(errors, (std::vector<std::string>{ "boom", "boom" }));
}

TEST(subject, subscribeAfterCompleteReplaysCompletion) {
    subject<int> a_subject;
    a_subject.complete();

    int completed = 0;
    const disposable_ptr handle = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [&completed] {
        ++completed;
    });

    ASSERT_EQ(completed, 1);
    ASSERT_EQ(handle, empty_disposable());
    ASSERT_EQ(a_subject.observer_count(), 0);
}

TEST(subject, subscribeAfterErrorReplaysError) {
    subject<int, std::string> a_subject;
    a_subject.error("boom");

    std::vector<std::string> errors;
    const disposable_ptr handle = a_subject.subscribe(
        [](int&&) {}, [&errors](std::string&& error) { errors.push_back(std::move(error)); }, [] {}
    );

    ASSERT_EQ(errors, (std::vector<std::string>{ "boom" }));
    ASSERT_EQ(handle, empty_disposable());
}

TEST(subject, disposeOutlivesSubject) {
    disposable_ptr handle;
    {
        subject<int> a_subject;
        handle = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [] {});
    }
    handle->dispose();
}

TEST(subject, unsubscribeFromCallback) {
    subject<int> a_subject;
    std::vector<int> values;
    disposable_ptr handle;
    handle = a_subject.subscribe(
        [&values, &handle](int&& x) {
            values.push_back(x);
            handle->dispose();
        },
        [](std::exception_ptr&&) {},
        [] {}
    );

    a_subject.next(1);
    a_subject.next(2);

    ASSERT_EQ(values, (std::vector<int>{ 1 }));
}

TEST(subject, errorReachesObserversAfterThrowingOne) {
    subject<int> a_subject;
    auto first = std::make_shared<test::recorder>();
    auto second = std::make_shared<test::recorder>();
    const disposable_ptr a = weak_subscribe(a_subject, first, [](test::recorder&, int&&) {});
    const disposable_ptr b = weak_subscribe(
        a_subject,
        second,
        [](test::recorder&, int&&) {},
        [](test::recorder& self, std::exception_ptr&& error) { self.errors.push_back(test::what(error)); }
    );

    EXPECT_THROW(a_subject.error(test::make_error("boom")), std::runtime_error);

    ASSERT_EQ(second->errors, (std::vector<std::string>{ "boom" }));
    ASSERT_TRUE(a_subject.is_terminated());
    ASSERT_EQ(a_subject.observer_count(), 0);
}

TEST(subject, completionReachesObserversAfterThrowingOne) {
    subject<int> a_subject;
    int completed = 0;
    const disposable_ptr a = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [] {
        throw std::logic_error{ "first" };
    });
    const disposable_ptr b = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [] {
        throw std::logic_error{ "second" };
    });
    const disposable_ptr c = a_subject.subscribe([](int&&) {}, [](std::exception_ptr&&) {}, [&completed] {
        ++completed;
    });

    try {
        a_subject.complete();
        FAIL();
    } catch (const std::logic_error& e) {
        ASSERT_EQ(std::string{ e.what() }, "first");
    }
    ASSERT_EQ(completed, 1);
}

TEST(subject, valueReachesObserversAfterThrowingOne) {
    subject<int> a_subject;
    std::vector<int> values;
    const disposable_ptr a = a_subject.subscribe(
        [](int&&) { throw std::runtime_error{ "next" }; }, [](std::exception_ptr&&) {}, [] {}
    );
    const disposable_ptr b = a_subject.subscribe(
        [&values](int&& x) { values.push_back(x); }, [](std::exception_ptr&&) {}, [] {}
    );

    EXPECT_THROW(a_subject.next(1), std::runtime_error);
    EXPECT_THROW(a_subject.next(2), std::runtime_error);

    ASSERT_EQ(values, (std::vector<int>{ 1, 2 }));
    ASSERT_EQ(a_subject.observer_count(), 2);
}

} // namespace sl::rx
