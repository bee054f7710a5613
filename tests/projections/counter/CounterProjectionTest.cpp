#include "projections/counter/CounterProjection.hpp"
#include "repositories/InMemoryEventRepository.hpp"
#include "repositories/sqlite/SqliteDatabase.hpp"
#include "repositories/sqlite/SqliteEventRepository.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <limits>
#include <stdexcept>

using namespace esc::domain;
using namespace esc::projections::counter;
using esc::repositories::InMemoryEventRepository;
using esc::services::ScopedView;
using esc::services::StoreDisposed;
using esc::services::StoreState;

class CounterProjectionTest : public ::testing::Test {
protected:
    int64_t now_ms = 100;
    ClockGenerator clock{[this]() { return now_ms; }};

    std::unique_ptr<CounterProjection> make_view() {
        return std::make_unique<CounterProjection>(
            std::make_unique<InMemoryEventRepository>(), clock, "A");
    }

    static Event increment_event(int64_t time, int64_t amount = 1) {
        return Event(Hlc(time, 0, "A"), "Increment", EventData{{"amount", amount}});
    }
};

// --- event decoding ---

TEST(CounterEvents, DecodesKnownTypes) {
    auto inc = decode(Event(Hlc(1, 0, "A"), "Increment", EventData{{"amount", 3}}));
    ASSERT_TRUE(std::holds_alternative<Increment>(inc));
    EXPECT_EQ(std::get<Increment>(inc).key, "counter");
    EXPECT_EQ(std::get<Increment>(inc).amount, 3);

    auto set = decode(Event(Hlc(1, 0, "A"), "SetValue", EventData{{"key", "x"}, {"value", 9}}));
    ASSERT_TRUE(std::holds_alternative<SetValue>(set));
    EXPECT_EQ(std::get<SetValue>(set).key, "x");

    EXPECT_TRUE(std::holds_alternative<Decrement>(decode(Event(Hlc(1, 0, "A"), "Decrement"))));
    EXPECT_TRUE(std::holds_alternative<Reset>(decode(Event(Hlc(1, 0, "A"), "Reset"))));
}

TEST(CounterEvents, UnknownTypeIsFatal) {
    EXPECT_THROW(decode(Event(Hlc(1, 0, "A"), "Multiply")), UnknownEventType);
}

TEST(CounterEvents, RejectsNonIntegerAmount) {
    EXPECT_THROW(decode(Event(Hlc(1, 0, "A"), "Increment", EventData{{"amount", "one"}})),
                 std::invalid_argument);
}

TEST(CounterEvents, EncodeDecodeKeepsPayload) {
    auto event = encode(SetValue{"x", 42}, Hlc(5, 0, "A"));
    EXPECT_EQ(event.type(), "SetValue");
    EXPECT_EQ(event.data_to_json(), R"({"key":"x","value":42})");

    auto decoded = decode(event);
    ASSERT_TRUE(std::holds_alternative<SetValue>(decoded));
    EXPECT_EQ(std::get<SetValue>(decoded).value, 42);
}

// --- projection ---

TEST_F(CounterProjectionTest, IncrementScenario) {
    auto view = make_view();
    view->event_store().add(increment_event(100));
    EXPECT_EQ(view->value(), 1);
}

TEST_F(CounterProjectionTest, AppliesAllVariants) {
    auto view = make_view();
    view->increment("a", 5);
    view->decrement("a", 2);
    view->set_value("b", 10);
    view->increment("b");
    view->reset("a");

    EXPECT_EQ(view->value("a"), 0);
    EXPECT_EQ(view->value("b"), 11);
    EXPECT_EQ(view->value("missing"), 0);
    EXPECT_EQ(view->event_store().get_all().size(), 5u);
}

TEST_F(CounterProjectionTest, IncrementPastMaximumThrowsAndKeepsValue) {
    auto view = make_view();
    view->set_value("k", std::numeric_limits<int64_t>::max());

    EXPECT_THROW(view->increment("k"), std::overflow_error);
    EXPECT_EQ(view->value("k"), std::numeric_limits<int64_t>::max());

    EXPECT_THROW(view->decrement("k", -1), std::overflow_error);
    EXPECT_EQ(view->value("k"), std::numeric_limits<int64_t>::max());
}

TEST_F(CounterProjectionTest, DecrementPastMinimumThrowsAndKeepsValue) {
    auto view = make_view();
    view->set_value("k", 0);
    EXPECT_THROW(view->decrement("k", std::numeric_limits<int64_t>::min()), std::overflow_error);
    EXPECT_EQ(view->value("k"), 0);

    view->set_value("k", std::numeric_limits<int64_t>::min());
    EXPECT_THROW(view->increment("k", std::numeric_limits<int64_t>::min()), std::overflow_error);
    EXPECT_EQ(view->value("k"), std::numeric_limits<int64_t>::min());

    view->increment("k", std::numeric_limits<int64_t>::max());
    EXPECT_EQ(view->value("k"), -1);
}

TEST_F(CounterProjectionTest, ProducerStampsMonotonicIds) {
    auto view = make_view();
    auto first = view->increment();
    auto second = view->increment();
    EXPECT_EQ(first.id(), Hlc(100, 0, "A"));
    EXPECT_EQ(second.id(), Hlc(100, 1, "A"));
}

TEST_F(CounterProjectionTest, UnknownEventTypePropagatesToCaller) {
    auto view = make_view();
    EXPECT_THROW(view->event_store().add(Event(Hlc(1, 0, "A"), "Multiply")), UnknownEventType);
}

TEST_F(CounterProjectionTest, RestoreToEventReflectsOnlyPrefix) {
    auto view = make_view();
    auto e1 = view->increment();
    auto e2 = view->increment();
    auto e3 = view->increment();
    EXPECT_EQ(view->value(), 3);

    EXPECT_TRUE(view->restore_to_event(e2));
    EXPECT_EQ(view->value(), 2);
    EXPECT_EQ(view->event_store().get_all(), (std::vector<Event>{e1, e2}));
    (void)e3;
}

TEST_F(CounterProjectionTest, RestoreToUnknownEventRebuildsSameState) {
    auto view = make_view();
    view->increment();
    view->increment();
    view->increment();

    EXPECT_FALSE(view->restore_to_event(increment_event(999)));
    EXPECT_EQ(view->value(), 3);
    EXPECT_EQ(view->event_store().get_all().size(), 3u);
}

TEST_F(CounterProjectionTest, RebuildRecomputesFromLog) {
    auto view = make_view();
    view->increment("a", 2);
    view->increment("a", 3);

    view->on_reset();
    EXPECT_TRUE(view->state().empty());

    view->rebuild();
    EXPECT_EQ(view->value("a"), 5);
    EXPECT_EQ(view->event_store().get_all().size(), 2u);
}

TEST_F(CounterProjectionTest, MergeEventsAppliesUnionOnce) {
    auto view = make_view();
    view->event_store().add(increment_event(1));

    std::vector<Event> remote = {increment_event(1), increment_event(2, 10)};
    EXPECT_EQ(view->merge_events(remote), 1u);
    EXPECT_EQ(view->value(), 11);

    EXPECT_EQ(view->merge_events(remote), 0u);
    EXPECT_EQ(view->value(), 11);
}

TEST_F(CounterProjectionTest, DisposeReleasesStore) {
    auto view = make_view();
    view->dispose();
    view->dispose();
    EXPECT_EQ(view->event_store().state(), StoreState::DISPOSED);
    EXPECT_THROW(view->increment(), StoreDisposed);
}

TEST_F(CounterProjectionTest, ScopedViewDisposesOnThrow) {
    auto view = make_view();
    try {
        ScopedView scope(*view);
        scope->increment();
        throw std::runtime_error("caller failure");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(view->event_store().state(), StoreState::DISPOSED);
}

TEST_F(CounterProjectionTest, SqliteBackedProjectionSurvivesReopen) {
    using namespace esc::repositories::sqlite;
    auto path = std::filesystem::temp_directory_path() / "esc_counter_projection.db";
    std::filesystem::remove(path);
    {
        CounterProjection view(
            std::make_unique<SqliteEventRepository>(SqliteDatabase::open(path.string())),
            clock, "A");
        view.increment("a", 4);
        view.increment("a", 1);
    }

    CounterProjection reopened(
        std::make_unique<SqliteEventRepository>(SqliteDatabase::open(path.string())),
        clock, "A");
    reopened.rebuild();
    EXPECT_EQ(reopened.value("a"), 5);
    reopened.dispose();
    std::filesystem::remove(path);
}
