#include "projections/kv/KeyValueProjection.hpp"
#include "repositories/InMemoryEventRepository.hpp"

#include <gtest/gtest.h>

using namespace esc::domain;
using namespace esc::projections::kv;
using esc::repositories::InMemoryEventRepository;

class KeyValueProjectionTest : public ::testing::Test {
protected:
    int64_t now_ms = 500;
    ClockGenerator clock{[this]() { return now_ms; }};
    KeyValueProjection view{std::make_unique<InMemoryEventRepository>(), clock, "kv-node"};
};

TEST_F(KeyValueProjectionTest, SetAndGet) {
    view.set("name", "Ada");
    view.set("tags", EventData::array({"a", "b"}));

    ASSERT_TRUE(view.get("name").has_value());
    EXPECT_EQ(*view.get("name"), "Ada");
    EXPECT_EQ(view.get("tags")->size(), 2u);
    EXPECT_EQ(view.size(), 2u);
}

TEST_F(KeyValueProjectionTest, SetOverwrites) {
    view.set("k", 1);
    view.set("k", 2);
    EXPECT_EQ(*view.get("k"), 2);
    EXPECT_EQ(view.event_store().get_all().size(), 2u);
}

TEST_F(KeyValueProjectionTest, RemoveDeletesKey) {
    view.set("k", 1);
    view.remove("k");
    EXPECT_FALSE(view.get("k").has_value());
    EXPECT_EQ(view.size(), 0u);
}

TEST_F(KeyValueProjectionTest, RemoveMissingKeyIsNoop) {
    EXPECT_NO_THROW(view.remove("absent"));
    EXPECT_EQ(view.size(), 0u);
}

TEST_F(KeyValueProjectionTest, RestoreRewindsToCheckpoint) {
    view.set("k", 1);
    auto checkpoint = view.set("k", 2);
    view.remove("k");

    EXPECT_TRUE(view.restore_to_event(checkpoint));
    EXPECT_EQ(*view.get("k"), 2);
}

TEST_F(KeyValueProjectionTest, EventsCarryProducerNode) {
    auto event = view.set("k", 1);
    EXPECT_EQ(event.node_id(), "kv-node");
    EXPECT_EQ(event.type(), "SetKeyValue");
}

TEST(KeyValueEvents, DecodeRequiresKey) {
    EXPECT_THROW(decode(Event(Hlc(1, 0, "A"), "SetKeyValue")), std::invalid_argument);
    EXPECT_THROW(decode(Event(Hlc(1, 0, "A"), "Unknown")), UnknownEventType);
}

TEST(KeyValueEvents, MissingValueDecodesAsNull) {
    auto decoded = decode(Event(Hlc(1, 0, "A"), "SetKeyValue", EventData{{"key", "k"}}));
    ASSERT_TRUE(std::holds_alternative<SetKeyValue>(decoded));
    EXPECT_TRUE(std::get<SetKeyValue>(decoded).value.is_null());
}
