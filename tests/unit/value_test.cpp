#include <statblock/model/statblock_item.h>
#include <statblock/model/trait.h>
#include <statblock/model/value.h>
#include <gtest/gtest.h>

using namespace statblock::model;

TEST(ValueTest, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_TRUE(v.empty());
    EXPECT_EQ(v.to_display_string(), "");
}

TEST(ValueTest, MapKeepsInsertionOrderAndReplaces) {
    Value v = Value::map();
    v.set("b", 1);
    v.set("a", 2);
    v.set("b", 3);

    ASSERT_EQ(v.as_map().size(), 2u);
    EXPECT_EQ(v.as_map()[0].first, "b");
    EXPECT_EQ(v.find("b")->as_number(), 3);
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(ValueTest, MismatchedAccessorsAreNeutral) {
    Value n(4.5);
    EXPECT_EQ(n.as_string(), "");
    EXPECT_TRUE(n.as_list().empty());
    EXPECT_FALSE(n.as_bool());
    EXPECT_EQ(n.find("x"), nullptr);
}

TEST(ValueTest, DisplayStrings) {
    EXPECT_EQ(Value(3).to_display_string(), "3");
    EXPECT_EQ(Value(2.5).to_display_string(), "2.5");
    EXPECT_EQ(Value(-1).to_display_string(), "-1");
    EXPECT_EQ(Value(true).to_display_string(), "true");
    EXPECT_EQ(Value(Value::List{"fireball", "", "shield"}).to_display_string(), "fireball, shield");
}

TEST(ValueTest, Equality) {
    EXPECT_EQ(Value(Value::List{1, "a"}), Value(Value::List{1, "a"}));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_NE(Value(), Value(false));
}

TEST(DataRecordTest, TypedAccessors) {
    DataRecord record;
    record.set("name", "Goblin");
    record.set("columns", 2);

    EXPECT_EQ(record.name(), "Goblin");
    EXPECT_EQ(record.number("columns").value_or(0), 2);
    EXPECT_FALSE(record.number("name").has_value());
    EXPECT_FALSE(record.string("columns").has_value());
    EXPECT_TRUE(record.has("name"));
    EXPECT_FALSE(record.has("ac"));
    EXPECT_TRUE(record.as_value().is_map());
}

TEST(DataRecordTest, NameDefaultsToEmpty) {
    DataRecord record;
    EXPECT_EQ(record.name(), "");
}

TEST(StatblockItemTest, TypeNamesRoundTrip) {
    EXPECT_STREQ(item_type_name(ItemType::IfElse), "ifelse");
    EXPECT_EQ(item_type_from_string("traits"), ItemType::Traits);
    EXPECT_EQ(item_type_from_string("Spells"), ItemType::Spells);
    EXPECT_FALSE(item_type_from_string("chart").has_value());
}

TEST(StatblockItemTest, CompositeTypes) {
    EXPECT_TRUE(is_composite(ItemType::Group));
    EXPECT_TRUE(is_composite(ItemType::IfElse));
    EXPECT_FALSE(is_composite(ItemType::Traits));
}

TEST(StatblockItemTest, FirstPropertyAndOptions) {
    StatblockItem item;
    EXPECT_EQ(item.first_property(), "");
    item.properties = {"actions", "reactions"};
    item.options = {{"display", "Actions"}};
    EXPECT_EQ(item.first_property(), "actions");
    ASSERT_NE(item.option("display"), nullptr);
    EXPECT_EQ(*item.option("display"), "Actions");
    EXPECT_EQ(item.option("callback"), nullptr);
}

TEST(StatblockItemTest, Slugify) {
    EXPECT_EQ(slugify("Basic 5e Layout"), "basic-5e-layout");
    EXPECT_EQ(slugify("  Pathfinder 2e -- Creature "), "pathfinder-2e-creature");
    EXPECT_EQ(slugify(""), "");
}

TEST(TraitTest, ParsesNameAndDescription) {
    Value field = Value::list({
        Value::map({{"name", "Keen Smell"}, {"desc", "Advantage on smell checks."}}),
        Value::map({{"name", "Pack Tactics"}, {"desc", 3}}),
    });
    auto result = parse_traits(field);
    ASSERT_TRUE(result.ok) << result.message;
    ASSERT_EQ(result.traits.size(), 2u);
    EXPECT_EQ(result.traits[0].name, "Keen Smell");
    EXPECT_EQ(result.traits[1].desc, "3");
}

TEST(TraitTest, MissingFieldsBecomeEmpty) {
    auto result = parse_traits(Value::list({Value::map({{"name", "Only Name"}})}));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.traits[0].desc, "");
}

TEST(TraitTest, RejectsNonList) {
    auto result = parse_traits(Value("Multiattack"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("string"), std::string::npos);
}

TEST(TraitTest, RejectsNonMapEntry) {
    auto result = parse_traits(Value::list({Value::map({{"name", "a"}}), Value("b")}));
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.traits.empty());
}

TEST(TraitTest, RejectsNestedDescription) {
    auto result = parse_traits(Value::list({Value::map({{"name", "a"}, {"desc", Value::list()}})}));
    EXPECT_FALSE(result.ok);
}
