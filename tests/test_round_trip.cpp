// ═══════════════════════════════════════════════════════════════════
//  test_round_trip.cpp — Coerced values re-resolve to the same member
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <unionpp/unionpp.h>

using namespace unionpp;

namespace {

class RoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        SchemaBuilder builder;
        builder.enumType("PetKind", {"CAT", "DOG"});

        builder.inputObject("CatInput")
            .field("name", "String!")
            .field("age", "Int")
            .field("livesLeft", "Int!");
        builder.inputObject("DogInput")
            .field("name", "String!")
            .field("age", "Int")
            .field("breed", "String!");
        builder.inputObject("TaggedCat")
            .field("kind", "PetKind!").literal("CAT")
            .field("name", "String!");
        builder.inputObject("TaggedDog")
            .field("kind", "PetKind!").literal("DOG")
            .field("name", "String!");

        builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
            .members({"CatInput", "DogInput"});
        builder.inputUnion("DefaultedAnimal", StrategyKind::Discriminator)
            .members({"CatInput", "DogInput"})
            .field("type")
            .defaultMember("CatInput");
        builder.inputUnion("TaggedPet", StrategyKind::LiteralTag)
            .field("kind")
            .members({"TaggedCat", "TaggedDog"});
        builder.inputUnion("FirstFit", StrategyKind::Ordered)
            .members({"CatInput", "DogInput"});
        builder.inputUnion("CountOrCat", StrategyKind::Ordered)
            .members({"CatInput", "Int"});
        builder.inputUnion("ShapedPet", StrategyKind::Structural)
            .members({"CatInput", "DogInput"});

        builder.inputObject("PetChoice")
            .field("cat", "CatInput")
            .field("dog", "DogInput");
        builder.inputUnion("PetWrapper", StrategyKind::OneOf).wrapper("PetChoice");

        builder.inputObject("SnakeInput")
            .field("__typename", "String")
            .field("length", "Int");
        builder.inputObject("LizardInput").field("legs", "Int!");
        builder.inputUnion("ReptileInput", StrategyKind::Discriminator)
            .members({"SnakeInput", "LizardInput"})
            .defaultMember("SnakeInput");

        builder.inputObject("BirdInput").field("wingspan", "Float!");
        builder.inputObject("Sighting")
            .field("animal", "AnimalInput")
            .field("bird", "BirdInput");
        builder.inputUnion("SightingInput", StrategyKind::OneOf).wrapper("Sighting");

        EngineOptions opts;
        opts.logLevel = console::Level::Silent;
        schema = builder.build(opts);
    }

    // Coerce, convert back, coerce again: both passes must agree.
    void expectRoundTrip(const std::string& unionName, const char* text, const std::string& member) {
        Coercer coercer(*schema);
        auto* unionType = schema->inputUnion(unionName);

        auto first = coercer.coerceUnion(parseValue(text), *unionType);
        ASSERT_TRUE(first.ok()) << unionName << " " << text << " " << toJson(first.errors).dump();
        EXPECT_EQ(first.value->typeName, member);

        auto raw = coercer.toValueNode(*first.value);
        auto second = coercer.coerceUnion(raw, *unionType);
        ASSERT_TRUE(second.ok()) << unionName << " " << raw.dump() << " "
                                 << toJson(second.errors).dump();
        EXPECT_EQ(second.value->typeName, first.value->typeName) << raw.dump();
        EXPECT_EQ(second.value->unions, first.value->unions) << raw.dump();
        EXPECT_EQ(second.value->toJson(), first.value->toJson()) << raw.dump();
    }

    std::shared_ptr<const Schema> schema;
};

} // namespace

TEST_F(RoundTripTest, Discriminator) {
    expectRoundTrip("AnimalInput", R"({"__typename":"CatInput","name":"Buster","livesLeft":7})", "CatInput");
    expectRoundTrip("AnimalInput", R"({"name":"Rex","__typename":"DogInput","breed":"POODLE"})", "DogInput");
}

TEST_F(RoundTripTest, DiscriminatorKeyLeadsTheObject) {
    Coercer coercer(*schema);
    auto first = coercer.coerceUnion(parseValue(R"({"name":"Rex","breed":"POODLE","__typename":"DogInput"})"),
                                     *schema->inputUnion("AnimalInput"));
    ASSERT_TRUE(first.ok());
    auto raw = coercer.toValueNode(*first.value);
    EXPECT_EQ(raw.begin().key(), "__typename");
    EXPECT_EQ(raw["__typename"], "DogInput");
}

TEST_F(RoundTripTest, DefaultMemberGainsExplicitTag) {
    expectRoundTrip("DefaultedAnimal", R"({"name":"Tom","livesLeft":3})", "CatInput");

    Coercer coercer(*schema);
    auto first = coercer.coerceUnion(parseValue(R"({"name":"Tom","livesLeft":3})"),
                                     *schema->inputUnion("DefaultedAnimal"));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(coercer.toValueNode(*first.value)["type"], "CatInput");
}

TEST_F(RoundTripTest, ReservedFieldDeclaredByMember) {
    expectRoundTrip("ReptileInput", R"({"__typename":"LizardInput","legs":4})", "LizardInput");
    expectRoundTrip("ReptileInput", R"({"__typename":"SnakeInput","length":3})", "SnakeInput");
    expectRoundTrip("ReptileInput", R"({"__typename":"python","length":3})", "SnakeInput");
    expectRoundTrip("ReptileInput", R"({"length":3})", "SnakeInput");

    Coercer coercer(*schema);
    auto first = coercer.coerceUnion(parseValue(R"({"__typename":"python","length":3})"),
                                     *schema->inputUnion("ReptileInput"));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(coercer.toValueNode(*first.value)["__typename"], "python");
}

TEST_F(RoundTripTest, LiteralTag) {
    expectRoundTrip("TaggedPet", R"({"kind":"CAT","name":"Tom"})", "TaggedCat");
    expectRoundTrip("TaggedPet", R"({"name":"Rex","kind":"DOG"})", "TaggedDog");
}

TEST_F(RoundTripTest, Ordered) {
    expectRoundTrip("FirstFit", R"({"name":"Tom","livesLeft":9})", "CatInput");
    expectRoundTrip("FirstFit", R"({"breed":"WHIPPET","name":"Rex","age":2})", "DogInput");
    expectRoundTrip("CountOrCat", "12", "Int");
}

TEST_F(RoundTripTest, Structural) {
    expectRoundTrip("ShapedPet", R"({"name":"Buster","breed":"WHIPPET"})", "DogInput");
    expectRoundTrip("ShapedPet", R"({"livesLeft":1,"name":"Tom"})", "CatInput");
}

TEST_F(RoundTripTest, OneOf) {
    expectRoundTrip("PetWrapper", R"({"dog":{"name":"Rex","breed":"POODLE"}})", "DogInput");
    expectRoundTrip("PetWrapper", R"({"cat":{"name":"Tom","livesLeft":9},"dog":null})", "CatInput");
}

TEST_F(RoundTripTest, OneOfAroundDiscriminator) {
    expectRoundTrip("SightingInput",
                    R"({"animal":{"__typename":"DogInput","name":"Rex","breed":"POODLE"}})",
                    "DogInput");
    expectRoundTrip("SightingInput", R"({"bird":{"wingspan":1.5}})", "BirdInput");

    Coercer coercer(*schema);
    auto first = coercer.coerceUnion(
        parseValue(R"({"animal":{"__typename":"DogInput","name":"Rex","breed":"POODLE"}})"),
        *schema->inputUnion("SightingInput"));
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first.value->unions.size(), 2);
    EXPECT_EQ(first.value->unions[0], (UnionSelection{"SightingInput", "animal"}));
    EXPECT_EQ(first.value->unions[1], (UnionSelection{"AnimalInput", ""}));

    auto raw = coercer.toValueNode(*first.value);
    EXPECT_EQ(raw["animal"]["__typename"], "DogInput");
}
