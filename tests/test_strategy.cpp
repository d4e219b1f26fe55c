// ═══════════════════════════════════════════════════════════════════
//  test_strategy.cpp — Tests for strategy validation and plans
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <unionpp/schema.h>
#include <unionpp/strategy.h>
#include <algorithm>

using namespace unionpp;

namespace {

EngineOptions quiet() {
    EngineOptions opts;
    opts.logLevel = console::Level::Silent;
    return opts;
}

std::vector<SchemaError> buildErrors(const SchemaBuilder& builder, EngineOptions opts = quiet()) {
    try {
        builder.build(opts);
    } catch (const SchemaBuildError& e) {
        return e.errors();
    }
    return {};
}

std::vector<SchemaErrorCode> codes(const std::vector<SchemaError>& errors) {
    std::vector<SchemaErrorCode> result;
    for (auto& e : errors) result.push_back(e.code);
    return result;
}

bool hasCode(const std::vector<SchemaError>& errors, SchemaErrorCode code) {
    return std::any_of(errors.begin(), errors.end(),
                       [&](const SchemaError& e) { return e.code == code; });
}

// CatInput{name!, age, livesLeft!}, DogInput{name!, age, breed!}
SchemaBuilder pets() {
    SchemaBuilder builder;
    builder.inputObject("CatInput")
        .field("name", "String!")
        .field("age", "Int")
        .field("livesLeft", "Int!");
    builder.inputObject("DogInput")
        .field("name", "String!")
        .field("age", "Int")
        .field("breed", "String!");
    return builder;
}

} // namespace

// ═══════════════════════════════════════════
//  Discriminator field
// ═══════════════════════════════════════════

TEST(DiscriminatorRulesTest, CompilesTypeNameTable) {
    auto builder = pets();
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator).members({"CatInput", "DogInput"});
    auto schema = builder.build(quiet());

    auto* plan = schema->inputUnion("AnimalInput")->plan();
    ASSERT_NE(plan, nullptr);
    auto& d = std::get<DiscriminatorPlan>(plan->detail);
    EXPECT_EQ(d.fieldName, "__typename");
    EXPECT_EQ(d.byTypeName.size(), 2);
    EXPECT_FALSE(d.defaultMember);
}

TEST(DiscriminatorRulesTest, FieldNameFromOptionsOrUnion) {
    auto builder = pets();
    builder.inputUnion("ByOption", StrategyKind::Discriminator).members({"CatInput", "DogInput"});
    builder.inputUnion("ByUnion", StrategyKind::Discriminator)
        .members({"CatInput", "DogInput"})
        .field("species");

    auto opts = quiet();
    opts.discriminatorField = "kind";
    auto schema = builder.build(opts);

    EXPECT_EQ(schema->inputUnion("ByOption")->plan()->describe()["field"], "kind");
    EXPECT_EQ(schema->inputUnion("ByUnion")->plan()->describe()["field"], "species");
}

TEST(DiscriminatorRulesTest, ReservedFieldCollision) {
    auto builder = pets();
    builder.inputObject("SnakeInput").field("__typename", "String").field("length", "Int");
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
        .members({"CatInput", "SnakeInput"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::ReservedFieldCollision);
    EXPECT_EQ(errors[0].typeName, "AnimalInput");
    EXPECT_EQ(errors[0].strategy, StrategyKind::Discriminator);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"SnakeInput"}));
}

TEST(DiscriminatorRulesTest, DefaultMemberPermitsReservedField) {
    auto builder = pets();
    builder.inputObject("SnakeInput").field("__typename", "String").field("length", "Int");
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
        .members({"CatInput", "SnakeInput"})
        .defaultMember("CatInput");

    EXPECT_TRUE(buildErrors(builder).empty());

    auto schema = builder.build(quiet());
    auto& d = std::get<DiscriminatorPlan>(schema->inputUnion("AnimalInput")->plan()->detail);
    EXPECT_EQ(d.byTypeName.size(), 2);
    ASSERT_TRUE(d.defaultMember);
    EXPECT_EQ(d.defaultMember->name(), "CatInput");
}

TEST(DiscriminatorRulesTest, DefaultMemberMustBeDeclared) {
    auto builder = pets();
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
        .members({"CatInput", "DogInput"})
        .defaultMember("FishInput");

    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::UnknownDefaultMember}));
}

TEST(DiscriminatorRulesTest, DefaultMemberIsCompiled) {
    auto builder = pets();
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
        .members({"CatInput", "DogInput"})
        .defaultMember("DogInput");
    auto schema = builder.build(quiet());

    auto& d = std::get<DiscriminatorPlan>(schema->inputUnion("AnimalInput")->plan()->detail);
    ASSERT_TRUE(d.defaultMember);
    EXPECT_EQ(d.defaultMember->name(), "DogInput");
}

TEST(DiscriminatorRulesTest, LeafMembersRejected) {
    auto builder = pets();
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator).members({"CatInput", "String"});
    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::LeafMemberAmbiguity}));
}

// ═══════════════════════════════════════════
//  Literal-tag field
// ═══════════════════════════════════════════

namespace {

SchemaBuilder tagged(const char* catLiteral, const char* dogLiteral) {
    SchemaBuilder builder;
    builder.enumType("PetKind", {"CAT", "DOG"});
    builder.inputObject("TaggedCat")
        .field("kind", "PetKind!").literal(catLiteral)
        .field("name", "String!");
    builder.inputObject("TaggedDog")
        .field("kind", "PetKind").literal(dogLiteral)
        .field("name", "String!");
    return builder;
}

} // namespace

TEST(LiteralTagRulesTest, LiteralMapIsBijection) {
    auto builder = tagged("CAT", "DOG");
    builder.inputUnion("Pet", StrategyKind::LiteralTag).field("kind").members({"TaggedCat", "TaggedDog"});
    auto schema = builder.build(quiet());

    auto* plan = schema->inputUnion("Pet")->plan();
    ASSERT_NE(plan, nullptr);
    auto& d = std::get<LiteralTagPlan>(plan->detail);
    ASSERT_EQ(d.byLiteral.size(), plan->members.size());
    EXPECT_EQ(d.byLiteral.at("\"CAT\"").name(), "TaggedCat");
    EXPECT_EQ(d.byLiteral.at("\"DOG\"").name(), "TaggedDog");
    EXPECT_EQ(d.tagType->name, "PetKind");
}

TEST(LiteralTagRulesTest, DuplicateLiteral) {
    auto builder = tagged("CAT", "CAT");
    builder.inputUnion("Pet", StrategyKind::LiteralTag).field("kind").members({"TaggedCat", "TaggedDog"});
    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::DuplicateLiteral);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"TaggedCat", "TaggedDog"}));
}

TEST(LiteralTagRulesTest, TagFieldMustBeNamed) {
    auto builder = tagged("CAT", "DOG");
    builder.inputUnion("Pet", StrategyKind::LiteralTag).members({"TaggedCat", "TaggedDog"});
    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::MissingTagField}));
}

TEST(LiteralTagRulesTest, EveryMemberDeclaresALiteralTag) {
    auto builder = tagged("CAT", "DOG");
    builder.inputObject("Untagged").field("name", "String!");
    builder.inputObject("Unconstrained").field("kind", "PetKind!").field("size", "Int");
    builder.inputUnion("Pet", StrategyKind::LiteralTag)
        .field("kind")
        .members({"TaggedCat", "Untagged", "Unconstrained"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::MissingTagField);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"Untagged"}));
    EXPECT_EQ(errors[1].code, SchemaErrorCode::MissingTagField);
    EXPECT_EQ(errors[1].members, (std::vector<std::string>{"Unconstrained"}));
}

TEST(LiteralTagRulesTest, TagTypesMustAgree) {
    auto builder = tagged("CAT", "DOG");
    builder.inputObject("TaggedFish").field("kind", "String!").literal("FISH");
    builder.inputUnion("Pet", StrategyKind::LiteralTag)
        .field("kind")
        .members({"TaggedCat", "TaggedFish"});

    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::InconsistentTagType}));
}

TEST(LiteralTagRulesTest, LeafMembersUnsupported) {
    auto builder = tagged("CAT", "DOG");
    builder.inputUnion("Pet", StrategyKind::LiteralTag).field("kind").members({"TaggedCat", "Int"});
    auto errors = buildErrors(builder);
    EXPECT_TRUE(hasCode(errors, SchemaErrorCode::LeafMemberAmbiguity));
}

// ═══════════════════════════════════════════
//  Order-based
// ═══════════════════════════════════════════

namespace {

SchemaBuilder twins() {
    SchemaBuilder builder;
    builder.inputObject("First").field("x", "Int!").field("y", "String");
    builder.inputObject("Second").field("y", "String").field("x", "Int!");
    builder.inputObject("Other").field("x", "Int!");
    builder.inputUnion("Pick", StrategyKind::Ordered).members({"First", "Other", "Second"});
    return builder;
}

} // namespace

TEST(OrderedRulesTest, IdenticalMembersWarn) {
    auto schema = twins().build(quiet());

    ASSERT_EQ(schema->warnings().size(), 1);
    auto& w = schema->warnings()[0];
    EXPECT_EQ(w.code, SchemaErrorCode::UnreachableMember);
    EXPECT_TRUE(w.isWarning());
    EXPECT_EQ(w.members, (std::vector<std::string>{"First", "Second"}));
    EXPECT_NE(schema->inputUnion("Pick")->plan(), nullptr);
}

TEST(OrderedRulesTest, IdenticalMembersFatalWhenStrict) {
    auto opts = quiet();
    opts.strict = true;
    auto errors = buildErrors(twins(), opts);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::UnreachableMember);
    EXPECT_FALSE(errors[0].isWarning());
}

TEST(OrderedRulesTest, DifferentLiteralsAreDistinct) {
    SchemaBuilder builder;
    builder.inputObject("A").field("k", "String!").literal("a");
    builder.inputObject("B").field("k", "String!").literal("b");
    builder.inputUnion("Pick", StrategyKind::Ordered).members({"A", "B"});
    auto schema = builder.build(quiet());
    EXPECT_TRUE(schema->warnings().empty());
}

TEST(OrderedRulesTest, AtMostOneLeafMember) {
    auto builder = pets();
    builder.inputUnion("One", StrategyKind::Ordered).members({"CatInput", "Int"});
    auto schema = builder.build(quiet());
    auto* plan = schema->inputUnion("One")->plan();
    ASSERT_TRUE(plan->leafMember);
    EXPECT_EQ(plan->leafMember->name(), "Int");

    auto bad = pets();
    bad.inputUnion("Two", StrategyKind::Ordered).members({"CatInput", "Int", "String"});
    auto errors = buildErrors(bad);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::LeafMemberAmbiguity);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"Int", "String"}));
}

// ═══════════════════════════════════════════
//  Structural uniqueness
// ═══════════════════════════════════════════

TEST(StructuralRulesTest, DistinctRequiredSetsCompile) {
    auto builder = pets();
    builder.inputUnion("Shaped", StrategyKind::Structural).members({"CatInput", "DogInput"});
    auto schema = builder.build(quiet());

    auto& d = std::get<StructuralPlan>(schema->inputUnion("Shaped")->plan()->detail);
    ASSERT_EQ(d.entries.size(), 2);
    EXPECT_EQ(d.entries[0].required, (std::set<std::string>{"livesLeft", "name"}));
    EXPECT_EQ(d.entries[1].required, (std::set<std::string>{"breed", "name"}));
    EXPECT_EQ(d.requiredUniverse, (std::set<std::string>{"breed", "livesLeft", "name"}));
    EXPECT_EQ(d.byRequiredSet.size(), 2);
}

TEST(StructuralRulesTest, RequiredSubsetOfOtherFieldsIsAmbiguous) {
    SchemaBuilder builder;
    builder.inputObject("Plain").field("name", "String!");
    builder.inputObject("Fancy").field("name", "String!").field("breed", "String!");
    builder.inputUnion("Shaped", StrategyKind::Structural).members({"Plain", "Fancy"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::AmbiguousMembers);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"Plain", "Fancy"}));
    EXPECT_NE(errors[0].message.find("ambiguous members"), std::string::npos);
    EXPECT_NE(errors[0].message.find("{name}"), std::string::npos);
}

TEST(StructuralRulesTest, OptionalFieldsCountAgainstUniqueness) {
    SchemaBuilder builder;
    builder.inputObject("A").field("id", "ID!");
    builder.inputObject("B").field("id", "ID").field("code", "String!");
    builder.inputUnion("Shaped", StrategyKind::Structural).members({"A", "B"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"A", "B"}));
}

TEST(StructuralRulesTest, EqualRequiredSetsReportedBothWays) {
    SchemaBuilder builder;
    builder.inputObject("A").field("id", "ID!");
    builder.inputObject("B").field("id", "ID!");
    builder.inputUnion("Shaped", StrategyKind::Structural).members({"A", "B"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(errors[1].members, (std::vector<std::string>{"B", "A"}));
}

// ═══════════════════════════════════════════
//  Tagged wrapper (oneOf)
// ═══════════════════════════════════════════

TEST(OneOfRulesTest, FieldsBecomeMembers) {
    auto builder = pets();
    builder.inputObject("PetChoice").field("cat", "CatInput").field("dog", "DogInput");
    builder.inputUnion("PetWrapper", StrategyKind::OneOf).wrapper("PetChoice");
    auto schema = builder.build(quiet());

    auto* plan = schema->inputUnion("PetWrapper")->plan();
    ASSERT_NE(plan, nullptr);
    auto described = plan->describe();
    EXPECT_EQ(described["wrapper"], "PetChoice");
    EXPECT_EQ(described["fields"]["cat"], "CatInput");
    EXPECT_EQ(described["fields"]["dog"], "DogInput");
    EXPECT_EQ(plan->members.size(), 2);
}

TEST(OneOfRulesTest, WrapperMustExist) {
    SchemaBuilder builder;
    builder.inputUnion("PetWrapper", StrategyKind::OneOf).wrapper("Nowhere");
    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::InvalidWrapper}));
}

TEST(OneOfRulesTest, WrapperNeedsTwoOptionalFields) {
    auto single = pets();
    single.inputObject("Single").field("cat", "CatInput");
    single.inputUnion("W", StrategyKind::OneOf).wrapper("Single");
    EXPECT_EQ(codes(buildErrors(single)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::InvalidWrapper}));

    auto required = pets();
    required.inputObject("Choice").field("cat", "CatInput!").field("dog", "DogInput");
    required.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    EXPECT_EQ(codes(buildErrors(required)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::InvalidWrapper}));

    auto listed = pets();
    listed.inputObject("Choice").field("cats", "[CatInput]").field("dog", "DogInput");
    listed.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    EXPECT_TRUE(hasCode(buildErrors(listed), SchemaErrorCode::InvalidWrapper));
}

TEST(OneOfRulesTest, WrapperFieldsRejectDefaults) {
    auto builder = pets();
    builder.inputObject("Choice")
        .field("cat", "CatInput").defaultValue({{"name", "Tom"}, {"livesLeft", 9}})
        .field("dog", "DogInput");
    builder.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    EXPECT_EQ(codes(buildErrors(builder)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::InvalidWrapper}));
}

TEST(OneOfRulesTest, LeafAndDuplicateFields) {
    auto leaf = pets();
    leaf.inputObject("Choice").field("cat", "CatInput").field("name", "String");
    leaf.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    EXPECT_EQ(codes(buildErrors(leaf)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::LeafMemberAmbiguity}));

    auto dup = pets();
    dup.inputObject("Choice").field("cat", "CatInput").field("kitten", "CatInput");
    dup.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    EXPECT_EQ(codes(buildErrors(dup)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::DuplicateMember}));
}

TEST(OneOfRulesTest, DeclaredMembersMustMatchWrapper) {
    auto builder = pets();
    builder.inputObject("Choice").field("cat", "CatInput").field("dog", "DogInput");
    builder.inputUnion("W", StrategyKind::OneOf)
        .wrapper("Choice")
        .members({"DogInput", "CatInput"});
    EXPECT_EQ(codes(buildErrors(builder)),
              (std::vector<SchemaErrorCode>{SchemaErrorCode::InvalidWrapper}));
}

TEST(OneOfRulesTest, UnionFieldsKeepTheirOwnPlan) {
    auto builder = pets();
    builder.inputObject("BirdInput").field("wingspan", "Float!");
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator).members({"CatInput", "DogInput"});
    builder.inputObject("Choice").field("animal", "AnimalInput").field("bird", "BirdInput");
    builder.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    auto schema = builder.build(quiet());

    auto& d = std::get<OneOfPlan>(schema->inputUnion("W")->plan()->detail);
    ASSERT_EQ(d.byField.size(), 2);
    EXPECT_EQ(d.byField.at("animal").unionType, schema->inputUnion("AnimalInput"));
    EXPECT_EQ(d.byField.at("bird").object, schema->inputObject("BirdInput"));
}

// ═══════════════════════════════════════════
//  Membership: nesting, cycles, unknown types
// ═══════════════════════════════════════════

TEST(MembershipRulesTest, NestedUnionsFlatten) {
    SchemaBuilder builder;
    builder.inputObject("A").field("a", "Int!");
    builder.inputObject("B").field("b", "Int!");
    builder.inputObject("C").field("c", "Int!");
    builder.inputUnion("Inner", StrategyKind::Discriminator).members({"B", "C"});
    builder.inputUnion("Outer", StrategyKind::Ordered).members({"A", "Inner"});
    auto schema = builder.build(quiet());

    auto members = schema->inputUnion("Outer")->plan()->describe()["members"];
    EXPECT_EQ(members, (nlohmann::json{"A", "B", "C"}));
}

TEST(MembershipRulesTest, DuplicateAfterFlattening) {
    SchemaBuilder builder;
    builder.inputObject("A").field("a", "Int!");
    builder.inputObject("B").field("b", "Int!");
    builder.inputUnion("Inner", StrategyKind::Ordered).members({"A", "B"});
    builder.inputUnion("Outer", StrategyKind::Ordered).members({"A", "Inner"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::DuplicateMember);
    EXPECT_EQ(errors[0].typeName, "Outer");
}

TEST(MembershipRulesTest, MembershipCycles) {
    SchemaBuilder builder;
    builder.inputObject("A").field("a", "Int!");
    builder.inputObject("B").field("b", "Int!");
    builder.inputUnion("Left", StrategyKind::Ordered).members({"A", "Right"});
    builder.inputUnion("Right", StrategyKind::Structural).members({"B", "Left"});
    builder.inputUnion("Self", StrategyKind::Ordered).members({"A", "Self"});

    auto errors = buildErrors(builder);
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].code, SchemaErrorCode::UnionCycle);
    EXPECT_EQ(errors[0].members, (std::vector<std::string>{"Left", "Right"}));
    EXPECT_EQ(errors[1].code, SchemaErrorCode::UnionCycle);
    EXPECT_EQ(errors[1].members, (std::vector<std::string>{"Self"}));
}

TEST(MembershipRulesTest, CycleThroughWrapperField) {
    SchemaBuilder builder;
    builder.inputObject("A").field("a", "Int!");
    builder.inputObject("Choice").field("a", "A").field("again", "W");
    builder.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");

    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::UnionCycle}));
}

TEST(MembershipRulesTest, OneOfCannotBeFlattened) {
    auto builder = pets();
    builder.inputObject("Choice").field("cat", "CatInput").field("dog", "DogInput");
    builder.inputUnion("W", StrategyKind::OneOf).wrapper("Choice");
    builder.inputObject("FishInput").field("fins", "Int!");
    builder.inputUnion("Any", StrategyKind::Ordered).members({"FishInput", "W"});

    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::IllegalMember}));
}

TEST(MembershipRulesTest, UnknownAndEmpty) {
    SchemaBuilder builder;
    builder.inputObject("A").field("a", "Int!");
    builder.inputUnion("U", StrategyKind::Ordered).members({"A", "Ghost"});
    builder.inputUnion("E", StrategyKind::Discriminator);

    auto errors = buildErrors(builder);
    EXPECT_EQ(codes(errors), (std::vector<SchemaErrorCode>{SchemaErrorCode::UnknownType,
                                                           SchemaErrorCode::EmptyUnion}));
}

// ═══════════════════════════════════════════
//  Plans are a pure function of the schema
// ═══════════════════════════════════════════

TEST(PlanTest, ValidationIsIdempotent) {
    auto builder = pets();
    builder.inputUnion("Shaped", StrategyKind::Structural).members({"CatInput", "DogInput"});
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator).members({"CatInput", "DogInput"});
    auto schema = builder.build(quiet());

    for (auto& name : schema->unionNames()) {
        auto& u = *schema->inputUnion(name);
        auto first = validate(u, *schema, quiet());
        auto second = validate(u, *schema, quiet());
        ASSERT_TRUE(first.ok());
        ASSERT_TRUE(second.ok());
        EXPECT_EQ(first.plan->describe(), second.plan->describe());
        EXPECT_EQ(first.plan->describe(), u.plan()->describe());
    }
}

TEST(PlanTest, NoCyclesInWellFormedSchema) {
    auto builder = pets();
    builder.inputUnion("AnimalInput", StrategyKind::Discriminator).members({"CatInput", "DogInput"});
    auto schema = builder.build(quiet());

    std::set<std::string> cyclic;
    EXPECT_TRUE(checkUnionCycles(*schema, cyclic).empty());
    EXPECT_TRUE(cyclic.empty());
}
