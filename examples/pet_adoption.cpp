// ═══════════════════════════════════════════════════════════════════
//  pet_adoption.cpp — Input unions under every strategy
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Declaring input objects and unions with SchemaBuilder
//    • Discriminator, literal-tag, ordered, structural and oneOf unions
//    • Coercing client values and reading the resolved member
//    • Printing coercion errors the way a response would carry them
//
// ═══════════════════════════════════════════════════════════════════

#include <unionpp/unionpp.h>
#include <iostream>

using namespace unionpp;

namespace {

void show(const Coercer& coercer, const std::string& unionName, const char* text) {
    auto* unionType = coercer.schema().inputUnion(unionName);
    auto value = parseValue(text);
    auto result = coercer.coerceUnion(value, *unionType);

    std::cout << unionName << " <- " << text << "\n";
    if (result.ok()) {
        std::cout << "  resolved to " << result.value->typeName
                  << ": " << result.value->toJson().dump() << "\n";
    } else {
        std::cout << "  errors: " << toJson(result.errors).dump() << "\n";
    }
}

} // namespace

int main() {
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

    // Tagged variants carry a literal "kind" field
    builder.inputObject("TaggedCat")
        .field("kind", "PetKind!").literal("CAT")
        .field("name", "String!");
    builder.inputObject("TaggedDog")
        .field("kind", "PetKind!").literal("DOG")
        .field("name", "String!");

    builder.inputObject("PetChoice")
        .field("cat", "CatInput")
        .field("dog", "DogInput");

    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
        .members({"CatInput", "DogInput"});
    builder.inputUnion("TaggedPet", StrategyKind::LiteralTag)
        .field("kind")
        .members({"TaggedCat", "TaggedDog"});
    builder.inputUnion("FirstFit", StrategyKind::Ordered)
        .members({"CatInput", "DogInput"});
    builder.inputUnion("ShapedPet", StrategyKind::Structural)
        .members({"CatInput", "DogInput"});
    builder.inputUnion("PetWrapper", StrategyKind::OneOf)
        .wrapper("PetChoice");

    EngineOptions options;
    options.logLevel = console::Level::Info;
    console::setLevel(options.logLevel);

    std::shared_ptr<const Schema> schema;
    try {
        schema = builder.build(options);
    } catch (const SchemaBuildError& e) {
        console::error(e.what());
        return 1;
    }

    Coercer coercer(*schema);

    show(coercer, "AnimalInput", R"({"__typename": "CatInput", "name": "Buster", "livesLeft": 7})");
    show(coercer, "AnimalInput", R"({"__typename": "Snake", "name": "Kaa"})");
    show(coercer, "TaggedPet", R"({"kind": "DOG", "name": "Rex"})");
    show(coercer, "FirstFit", R"({"name": "Rex", "breed": "WHIPPET"})");
    show(coercer, "ShapedPet", R"({"name": "Buster", "breed": "WHIPPET"})");
    show(coercer, "ShapedPet", R"({"name": "Buster"})");
    show(coercer, "PetWrapper", R"({"dog": {"name": "Rex", "breed": "POODLE"}})");
    show(coercer, "PetWrapper", R"({"cat": {"name": "Tom", "livesLeft": 9}, "dog": {"name": "Rex", "breed": "POODLE"}})");

    console::info("plans:");
    for (auto& name : schema->unionNames()) {
        console::info(schema->inputUnion(name)->plan()->describe().dump());
    }
}
