// ═══════════════════════════════════════════════════════════════════
//  resolve_cli.cpp — Resolve a JSON value against a declared union
// ═══════════════════════════════════════════════════════════════════
//
//  unionpp_resolve <schema.json> <union> <value.json> [options.json]
//
//  Prints the coerced value (or the error list) as JSON.
//  Exit status: 0 resolved, 1 coercion errors, 2 usage or schema errors.
//
// ═══════════════════════════════════════════════════════════════════

#include <unionpp/unionpp.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace unionpp;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::invalid_argument("Cannot open '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int usage() {
    std::cerr << "usage: unionpp_resolve <schema.json> <union> <value.json> [options.json]\n";
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4 || argc > 5) return usage();

    std::shared_ptr<const Schema> schema;
    ValueNode value;
    try {
        EngineOptions options;
        if (argc == 5) options = EngineOptions::fromJson(nlohmann::json::parse(readFile(argv[4])));
        options.applyEnvironment();
        console::setLevel(options.logLevel);

        auto builder = SchemaBuilder::fromJson(nlohmann::ordered_json::parse(readFile(argv[1])));
        schema = builder.build(options);
        value = parseValue(readFile(argv[3]));
    } catch (const SchemaBuildError& e) {
        std::cout << nlohmann::json{{"schemaErrors", toJson(e.errors())}}.dump(2) << std::endl;
        return 2;
    } catch (const std::exception& e) {
        console::error(e.what());
        return 2;
    }

    auto* unionType = schema->inputUnion(argv[2]);
    if (!unionType) {
        console::error("Input union '" + std::string(argv[2]) + "' is not declared");
        return 2;
    }

    Coercer coercer(*schema);
    auto result = coercer.coerceUnion(value, *unionType);
    if (!result.ok()) {
        std::cout << nlohmann::json{{"errors", toJson(result.errors)}}.dump(2) << std::endl;
        return 1;
    }

    nlohmann::ordered_json selections = nlohmann::ordered_json::array();
    for (auto& u : result.value->unions) {
        nlohmann::ordered_json s = {{"union", u.unionName}};
        if (!u.selectedField.empty()) s["field"] = u.selectedField;
        selections.push_back(s);
    }

    nlohmann::ordered_json output = {
        {"member", result.value->typeName},
        {"unions", selections},
        {"value", result.value->toJson()}
    };
    std::cout << output.dump(2) << std::endl;
    return 0;
}
