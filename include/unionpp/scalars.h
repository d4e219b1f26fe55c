#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/scalars.h — Built-in scalar parsing and enum factories
// ═══════════════════════════════════════════════════════════════════

#include "schema.h"
#include <string>
#include <vector>

namespace unionpp::scalars {

// ── Input coercion rules of the built-in scalars ──
std::optional<ValueNode> parseInt(const ValueNode& raw);      // 32-bit integers only
std::optional<ValueNode> parseFloat(const ValueNode& raw);    // any number
std::optional<ValueNode> parseString(const ValueNode& raw);
std::optional<ValueNode> parseBoolean(const ValueNode& raw);
std::optional<ValueNode> parseId(const ValueNode& raw);       // string or integer → string

// Int, Float, String, Boolean, ID
std::vector<LeafType> builtins();

// Parse function of a built-in scalar, or nullptr for other names
ParseFunction builtinParser(std::string_view name);

LeafType makeEnum(std::string name, std::vector<std::string> values);

} // namespace unionpp::scalars
