#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/path.h — Value paths, built on the stack while coercing
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace unionpp::detail {

// One step below the parent frame: a field name or a list index.
// Frames live on the caller's stack and are only turned into a
// JSON path when an error is recorded.
struct PathFrame {
    const PathFrame* parent = nullptr;
    std::string_view key;
    std::size_t index = 0;
    bool isIndex = false;

    static PathFrame field(const PathFrame* parent, std::string_view key) {
        return PathFrame{parent, key, 0, false};
    }

    static PathFrame element(const PathFrame* parent, std::size_t index) {
        return PathFrame{parent, {}, index, true};
    }
};

inline nlohmann::json materialize(const PathFrame* frame) {
    std::vector<const PathFrame*> chain;
    for (auto* f = frame; f; f = f->parent) chain.push_back(f);

    nlohmann::json path = nlohmann::json::array();
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if ((*it)->isIndex) {
            path.push_back((*it)->index);
        } else {
            path.push_back(std::string((*it)->key));
        }
    }
    return path;
}

} // namespace unionpp::detail
