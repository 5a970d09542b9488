#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace arena_tracker {

// Block introduced by a "==> Method" / "<== Method" line
struct MethodBlock {
    std::string method;
    nlohmann::json payload;
};

// Untagged JSON: "[Logger]{...}" or a bare recognised JSON line
struct StandaloneBlock {
    nlohmann::json payload;
};

using JsonBlock = std::variant<MethodBlock, StandaloneBlock>;

inline constexpr const char* kStandaloneTag = "standalone";

inline std::string block_tag(const JsonBlock& block) {
    if (auto method = std::get_if<MethodBlock>(&block)) {
        return method->method;
    }
    return kStandaloneTag;
}

inline const nlohmann::json& block_payload(const JsonBlock& block) {
    return std::visit([](const auto& b) -> const nlohmann::json& { return b.payload; }, block);
}

} // namespace arena_tracker
