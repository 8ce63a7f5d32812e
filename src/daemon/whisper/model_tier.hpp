#pragma once

#include <array>
#include <optional>
#include <string_view>

// Model sizes, ordered from cheapest to most accurate.
enum class ModelTier { Tiny, Base, Small, Medium, Large };

inline constexpr std::array<std::string_view, 5> model_tier_names = {
    "tiny", "base", "small", "medium", "large",
};

inline std::string_view to_string(ModelTier tier) {
    return model_tier_names[static_cast<size_t>(tier)];
}

inline std::optional<ModelTier> parse_model_tier(std::string_view name) {
    for (size_t i = 0; i < model_tier_names.size(); ++i) {
        if (model_tier_names[i] == name) return static_cast<ModelTier>(i);
    }
    return std::nullopt;
}
