#pragma once

#include "llm/VignettePersonalizer.hpp"

#include <filesystem>
#include <string>

namespace llm {

// Reads canned rewrites from <root>/<vignette_id>.json:
// {scenario_text, option_a_title, option_a_description, option_b_title, option_b_description}.
// Vignettes without a file keep their text; placeholders are filled either way.
class MockVignettePersonalizer final : public VignettePersonalizer {
    std::filesystem::path root_;

public:
    explicit MockVignettePersonalizer(const std::string& root_dir);

    elicit::Vignette personalize(const elicit::Vignette& vignette,
                                 const elicit::UserContext& user_context) override;
};

} // namespace llm
