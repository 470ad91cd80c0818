#pragma once

#include <string>

#include "elicit/Models.hpp"

namespace llm {

// Rewrites the presentable text of a vignette for one respondent.
// Ids, categories and attributes are never changed.
class VignettePersonalizer {
public:
    virtual ~VignettePersonalizer() = default;

    virtual elicit::Vignette personalize(const elicit::Vignette& vignette,
                                         const elicit::UserContext& user_context) = 0;
};

class NullVignettePersonalizer final : public VignettePersonalizer {
public:
    elicit::Vignette personalize(const elicit::Vignette& vignette, const elicit::UserContext&) override {
        return vignette;
    }
};

// Replaces {role}, {industry} and {experience} with the context values.
std::string fill_placeholders(const std::string& text, const elicit::UserContext& user_context);

} // namespace llm
