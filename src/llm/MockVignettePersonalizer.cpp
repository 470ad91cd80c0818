#include "llm/MockVignettePersonalizer.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

std::string fill_placeholders(const std::string& text, const elicit::UserContext& user_context) {
    const std::pair<const char*, const std::string*> subs[] = {
        {"{role}", &user_context.current_role},
        {"{industry}", &user_context.industry},
        {"{experience}", &user_context.experience_level},
    };

    std::string out = text;
    for (const auto& s : subs) {
        const std::string key = s.first;
        size_t pos = 0;
        while ((pos = out.find(key, pos)) != std::string::npos) {
            out.replace(pos, key.size(), *s.second);
            pos += s.second->size();
        }
    }
    return out;
}

MockVignettePersonalizer::MockVignettePersonalizer(const std::string& root_dir) : root_(root_dir) {}

static void take_string(const json& j, const char* key, std::string& field, const std::string& where) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + key + " must be a string");
    }
    field = j.at(key).get<std::string>();
}

elicit::Vignette MockVignettePersonalizer::personalize(const elicit::Vignette& vignette,
                                                       const elicit::UserContext& user_context) {
    elicit::Vignette out = vignette;

    fs::path p = root_ / (vignette.vignette_id + ".json");
    std::ifstream f(p);
    if (f) {
        json j;
        try {
            f >> j;
        } catch (const std::exception& e) {
            throw std::runtime_error("failed to parse mock personalisation " + p.string() + ": " + e.what());
        }

        const std::string where = p.filename().string();
        if (!j.is_object()) throw std::runtime_error(where + " must be an object");

        take_string(j, "scenario_text", out.scenario_text, where);
        take_string(j, "option_a_title", out.options[0].title, where);
        take_string(j, "option_a_description", out.options[0].description, where);
        take_string(j, "option_b_title", out.options[1].title, where);
        take_string(j, "option_b_description", out.options[1].description, where);
    }

    out.scenario_text = fill_placeholders(out.scenario_text, user_context);
    for (auto& o : out.options) {
        o.title = fill_placeholders(o.title, user_context);
        o.description = fill_placeholders(o.description, user_context);
    }

    return out;
}

} // namespace llm
