#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "elicit/Dominance.hpp"
#include "elicit/FeatureEncoding.hpp"

using json = nlohmann::json;
using namespace elicit;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    return require_string(j, key, where);
}

static double require_number(const json& j, const std::string& where) {
    if (!j.is_number()) {
        throw std::runtime_error(where + " must be a number");
    }
    return j.get<double>();
}

static std::string indexed(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static json read_json_file(const std::string& path, const std::string& what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open " + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

static void write_json_file(const std::filesystem::path& out_path, const json& j) {
    if (out_path.has_parent_path()) {
        std::filesystem::create_directories(out_path.parent_path());
    }

    std::ofstream out(out_path);
    if (!out) {
        throw std::runtime_error("failed to write: " + out_path.string());
    }
    out << j.dump(2) << "\n";
}

// ---------------------------------------------------------------------------
// vignettes

static VignetteOption parse_option(const json& j, const std::string& where) {
    require_object(j, where);

    VignetteOption o;
    o.option_id   = require_string(j, "option_id", where);
    o.title       = optional_string(j, "title", where, "");
    o.description = optional_string(j, "description", where, "");

    const json& attrs = require_field(j, "attributes", where);
    require_object(attrs, where + ".attributes");

    for (auto it = attrs.begin(); it != attrs.end(); ++it) {
        const std::string w = where + ".attributes." + it.key();
        if (it.value().is_boolean()) {
            o.attributes[it.key()] = it.value().get<bool>() ? 1.0 : 0.0;
        } else {
            o.attributes[it.key()] = require_number(it.value(), w);
        }
    }

    return o;
}

Vignette parse_vignette(const json& j, const std::string& where) {
    require_object(j, where);

    Vignette v;
    v.vignette_id      = require_string(j, "vignette_id", where);
    v.category         = optional_string(j, "category", where, "");
    v.difficulty_level = optional_string(j, "difficulty_level", where, "medium");
    v.scenario_text    = require_string(j, "scenario_text", where);

    const json& options = require_field(j, "options", where);
    require_array(options, where + ".options");
    if (options.size() != 2) {
        throw std::runtime_error(where + ".options must have exactly 2 entries");
    }

    for (size_t i = 0; i < 2; ++i) {
        v.options[i] = parse_option(options.at(i), indexed(where, "options", i));
    }
    if (v.options[0].option_id == v.options[1].option_id) {
        throw std::runtime_error(where + ".options must have distinct option_id values");
    }
    if (encodes_identically(v.options[0].attributes, v.options[1].attributes)) {
        throw std::runtime_error(where + ".options encode to the same feature vector");
    }

    return v;
}

json vignette_to_json(const Vignette& v) {
    json j;
    j["vignette_id"] = v.vignette_id;
    j["category"] = v.category;
    j["difficulty_level"] = v.difficulty_level;
    j["scenario_text"] = v.scenario_text;

    json options = json::array();
    for (const auto& o : v.options) {
        json attrs = json::object();
        for (const auto& kv : o.attributes) attrs[kv.first] = kv.second;

        options.push_back({
            {"option_id", o.option_id},
            {"title", o.title},
            {"description", o.description},
            {"attributes", attrs}
        });
    }
    j["options"] = options;

    return j;
}

static std::vector<Vignette> parse_vignette_list(const json& root, const char* key) {
    std::vector<Vignette> out;
    if (!root.contains(key)) return out;

    const json& arr = root.at(key);
    require_array(arr, std::string("root.") + key);
    for (size_t i = 0; i < arr.size(); ++i) {
        out.push_back(parse_vignette(arr.at(i), indexed("root", key, i)));
    }
    return out;
}

VignetteLibrary load_vignette_library(const std::string& path) {
    json j = read_json_file(path, "vignette library");
    require_object(j, "root");

    if (j.contains("encoding_version")) {
        const json& ver = j.at("encoding_version");
        if (!ver.is_number_integer()) {
            throw std::runtime_error("root.encoding_version must be an integer");
        }
        if (ver.get<int>() != kFeatureEncodingVersion) {
            throw std::runtime_error("vignette library " + path + " uses feature encoding version " +
                                     std::to_string(ver.get<int>()) + ", expected " +
                                     std::to_string(kFeatureEncodingVersion));
        }
    }

    VignetteLibrary lib;
    lib.static_beginning = parse_vignette_list(j, "static_beginning");
    lib.static_end       = parse_vignette_list(j, "static_end");
    lib.adaptive         = parse_vignette_list(j, "adaptive");
    return lib;
}

json vignette_library_to_json(const VignetteLibrary& lib) {
    auto list = [](const std::vector<Vignette>& vs) {
        json arr = json::array();
        for (const auto& v : vs) arr.push_back(vignette_to_json(v));
        return arr;
    };

    json j;
    j["encoding_version"] = kFeatureEncodingVersion;
    j["static_beginning"] = list(lib.static_beginning);
    j["static_end"] = list(lib.static_end);
    j["adaptive"] = list(lib.adaptive);
    return j;
}

void write_vignette_library(const std::filesystem::path& out_path, const VignetteLibrary& lib) {
    write_json_file(out_path, vignette_library_to_json(lib));
}

// ---------------------------------------------------------------------------
// attribute design

static AttributeSpec parse_attribute(const json& j, const std::string& where) {
    require_object(j, where);

    AttributeSpec a;
    a.name  = require_string(j, "name", where);
    a.label = optional_string(j, "label", where, a.name);

    const std::string type = optional_string(j, "type", where, "categorical");
    if (type == "ordered") a.type = AttributeType::Ordered;
    else if (type == "categorical") a.type = AttributeType::Categorical;
    else throw std::runtime_error(where + ".type must be \"ordered\" or \"categorical\"");

    const json& levels = require_field(j, "levels", where);
    require_array(levels, where + ".levels");
    for (size_t i = 0; i < levels.size(); ++i) {
        const std::string w = indexed(where, "levels", i);
        const json& lv = levels.at(i);
        require_object(lv, w);

        AttributeLevel l;
        l.value = require_number(require_field(lv, "value", w), w + ".value");
        l.label = optional_string(lv, "label", w, "");
        a.levels.push_back(l);
    }

    return a;
}

std::vector<AttributeSpec> load_attribute_design(const std::string& path) {
    json j = read_json_file(path, "attribute design");
    require_object(j, "root");

    const json& attrs = require_field(j, "attributes", "root");
    require_array(attrs, "root.attributes");

    std::vector<AttributeSpec> out;
    for (size_t i = 0; i < attrs.size(); ++i) {
        out.push_back(parse_attribute(attrs.at(i), indexed("root", "attributes", i)));
    }
    return out;
}

// ---------------------------------------------------------------------------
// session snapshot

static json vector_to_json(const FeatureVector& v) {
    json arr = json::array();
    for (int i = 0; i < kNumDimensions; ++i) arr.push_back(v[i]);
    return arr;
}

static json matrix_to_json(const InformationMatrix& m) {
    json rows = json::array();
    for (int r = 0; r < kNumDimensions; ++r) {
        json row = json::array();
        for (int c = 0; c < kNumDimensions; ++c) row.push_back(m(r, c));
        rows.push_back(row);
    }
    return rows;
}

static FeatureVector vector_from_json(const json& j, const std::string& where) {
    require_array(j, where);
    if (j.size() != static_cast<size_t>(kNumDimensions)) {
        throw std::runtime_error(where + " must have " + std::to_string(kNumDimensions) + " entries");
    }

    FeatureVector v;
    for (int i = 0; i < kNumDimensions; ++i) {
        v[i] = require_number(j.at(static_cast<size_t>(i)), where + "[" + std::to_string(i) + "]");
    }
    return v;
}

static InformationMatrix matrix_from_json(const json& j, const std::string& where) {
    require_array(j, where);
    if (j.size() != static_cast<size_t>(kNumDimensions)) {
        throw std::runtime_error(where + " must have " + std::to_string(kNumDimensions) + " rows");
    }

    InformationMatrix m;
    for (int r = 0; r < kNumDimensions; ++r) {
        const FeatureVector row = vector_from_json(j.at(static_cast<size_t>(r)), where + "[" + std::to_string(r) + "]");
        m.row(r) = row.transpose();
    }
    return m;
}

json session_to_json(const SessionState& state) {
    json j;
    j["session_id"] = state.session_id;
    j["posterior_mean"] = vector_to_json(state.posterior.mean);
    j["posterior_covariance"] = matrix_to_json(state.posterior.covariance);
    j["fisher_information_matrix"] = matrix_to_json(state.fisher_information_matrix);
    j["completed_vignettes"] = state.completed_vignettes;
    j["adaptive_vignettes_shown_count"] = state.adaptive_vignettes_shown_count;
    j["adaptive_phase_complete"] = state.adaptive_phase_complete;

    json responses = json::array();
    for (const auto& r : state.responses) {
        responses.push_back({{"vignette_id", r.vignette_id}, {"chosen_option_id", r.chosen_option_id}});
    }
    j["responses"] = responses;

    if (state.log_prior) {
        j["log_prior"] = {
            {"mean", vector_to_json(state.log_prior->mean)},
            {"covariance", matrix_to_json(state.log_prior->covariance)}
        };
    }

    return j;
}

SessionState session_from_json(const json& j) {
    require_object(j, "root");

    SessionState s;
    s.session_id = require_string(j, "session_id", "root");
    s.posterior.mean = vector_from_json(require_field(j, "posterior_mean", "root"), "root.posterior_mean");
    s.posterior.covariance = matrix_from_json(require_field(j, "posterior_covariance", "root"), "root.posterior_covariance");
    s.fisher_information_matrix = matrix_from_json(require_field(j, "fisher_information_matrix", "root"),
                                                   "root.fisher_information_matrix");

    const json& completed = require_field(j, "completed_vignettes", "root");
    require_array(completed, "root.completed_vignettes");
    for (size_t i = 0; i < completed.size(); ++i) {
        const std::string w = "root.completed_vignettes[" + std::to_string(i) + "]";
        if (!completed.at(i).is_string()) throw std::runtime_error(w + " must be a string");
        if (!s.mark_completed(completed.at(i).get<std::string>())) {
            throw std::runtime_error(w + " repeats an earlier id");
        }
    }

    const json& count = require_field(j, "adaptive_vignettes_shown_count", "root");
    if (!count.is_number_integer() || count.get<long long>() < 0) {
        throw std::runtime_error("root.adaptive_vignettes_shown_count must be a non-negative integer");
    }
    s.adaptive_vignettes_shown_count = count.get<int>();

    const json& done = require_field(j, "adaptive_phase_complete", "root");
    if (!done.is_boolean()) throw std::runtime_error("root.adaptive_phase_complete must be a boolean");
    s.adaptive_phase_complete = done.get<bool>();

    if (j.contains("log_prior")) {
        const json& base = j.at("log_prior");
        require_object(base, "root.log_prior");
        PreferenceEstimate prior;
        prior.mean = vector_from_json(require_field(base, "mean", "root.log_prior"), "root.log_prior.mean");
        prior.covariance = matrix_from_json(require_field(base, "covariance", "root.log_prior"),
                                            "root.log_prior.covariance");
        s.log_prior = prior;
    }

    if (!j.contains("responses")) {
        // no event log: later answers refine the persisted posterior
        if (!s.completed_vignettes.empty() && !s.log_prior) s.log_prior = s.posterior;
        return s;
    }

    const json& responses = j.at("responses");
    require_array(responses, "root.responses");
    for (size_t i = 0; i < responses.size(); ++i) {
        const std::string w = indexed("root", "responses", i);
        require_object(responses.at(i), w);
        Observation obs;
        obs.vignette_id = require_string(responses.at(i), "vignette_id", w);
        obs.chosen_option_id = require_string(responses.at(i), "chosen_option_id", w);
        s.responses.push_back(obs);
    }

    if (!s.log_prior && s.responses.size() < s.completed_vignettes.size()) {
        throw std::runtime_error("root.responses covers " + std::to_string(s.responses.size()) + " of " +
                                 std::to_string(s.completed_vignettes.size()) +
                                 " completed vignettes and root.log_prior is missing");
    }

    return s;
}

SessionState read_session_snapshot(const std::string& path) {
    return session_from_json(read_json_file(path, "session snapshot"));
}

void write_session_snapshot(const std::filesystem::path& out_path, const SessionState& state) {
    write_json_file(out_path, session_to_json(state));
}
