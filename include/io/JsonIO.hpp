#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "elicit/Models.hpp"
#include "elicit/ProfileGenerator.hpp"
#include "elicit/SessionState.hpp"
#include "nlohmann/json.hpp"

// Vignette definition: {vignette_id, category?, difficulty_level?, scenario_text,
// options: [{option_id, title, description, attributes: {name: level}} x2]}
elicit::Vignette parse_vignette(const nlohmann::json& j, const std::string& where);
nlohmann::json vignette_to_json(const elicit::Vignette& v);

// {encoding_version, static_beginning: [...], static_end: [...], adaptive: [...]}
elicit::VignetteLibrary load_vignette_library(const std::string& path);
nlohmann::json vignette_library_to_json(const elicit::VignetteLibrary& lib);
void write_vignette_library(const std::filesystem::path& out_path, const elicit::VignetteLibrary& lib);

// {attributes: [{name, label, type: "ordered"|"categorical", levels: [{value, label}]}]}
std::vector<elicit::AttributeSpec> load_attribute_design(const std::string& path);

// Snapshot keys: session_id, posterior_mean, posterior_covariance,
// fisher_information_matrix, completed_vignettes, adaptive_vignettes_shown_count,
// adaptive_phase_complete, plus the event log `responses` and, when the log does
// not start at the configured prior, `log_prior` {mean, covariance}. A snapshot
// without `responses` resumes from its persisted posterior.
nlohmann::json session_to_json(const elicit::SessionState& state);
elicit::SessionState session_from_json(const nlohmann::json& j);

elicit::SessionState read_session_snapshot(const std::string& path);
void write_session_snapshot(const std::filesystem::path& out_path, const elicit::SessionState& state);
