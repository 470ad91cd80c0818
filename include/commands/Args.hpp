#pragma once

#include <string>

#include "elicit/Models.hpp"

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Throw std::runtime_error when the value is present but malformed.
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// "a,b,c,d,e,f,g"
elicit::FeatureVector parse_feature_vector(const std::string& s, const std::string& what);
