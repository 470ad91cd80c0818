#include "commands/Args.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    return static_cast<int>(v);
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) throw std::runtime_error(key + " expects a number, got '" + s + "'");
    return v;
}

elicit::FeatureVector parse_feature_vector(const std::string& s, const std::string& what) {
    std::vector<double> vals;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        char* end = nullptr;
        const double v = std::strtod(tok.c_str(), &end);
        if (tok.empty() || end != tok.c_str() + tok.size()) {
            throw std::runtime_error(what + " has a malformed entry '" + tok + "'");
        }
        vals.push_back(v);
    }
    if (vals.size() != static_cast<size_t>(elicit::kNumDimensions)) {
        throw std::runtime_error(what + " needs " + std::to_string(elicit::kNumDimensions) + " comma-separated numbers");
    }

    elicit::FeatureVector out;
    for (int i = 0; i < elicit::kNumDimensions; ++i) out[i] = vals[static_cast<size_t>(i)];
    return out;
}
