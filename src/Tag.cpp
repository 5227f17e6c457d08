/**
 * @file Tag.cpp
 * @brief Implementation of annotation parsing
 */

#include "morph/Tag.hpp"

#include <vector>

namespace morph {

namespace {
    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }

    std::vector<std::string> split_commas(const std::string& s) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : s) {
            if (c == ',') {
                parts.push_back(trim(current));
                current.clear();
            } else {
                current += c;
            }
        }
        parts.push_back(trim(current));
        return parts;
    }
}

FieldSpec parse_tag(const std::string& tag) {
    FieldSpec spec;
    if (trim(tag) == "-") {
        spec.skip = true;
        return spec;
    }

    const auto parts = split_commas(tag);
    if (!parts[0].empty()) {
        spec.name = parts[0];
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        const auto& opt = parts[i];
        if (opt == "squash") {
            spec.squash = true;
        } else if (opt == "remain") {
            spec.remain = true;
        } else if (opt == "omitempty") {
            spec.omit_empty = true;
        }
    }

    return spec;
}

} // namespace morph
