/**
 * @file Validate.cpp
 * @brief Implementation of structural patch validation
 */

#include "jpatch/Validate.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Pointer.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>

namespace jpatch {

namespace {
    const std::array<std::string, 6> kKnownOps = {"add", "remove", "replace", "move", "copy", "test"};

    bool is_one_of(const std::string& name, std::initializer_list<const char*> names) {
        return std::any_of(names.begin(), names.end(),
                           [&](const char* n) { return name == n; });
    }

    /**
     * @brief Pointer syntax problem in text, or empty if well-formed
     */
    std::string pointer_problem(const std::string& text) {
        try {
            (void)Pointer::parse(text);
        } catch (const PointerSyntaxError& e) {
            return e.what();
        }
        return "";
    }
}

std::vector<std::string> validate(const Value& patch) {
    std::vector<std::string> errors;

    if (!patch.is_array()) {
        errors.push_back("Patch must be a list of operations.");
        return errors;
    }

    for (size_t i = 0; i < patch.size(); ++i) {
        const auto& op = patch[i];
        const std::string prefix = "Operation " + std::to_string(i);

        if (!op.is_object()) {
            errors.push_back(prefix + ": must be an object.");
            continue;
        }

        auto name_it = op.find("op");
        if (name_it == op.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
            errors.push_back(prefix + ": missing valid 'op'.");
            continue;
        }
        const std::string name = name_it->get<std::string>();
        const std::string where = prefix + " (" + name + ")";

        if (std::find(kKnownOps.begin(), kKnownOps.end(), name) == kKnownOps.end()) {
            errors.push_back(prefix + ": unsupported operation '" + name + "'.");
        }

        auto path_it = op.find("path");
        if (path_it == op.end() || !path_it->is_string()) {
            errors.push_back(where + ": missing valid 'path'.");
        } else {
            std::string problem = pointer_problem(path_it->get<std::string>());
            if (!problem.empty()) {
                errors.push_back(where + ": " + problem);
            }
        }

        if (is_one_of(name, {"add", "replace", "test"}) && !op.contains("value")) {
            errors.push_back(where + ": missing 'value'.");
        }

        if (is_one_of(name, {"move", "copy"})) {
            auto from_it = op.find("from");
            if (from_it == op.end() || !from_it->is_string()) {
                errors.push_back(where + ": missing 'from'.");
            } else {
                std::string problem = pointer_problem(from_it->get<std::string>());
                if (!problem.empty()) {
                    errors.push_back(where + ": " + problem);
                }
            }
        }
    }

    return errors;
}

} // namespace jpatch
