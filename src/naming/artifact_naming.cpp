/*
 * Copyright (c) 2025 Robert Bosch GmbH and its subsidiaries
 *
 * This file is part of spin_testgen.
 *
 * spin_testgen is free software: you can redistribute it and/or modify it under the terms of
 * the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * spin_testgen is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with spin_testgen.
 * If not, see <https://www.gnu.org/licenses/>.
 */

#include <fnmatch.h>

#include <storm/exceptions/InvalidArgumentException.h>
#include <storm/utility/macros.h>

#include "naming/artifact_naming.hpp"

namespace spin_testgen::naming {

void validateModelName(const std::string& model) {
    STORM_LOG_THROW(!model.empty(), storm::exceptions::InvalidArgumentException, "The model name is empty.");
    STORM_LOG_THROW(
        model.find_first_of("/\\") == std::string::npos, storm::exceptions::InvalidArgumentException,
        "The model name '" << model << "' contains path separators.");
    STORM_LOG_THROW(
        model != "." && model != "..", storm::exceptions::InvalidArgumentException, "The model name '" << model << "' is not valid.");
}

std::string descriptionFile(const std::string& model) {
    return model + ".pml";
}

std::string preconditionFile(const std::string& model) {
    return model + "-pre.h";
}

std::string postconditionFile(const std::string& model) {
    return model + "-post.h";
}

std::string runFile(const std::string& model) {
    return model + "-run.h";
}

std::string refinementFile(const std::string& model) {
    return model + "-rfn.yml";
}

std::string trailPattern(const std::string& model) {
    return model + "*.trail";
}

std::string spinSummaryPattern(const std::string& model) {
    return model + "*.spn";
}

std::string spinSummaryFile(const std::string& model, const std::optional<size_t>& trail_offset) {
    if (!trail_offset) {
        return model + ".spn";
    }
    return model + "-" + std::to_string(*trail_offset) + ".spn";
}

std::string trailSelector(const std::optional<size_t>& trail_offset) {
    if (!trail_offset) {
        return "-t";
    }
    // spin counts trails from 1
    return "-t" + std::to_string(*trail_offset + 1U);
}

std::vector<std::string> testSourcePatterns(const std::string& model) {
    return {"tr-" + model + "*.c", "tr-" + model + "*.h", "tc-" + model + "*.c"};
}

std::vector<std::string> manifestSourcePatterns(const std::string& model) {
    return {"tr-" + model + "*.c", "tc-" + model + "*.c"};
}

std::string generatedSourceFile(const std::string& model) {
    return "tr-" + model + ".c";
}

std::string indexedGeneratedSourcePattern(const std::string& model) {
    return "tr-" + model + "-*.c";
}

bool matchesPattern(const std::string& file_name, const std::string& pattern) {
    return ::fnmatch(pattern.c_str(), file_name.c_str(), 0) == 0;
}

}  // namespace spin_testgen::naming
