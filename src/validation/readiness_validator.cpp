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

#include <sstream>

#include <storm/utility/macros.h>

#include "exceptions/spin_testgen_exceptions.hpp"
#include "naming/artifact_naming.hpp"
#include "validation/readiness_validator.hpp"

namespace spin_testgen::validation {

std::vector<RequiredInput> readinessSet(const std::string& model) {
    return {
        {naming::descriptionFile(model), "Promela description file"},
        {naming::preconditionFile(model), "preconditions header"},
        {naming::postconditionFile(model), "postconditions header"},
        {naming::runFile(model), "run header"},
        {naming::refinementFile(model), "refinement file"}};
}

std::vector<RequiredInput> findMissingInputs(const std::filesystem::path& working_folder, const std::string& model) {
    std::vector<RequiredInput> missing_inputs;
    for (const auto& required_input : readinessSet(model)) {
        if (!std::filesystem::is_regular_file(working_folder / required_input.file_name)) {
            STORM_LOG_ERROR("The " << required_input.description << " " << required_input.file_name << " does not exist for model " << model);
            missing_inputs.emplace_back(required_input);
        }
    }
    return missing_inputs;
}

void validateReadiness(const std::filesystem::path& working_folder, const std::string& model) {
    const auto missing_inputs = findMissingInputs(working_folder, model);
    if (missing_inputs.empty()) {
        return;
    }
    std::stringstream missing_list;
    for (size_t idx = 0U; idx < missing_inputs.size(); idx++) {
        missing_list << (idx == 0U ? "" : ", ") << missing_inputs[idx].file_name << " (" << missing_inputs[idx].description << ")";
    }
    STORM_LOG_THROW(
        false, exceptions::MissingInputException,
        "Model " << model << " is not ready for test generation, missing: " << missing_list.str());
}

}  // namespace spin_testgen::validation
