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

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace spin_testgen::validation {
/*!
 * @brief One of the input files required to generate the tests of a model.
 */
struct RequiredInput {
    std::string file_name;
    std::string description;
};

/*!
 * @brief The five files that must exist before generating the tests of a model.
 */
std::vector<RequiredInput> readinessSet(const std::string& model);

/*!
 * @brief Check the whole readiness set of a model, without stopping at the first missing file.
 * @param working_folder The folder containing the model files
 * @param model The model name
 * @return The required inputs that could not be found (empty if the model is ready).
 */
std::vector<RequiredInput> findMissingInputs(const std::filesystem::path& working_folder, const std::string& model);

/*!
 * @brief Throws a MissingInputException listing all missing inputs, if any.
 */
void validateReadiness(const std::filesystem::path& working_folder, const std::string& model);
}  // namespace spin_testgen::validation
