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

#include <optional>
#include <string>

namespace spin_testgen::settings {
enum class Verb { HELP, CLEAN, ZERO, GENERATE, COPY, COMPILE, RUN };

/*!
 * @brief Get the verb matching the provided string, if any.
 */
std::optional<Verb> parseVerb(const std::string& verb_str);

std::string toString(const Verb& verb);

/*!
 * @brief Whether the verb operates on a single model (clean, generate, copy).
 */
bool verbRequiresModel(const Verb& verb);

/*!
 * @brief The settings provided on the command line.
 */
struct UserSettings {
    Verb verb = Verb::HELP;
    std::string model = "";
    std::string config_file = "testbuilder.yml";
    // Empty means: the current folder when the program starts
    std::string working_folder = "";
    bool verbose = false;
};
}  // namespace spin_testgen::settings
