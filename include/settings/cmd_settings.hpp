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
#include "settings/user_settings.hpp"
#include <argparse/argparse.hpp>
#include <ostream>

namespace spin_testgen::settings {
constexpr const char* const VERSION = "0.1.0";

/*!
 * @brief Class for generating the settings from the command line arguments
 */
class CmdSettings {
  public:
    /*!
     * @brief Constructor: it declares the available cmd arguments
     */
    CmdSettings();

    /*!
     * @brief Perform the actual reading from the user input.
     * Throws an InvalidArgumentException if the arguments do not match one of the available verbs.
     * @param argc Number of arguments provided to the program
     * @param argv Array of arguments provided to the program
     */
    void parse(int argc, char* argv[]);

    UserSettings getSettings() const;

    /*!
     * @brief Print the list of verbs and the available options.
     */
    void printUsage(std::ostream& out_stream) const;

  private:
    argparse::ArgumentParser _parser;
    bool _parsing_done = false;
    UserSettings _loaded_settings;
};

/*!
 * @brief Print the verbs table.
 */
void printVerbs(std::ostream& out_stream);
}  // namespace spin_testgen::settings
