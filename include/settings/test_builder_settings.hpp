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

namespace spin_testgen::settings {
constexpr const char* const DEFAULT_CHECKER_COMMAND = "spin";
constexpr const char* const DEFAULT_BASELINE_SOURCE = "testsuites/validation/ts-model-0.c";

/*!
 * @brief Data structure holding all configurations required by spin_testgen
 */
struct TestBuilderSettings {
    // Folder containing the model files: all generated files are written here
    std::filesystem::path working_folder;
    // The model checker executable
    std::string checker_command;
    // The test generator (spin2test)
    std::string generator_command;
    // Root of the target tree (rtems): manifest entries are relative to it, the tests are compiled in it
    std::filesystem::path target_root;
    // Folder the simulator runs in (rsb)
    std::filesystem::path simulator_folder;
    // Simulator executable, optionally followed by some arguments
    std::string simulator_command;
    // The YAML build manifest (testyaml)
    std::filesystem::path manifest_path;
    // The folder receiving the test sources (testcode)
    std::filesystem::path test_code_folder;
    // The test executable to run in the simulator (testexe)
    std::string test_executable;
    // The only source left in the manifest after zeroing it
    std::string baseline_source;
};

/*!
 * @brief Load the settings from a YAML configuration file.
 *
 * Required keys: spin2test, rtems, rsb, simulator, testyaml, testcode, testexe. Optional keys: spin, baseline.
 * Relative paths are resolved with respect to the folder containing the configuration file.
 * Throws an InvalidSettingsException listing all missing keys, if any.
 * @param config_file Path to the YAML configuration file
 * @param working_folder Folder containing the model files
 */
TestBuilderSettings loadTestBuilderSettings(const std::filesystem::path& config_file, const std::filesystem::path& working_folder);
}  // namespace spin_testgen::settings
