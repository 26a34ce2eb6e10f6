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
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "process/process_runner.hpp"

namespace spin_testgen::generation {
/*!
 * @brief Summary of a generation run.
 */
struct GenerationResult {
    size_t n_trails = 0U;
    std::vector<std::filesystem::path> spin_summary_files;
};

/*!
 * @brief Runs the model checker on a model and turns each counterexample trail into test sources.
 *
 * The checker is run with "-DTEST_GEN -run -E -c0 -e <model>.pml". Each trail is then replayed with "-T -t[N]" into a
 * spin summary file and the test generator is called with the model name (and the 0-based trail offset, if more than
 * one trail exists). All processes run in the working folder, one after the other.
 */
class TrailGenerator {
  public:
    /*!
     * @brief Constructor
     * @param working_folder Folder containing the model files, where all generated files are written
     * @param checker_command The model checker executable (usually "spin")
     * @param generator_command The test generator executable (spin2test)
     * @param process_runner The object used to run the external tools
     */
    TrailGenerator(
        const std::filesystem::path& working_folder, const std::string& checker_command, const std::string& generator_command,
        process::ProcessRunner& process_runner);

    /*!
     * @brief Generate the spin summary files and the test sources for a model.
     * Throws a MissingInputException before running anything if the model is not ready.
     * @param model The model name
     * @return The number of trails found and the spin summary files written
     */
    GenerationResult generate(const std::string& model) const;

  private:
    void enumerateTrails(const std::string& model) const;

    std::filesystem::path replayTrail(const std::string& model, const std::optional<size_t>& trail_offset) const;

    void runGenerator(const std::string& model, const std::optional<size_t>& trail_offset) const;

    const std::filesystem::path _working_folder;
    const std::string _checker_command;
    const std::string _generator_command;
    std::reference_wrapper<process::ProcessRunner> _process_runner;
};
}  // namespace spin_testgen::generation
