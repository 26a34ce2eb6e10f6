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

#include <fstream>

#include <storm/io/file.h>
#include <storm/utility/macros.h>

#include "exceptions/spin_testgen_exceptions.hpp"
#include "generation/trail_generator.hpp"
#include "naming/artifact_naming.hpp"
#include "utils/file_globbing.hpp"
#include "validation/readiness_validator.hpp"

namespace spin_testgen::generation {

TrailGenerator::TrailGenerator(
    const std::filesystem::path& working_folder, const std::string& checker_command, const std::string& generator_command,
    process::ProcessRunner& process_runner)
    : _working_folder{working_folder}, _checker_command{checker_command}, _generator_command{generator_command},
      _process_runner{process_runner} {}

GenerationResult TrailGenerator::generate(const std::string& model) const {
    naming::validateModelName(model);
    validation::validateReadiness(_working_folder, model);

    STORM_PRINT("Generating spin and test files for " << model << "\n");
    enumerateTrails(model);
    GenerationResult result;
    result.n_trails = utils::globFiles(_working_folder, naming::trailPattern(model)).size();
    if (result.n_trails == 0U) {
        STORM_PRINT("No trails found for model " << model << ": no test will be generated.\n");
        return result;
    }
    if (result.n_trails == 1U) {
        // Single trail: unindexed summary, generator called with the model name only
        result.spin_summary_files.emplace_back(replayTrail(model, std::nullopt));
        runGenerator(model, std::nullopt);
        return result;
    }
    for (size_t trail_offset = 0U; trail_offset < result.n_trails; trail_offset++) {
        result.spin_summary_files.emplace_back(replayTrail(model, trail_offset));
        runGenerator(model, trail_offset);
    }
    return result;
}

void TrailGenerator::enumerateTrails(const std::string& model) const {
    const std::vector<std::string> args{"-DTEST_GEN", "-run", "-E", "-c0", "-e", naming::descriptionFile(model)};
    const auto checker_result = _process_runner.get().run(_checker_command, args, _working_folder);
    STORM_PRINT(checker_result.output);
    // Leftover trails of an earlier run must not be used when the checker did not run at all
    STORM_LOG_THROW(
        checker_result.ranToCompletion(), exceptions::ExternalToolFailureException,
        "'" << process::toCommandLine(_checker_command, args) << "' could not run to completion (exit status "
            << checker_result.exit_status << ")");
    // The verifier reports found violations through its exit status as well: the trail files are what matters here
    STORM_LOG_WARN_COND(
        checker_result.succeeded(),
        "'" << process::toCommandLine(_checker_command, args) << "' returned exit status " << checker_result.exit_status);
}

std::filesystem::path TrailGenerator::replayTrail(const std::string& model, const std::optional<size_t>& trail_offset) const {
    const std::vector<std::string> args{"-T", naming::trailSelector(trail_offset), naming::descriptionFile(model)};
    const auto replay_result = _process_runner.get().run(_checker_command, args, _working_folder);
    STORM_LOG_THROW(
        replay_result.succeeded(), exceptions::ExternalToolFailureException,
        "'" << process::toCommandLine(_checker_command, args) << "' failed with exit status " << replay_result.exit_status);
    const std::filesystem::path summary_file = _working_folder / naming::spinSummaryFile(model, trail_offset);
    std::ofstream summary_stream;
    storm::io::openFile(summary_file.string(), summary_stream, false, true);
    summary_stream << replay_result.output;
    storm::io::closeFile(summary_stream);
    return summary_file;
}

void TrailGenerator::runGenerator(const std::string& model, const std::optional<size_t>& trail_offset) const {
    std::vector<std::string> args{model};
    if (trail_offset) {
        args.emplace_back(std::to_string(*trail_offset));
    }
    const auto generator_result = _process_runner.get().run(_generator_command, args, _working_folder);
    STORM_PRINT(generator_result.output);
    STORM_LOG_THROW(
        generator_result.succeeded(), exceptions::ExternalToolFailureException,
        "'" << process::toCommandLine(_generator_command, args) << "' failed with exit status " << generator_result.exit_status);
}

}  // namespace spin_testgen::generation
