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

#include <storm/utility/macros.h>

#include "cleanup/cleanup_engine.hpp"
#include "naming/artifact_naming.hpp"
#include "utils/file_globbing.hpp"

namespace spin_testgen::cleanup {

CleanupEngine::CleanupEngine(const std::filesystem::path& working_folder) : _working_folder{working_folder} {}

std::vector<std::filesystem::path> CleanupEngine::clean(const std::string& model) const {
    naming::validateModelName(model);
    STORM_PRINT("Removing spin and test files for " << model << "\n");
    std::vector<std::filesystem::path> files_to_remove = utils::globFiles(_working_folder, naming::VERIFIER_BINARY);
    const auto trail_files = utils::globFiles(_working_folder, naming::trailPattern(model));
    files_to_remove.insert(files_to_remove.end(), trail_files.begin(), trail_files.end());
    const auto summary_files = utils::globFiles(_working_folder, naming::spinSummaryPattern(model));
    files_to_remove.insert(files_to_remove.end(), summary_files.begin(), summary_files.end());
    const std::string source_pattern =
        trail_files.size() == 1U ? naming::generatedSourceFile(model) : naming::indexedGeneratedSourcePattern(model);
    const auto source_files = utils::globFiles(_working_folder, source_pattern);
    files_to_remove.insert(files_to_remove.end(), source_files.begin(), source_files.end());
    utils::removeFiles(files_to_remove);
    return files_to_remove;
}

}  // namespace spin_testgen::cleanup
