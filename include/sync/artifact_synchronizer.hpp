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

namespace spin_testgen::sync {
/*!
 * @brief What a synchronization changed.
 */
struct SyncResult {
    std::vector<std::filesystem::path> removed_files;
    std::vector<std::filesystem::path> copied_files;
    // The entries (relative to the target root) merged into the manifest
    std::vector<std::string> manifest_entries;
};

/*!
 * @brief Deploys the generated test files of a model in the target tree and registers them in the manifest.
 *
 * The model's files in the target folder are replaced by the freshly generated ones. The manifest entries only grow:
 * files removed from the target folder are not removed from the manifest. Nothing is rolled back if a file operation
 * fails halfway.
 */
class ArtifactSynchronizer {
  public:
    /*!
     * @brief Constructor
     * @param source_folder Folder where the test files were generated
     * @param target_folder Folder receiving the test files, it must be inside target_root
     * @param target_root Root of the target tree: manifest entries are relative to it
     * @param manifest_path Path to the YAML manifest to update
     */
    ArtifactSynchronizer(
        const std::filesystem::path& source_folder, const std::filesystem::path& target_folder,
        const std::filesystem::path& target_root, const std::filesystem::path& manifest_path);

    SyncResult synchronize(const std::string& model) const;

  private:
    std::vector<std::filesystem::path> removeStaleFiles(const std::string& model) const;

    std::vector<std::filesystem::path> copyGeneratedFiles(const std::string& model) const;

    std::vector<std::string> updateManifest(const std::string& model) const;

    std::string toManifestEntry(const std::filesystem::path& file_name) const;

    const std::filesystem::path _source_folder;
    const std::filesystem::path _target_folder;
    const std::filesystem::path _target_root;
    const std::filesystem::path _manifest_path;
};
}  // namespace spin_testgen::sync
