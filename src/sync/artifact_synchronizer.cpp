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

#include <system_error>

#include <storm/exceptions/FileIoException.h>
#include <storm/exceptions/InvalidSettingsException.h>
#include <storm/utility/macros.h>

#include "manifest/manifest.hpp"
#include "naming/artifact_naming.hpp"
#include "sync/artifact_synchronizer.hpp"
#include "utils/file_globbing.hpp"

namespace spin_testgen::sync {
namespace {
// Absolute, normalized and without trailing separator
std::filesystem::path normalizeFolder(const std::filesystem::path& folder) {
    std::filesystem::path normalized = std::filesystem::absolute(folder).lexically_normal();
    if (!normalized.has_filename() && normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}
}  // namespace

ArtifactSynchronizer::ArtifactSynchronizer(
    const std::filesystem::path& source_folder, const std::filesystem::path& target_folder, const std::filesystem::path& target_root,
    const std::filesystem::path& manifest_path)
    : _source_folder{normalizeFolder(source_folder)}, _target_folder{normalizeFolder(target_folder)},
      _target_root{normalizeFolder(target_root)}, _manifest_path{manifest_path} {
    STORM_LOG_THROW(
        _source_folder != _target_folder, storm::exceptions::InvalidSettingsException,
        "The test files cannot be copied in the folder they are generated in: " << _source_folder);
    const auto target_relative = _target_folder.lexically_relative(_target_root);
    STORM_LOG_THROW(
        !target_relative.empty() && *target_relative.begin() != "..", storm::exceptions::InvalidSettingsException,
        "The target folder " << _target_folder << " is not inside the target root " << _target_root);
}

SyncResult ArtifactSynchronizer::synchronize(const std::string& model) const {
    naming::validateModelName(model);
    SyncResult result;
    STORM_PRINT("Removing old files for model " << model << "\n");
    result.removed_files = removeStaleFiles(model);
    STORM_PRINT("Copying new files for model " << model << "\n");
    result.copied_files = copyGeneratedFiles(model);
    STORM_PRINT("Updating " << _manifest_path.filename().string() << " for model " << model << "\n");
    result.manifest_entries = updateManifest(model);
    return result;
}

std::vector<std::filesystem::path> ArtifactSynchronizer::removeStaleFiles(const std::string& model) const {
    const auto stale_files = utils::globFiles(_target_folder, naming::testSourcePatterns(model));
    utils::removeFiles(stale_files);
    return stale_files;
}

std::vector<std::filesystem::path> ArtifactSynchronizer::copyGeneratedFiles(const std::string& model) const {
    std::vector<std::filesystem::path> copied_files;
    for (const auto& generated_file : utils::globFiles(_source_folder, naming::testSourcePatterns(model))) {
        const auto target_file = _target_folder / generated_file.filename();
        std::error_code err_code;
        std::filesystem::copy_file(generated_file, target_file, std::filesystem::copy_options::overwrite_existing, err_code);
        STORM_LOG_THROW(
            !err_code, storm::exceptions::FileIoException,
            "Cannot copy " << generated_file << " to " << target_file << ": " << err_code.message());
        copied_files.emplace_back(target_file);
    }
    return copied_files;
}

std::vector<std::string> ArtifactSynchronizer::updateManifest(const std::string& model) const {
    std::vector<std::string> new_entries;
    for (const auto& generated_file : utils::globFiles(_source_folder, naming::manifestSourcePatterns(model))) {
        new_entries.emplace_back(toManifestEntry(generated_file.filename()));
    }
    auto manifest = manifest::Manifest::load(_manifest_path);
    manifest.mergeSources(new_entries);
    manifest.save(_manifest_path);
    return new_entries;
}

std::string ArtifactSynchronizer::toManifestEntry(const std::filesystem::path& file_name) const {
    return (_target_folder / file_name).lexically_relative(_target_root).generic_string();
}

}  // namespace spin_testgen::sync
