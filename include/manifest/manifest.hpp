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

#include <yaml-cpp/yaml.h>

#include "manifest/source_set.hpp"

namespace spin_testgen::manifest {
// The key of the manifest holding the list of source files
constexpr const char* const SOURCE_KEY = "source";

/*!
 * @brief The YAML build manifest of the test configuration.
 *
 * Only the source list is interpreted: all other keys are written back as they were loaded.
 * The file is read, modified in memory and written back without any locking.
 */
class Manifest {
  public:
    Manifest() = delete;

    /*!
     * @brief Load a manifest from file.
     * Throws a ManifestParseException if the file is missing, it is not a YAML map or has no list of sources.
     */
    static Manifest load(const std::filesystem::path& manifest_path);

    /*!
     * @brief Write the manifest to file, with the sources sorted and without duplicates.
     */
    void save(const std::filesystem::path& manifest_path) const;

    /*!
     * @brief Add new sources to the existing ones.
     */
    void mergeSources(const std::vector<std::string>& new_sources);

    /*!
     * @brief Replace all the sources with a single baseline source.
     */
    void resetSources(const std::string& baseline_source);

    inline const SourceSet& getSources() const {
        return _sources;
    }

  private:
    Manifest(const YAML::Node& document, const SourceSet& sources);

    YAML::Node _document;
    SourceSet _sources;
};

/*!
 * @brief Load the manifest, drop all its sources except the baseline one and write it back.
 */
void resetManifest(const std::filesystem::path& manifest_path, const std::string& baseline_source);
}  // namespace spin_testgen::manifest
