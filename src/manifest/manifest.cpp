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

#include <storm/exceptions/FileIoException.h>
#include <storm/io/file.h>
#include <storm/utility/macros.h>

#include "exceptions/spin_testgen_exceptions.hpp"
#include "manifest/manifest.hpp"

namespace spin_testgen::manifest {

Manifest::Manifest(const YAML::Node& document, const SourceSet& sources) : _document{document}, _sources{sources} {}

Manifest Manifest::load(const std::filesystem::path& manifest_path) {
    STORM_LOG_THROW(
        std::filesystem::is_regular_file(manifest_path), exceptions::ManifestParseException,
        "The manifest " << manifest_path << " does not exist.");
    YAML::Node document;
    try {
        document = YAML::LoadFile(manifest_path.string());
    } catch (const YAML::Exception& yaml_error) {
        STORM_LOG_THROW(
            false, exceptions::ManifestParseException, "Cannot parse the manifest " << manifest_path << ": " << yaml_error.what());
    }
    STORM_LOG_THROW(document.IsMap(), exceptions::ManifestParseException, "The manifest " << manifest_path << " is not a YAML map.");
    // Const access, to avoid adding the key to the document
    const YAML::Node& const_document = document;
    const YAML::Node source_list = const_document[SOURCE_KEY];
    STORM_LOG_THROW(
        source_list.IsDefined() && source_list.IsSequence(), exceptions::ManifestParseException,
        "The manifest " << manifest_path << " has no '" << SOURCE_KEY << "' list.");
    SourceSet sources;
    for (const auto& source_entry : source_list) {
        STORM_LOG_THROW(
            source_entry.IsScalar(), exceptions::ManifestParseException,
            "The manifest " << manifest_path << " contains a source entry that is not a path.");
        sources.insert(source_entry.as<std::string>());
    }
    return Manifest(document, sources);
}

void Manifest::save(const std::filesystem::path& manifest_path) const {
    YAML::Node document = YAML::Clone(_document);
    YAML::Node source_list(YAML::NodeType::Sequence);
    for (const auto& source : _sources) {
        source_list.push_back(source);
    }
    document[SOURCE_KEY] = source_list;
    YAML::Emitter emitter;
    emitter << document;
    STORM_LOG_THROW(
        emitter.good(), storm::exceptions::FileIoException,
        "Cannot serialize the manifest " << manifest_path << ": " << emitter.GetLastError());
    std::ofstream manifest_stream;
    storm::io::openFile(manifest_path.string(), manifest_stream, false, true);
    manifest_stream << emitter.c_str() << "\n";
    storm::io::closeFile(manifest_stream);
}

void Manifest::mergeSources(const std::vector<std::string>& new_sources) {
    _sources.merge(new_sources);
}

void Manifest::resetSources(const std::string& baseline_source) {
    _sources.reset(baseline_source);
}

void resetManifest(const std::filesystem::path& manifest_path, const std::string& baseline_source) {
    STORM_PRINT("Zeroing " << manifest_path.filename().string() << "\n");
    auto manifest = Manifest::load(manifest_path);
    manifest.resetSources(baseline_source);
    manifest.save(manifest_path);
}

}  // namespace spin_testgen::manifest
