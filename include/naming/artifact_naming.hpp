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
#include <vector>

/*!
 * @brief Names of the files read and produced for a model.
 *
 * A trail offset is the 0-based position of a trail when the checker produced more than one.
 * std::nullopt identifies the single, unindexed trail.
 */
namespace spin_testgen::naming {
// The verifier binary compiled by spin in the working folder
constexpr const char* const VERIFIER_BINARY = "pan";

/*!
 * @brief Make sure the model name can be used as a file stem in the working folder.
 * Throws an InvalidArgumentException if it is empty or contains path separators.
 */
void validateModelName(const std::string& model);

// Readiness set
std::string descriptionFile(const std::string& model);
std::string preconditionFile(const std::string& model);
std::string postconditionFile(const std::string& model);
std::string runFile(const std::string& model);
std::string refinementFile(const std::string& model);

std::string trailPattern(const std::string& model);
std::string spinSummaryPattern(const std::string& model);

/*!
 * @brief Name of the file the replay of a trail is written to.
 * @param model The model name
 * @param trail_offset The 0-based trail offset, or std::nullopt when a single trail exists
 * @return "<model>.spn" or "<model>-<offset>.spn"
 */
std::string spinSummaryFile(const std::string& model, const std::optional<size_t>& trail_offset);

/*!
 * @brief The checker argument selecting the trail to replay.
 * @param trail_offset The 0-based trail offset, or std::nullopt when a single trail exists
 * @return "-t" or "-t<offset + 1>"
 */
std::string trailSelector(const std::optional<size_t>& trail_offset);

// Test sources and headers produced by the generator
std::vector<std::string> testSourcePatterns(const std::string& model);
// The subset of testSourcePatterns tracked in the build manifest (no headers)
std::vector<std::string> manifestSourcePatterns(const std::string& model);

std::string generatedSourceFile(const std::string& model);
std::string indexedGeneratedSourcePattern(const std::string& model);

/*!
 * @brief Check a file name against a shell wildcard pattern ('*', '?' and bracket expressions).
 */
bool matchesPattern(const std::string& file_name, const std::string& pattern);
}  // namespace spin_testgen::naming
