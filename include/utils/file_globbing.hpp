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

namespace spin_testgen::utils {
/*!
 * @brief Collect the regular files in a folder whose name matches a shell wildcard pattern.
 * @param folder The folder to look into (not recursive). A missing folder results in no matches.
 * @param pattern The pattern to match the file names against (e.g. "model*.trail").
 * @return The matching paths, sorted.
 */
std::vector<std::filesystem::path> globFiles(const std::filesystem::path& folder, const std::string& pattern);

/*!
 * @brief Collect the regular files in a folder matching at least one of the provided patterns.
 * @return The matching paths, sorted and without duplicates.
 */
std::vector<std::filesystem::path> globFiles(const std::filesystem::path& folder, const std::vector<std::string>& patterns);

/*!
 * @brief Remove all the provided files. Throws a FileIoException on the first failure, leaving the remaining files untouched.
 */
void removeFiles(const std::vector<std::filesystem::path>& files);

/*!
 * @brief Split a command string on whitespace, e.g. "sparc-rtems-sis -v" -> {"sparc-rtems-sis", "-v"}.
 */
std::vector<std::string> splitCommand(const std::string& command);
}  // namespace spin_testgen::utils
