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

#include <algorithm>
#include <sstream>
#include <system_error>

#include <storm/exceptions/FileIoException.h>
#include <storm/utility/macros.h>

#include "naming/artifact_naming.hpp"
#include "utils/file_globbing.hpp"

namespace spin_testgen::utils {

std::vector<std::filesystem::path> globFiles(const std::filesystem::path& folder, const std::string& pattern) {
    std::vector<std::filesystem::path> matches;
    std::error_code err_code;
    if (!std::filesystem::is_directory(folder, err_code)) {
        return matches;
    }
    for (const auto& entry : std::filesystem::directory_iterator(folder)) {
        if (entry.is_regular_file() && naming::matchesPattern(entry.path().filename().string(), pattern)) {
            matches.emplace_back(entry.path());
        }
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

std::vector<std::filesystem::path> globFiles(const std::filesystem::path& folder, const std::vector<std::string>& patterns) {
    std::vector<std::filesystem::path> matches;
    for (const auto& pattern : patterns) {
        const auto pattern_matches = globFiles(folder, pattern);
        matches.insert(matches.end(), pattern_matches.begin(), pattern_matches.end());
    }
    std::sort(matches.begin(), matches.end());
    matches.erase(std::unique(matches.begin(), matches.end()), matches.end());
    return matches;
}

void removeFiles(const std::vector<std::filesystem::path>& files) {
    for (const auto& file : files) {
        std::error_code err_code;
        const bool removed = std::filesystem::remove(file, err_code);
        STORM_LOG_THROW(
            removed && !err_code, storm::exceptions::FileIoException,
            "Cannot remove " << file << (err_code ? ": " + err_code.message() : std::string{": file not found"}));
    }
}

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> tokens;
    std::stringstream command_stream(command);
    std::string token;
    while (command_stream >> token) {
        tokens.emplace_back(token);
    }
    return tokens;
}

}  // namespace spin_testgen::utils
