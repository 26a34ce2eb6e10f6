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

namespace spin_testgen::cleanup {
/*!
 * @brief Removes the files generated for a model from the working folder. The manifest is left untouched.
 */
class CleanupEngine {
  public:
    explicit CleanupEngine(const std::filesystem::path& working_folder);

    /*!
     * @brief Remove the verifier binary, the trails, the spin summaries and the generated trail sources of a model.
     *
     * The trail sources to remove depend on the number of trail files found when the cleanup starts: "tr-<model>.c" if
     * there is exactly one, "tr-<model>-*.c" otherwise. This count may differ from the one seen during generation.
     * @param model The model name
     * @return The removed files
     */
    std::vector<std::filesystem::path> clean(const std::string& model) const;

  private:
    const std::filesystem::path _working_folder;
};
}  // namespace spin_testgen::cleanup
