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

namespace spin_testgen::utils {
/*!
 * @brief Initialize the storm loggers and the default storm settings. Safe to call multiple times.
 */
void stormSetUp();

/*!
 * @brief Show the info messages (e.g. the exit status of each external tool) or only warnings and errors.
 * @param verbose Whether to log info messages
 */
void setVerboseLogging(const bool verbose);
}  // namespace spin_testgen::utils
