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

#include "utils/storm_utilities.hpp"

#include <storm/settings/SettingsManager.h>
#include <storm/utility/initialize.h>

namespace spin_testgen::utils {
void stormSetUp() {
    // Ensure we do this only once
    static bool needs_init = true;
    if (needs_init) {
        // Init loggers
        storm::utility::setUp();
        storm::settings::initializeAll("spin_testgen", "spin_testgen");
        needs_init = false;
    }
}

void setVerboseLogging(const bool verbose) {
    storm::utility::setLogLevel(verbose ? l3pp::LogLevel::INFO : l3pp::LogLevel::WARN);
}
}  // namespace spin_testgen::utils
