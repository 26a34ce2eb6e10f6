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

#include <cstdlib>
#include <exception>
#include <filesystem>

#include <storm/exceptions/BaseException.h>

#include "builder/command_line.hpp"
#include "builder/test_builder.hpp"
#include "settings/cmd_settings.hpp"
#include "settings/test_builder_settings.hpp"
#include "utils/storm_utilities.hpp"

namespace spin_testgen::builder {

int runCommandLine(int argc, char* argv[], process::ProcessRunner& process_runner, std::ostream& out_stream, std::ostream& err_stream) {
    // Get the Cmd Arguments
    settings::CmdSettings cmd_settings;
    try {
        cmd_settings.parse(argc, argv);
    } catch (const storm::exceptions::BaseException&) {
        cmd_settings.printUsage(out_stream);
        return EXIT_FAILURE;
    }
    const auto user_settings = cmd_settings.getSettings();
    utils::setVerboseLogging(user_settings.verbose);
    try {
        const std::filesystem::path working_folder = user_settings.working_folder.empty()
                                                         ? std::filesystem::current_path()
                                                         : std::filesystem::absolute(user_settings.working_folder);
        // The configuration must be complete, whatever the verb
        const auto builder_settings = settings::loadTestBuilderSettings(user_settings.config_file, working_folder);
        const TestBuilder test_builder(builder_settings, process_runner);
        test_builder.execute(user_settings);
    } catch (const std::exception& err) {
        err_stream << "spin_testgen " << settings::toString(user_settings.verb) << " failed: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}  // namespace spin_testgen::builder
