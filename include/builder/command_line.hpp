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

#include <ostream>

#include "process/process_runner.hpp"

namespace spin_testgen::builder {
/*!
 * @brief Parse the command line, load the configuration and execute the requested verb.
 * An invalid command line prints the usage on out_stream, a failing verb prints the error on err_stream.
 * @param argc Number of arguments provided to the program
 * @param argv Array of arguments provided to the program
 * @param process_runner Runs the external tools
 * @param out_stream Stream for the usage message
 * @param err_stream Stream for the failure message
 * @return The program exit status: EXIT_SUCCESS or EXIT_FAILURE
 */
int runCommandLine(int argc, char* argv[], process::ProcessRunner& process_runner, std::ostream& out_stream, std::ostream& err_stream);
}  // namespace spin_testgen::builder
