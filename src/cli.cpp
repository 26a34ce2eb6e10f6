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

#include <iostream>

#include "builder/command_line.hpp"
#include "process/process_runner.hpp"
#include "utils/storm_utilities.hpp"

int main(int argc, char* argv[]) {
    spin_testgen::utils::stormSetUp();
    spin_testgen::process::PosixProcessRunner process_runner;
    return spin_testgen::builder::runCommandLine(argc, argv, process_runner, std::cout, std::cerr);
}
