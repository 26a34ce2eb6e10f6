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

namespace spin_testgen::process {
// Exit status of a command that could not be executed (as in POSIX shells)
constexpr int EXIT_STATUS_NOT_EXECUTED = 127;
// A process killed by signal n gets exit status EXIT_STATUS_SIGNAL_BASE + n
constexpr int EXIT_STATUS_SIGNAL_BASE = 128;

/*!
 * @brief Outcome of an external process invocation.
 */
struct ProcessResult {
    int exit_status = 0;
    // Everything the process wrote on its standard output
    std::string output;

    inline bool succeeded() const {
        return exit_status == 0;
    }

    /*!
     * @brief Whether the process was started and exited by itself, regardless of the exit status it reported.
     */
    inline bool ranToCompletion() const {
        return exit_status >= 0 && exit_status < EXIT_STATUS_NOT_EXECUTED;
    }
};

/*!
 * @brief Interface for running external tools (model checker, test generator, build tool, simulator).
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    /*!
     * @brief Run a command and block until it terminates.
     * @param command The executable to run, looked up in PATH if it contains no '/'
     * @param args The arguments to pass to the executable
     * @param working_folder The folder the process runs in
     * @return The exit status and the captured standard output
     */
    virtual ProcessResult run(
        const std::string& command, const std::vector<std::string>& args, const std::filesystem::path& working_folder) = 0;
};

/*!
 * @brief ProcessRunner based on fork / execvp. Standard error is inherited from the parent process.
 * A command that cannot be executed results in exit status 127, a process killed by a signal in 128 + signal.
 */
class PosixProcessRunner : public ProcessRunner {
  public:
    ProcessResult run(
        const std::string& command, const std::vector<std::string>& args, const std::filesystem::path& working_folder) override;
};

/*!
 * @brief Join a command and its arguments in a printable string.
 */
std::string toCommandLine(const std::string& command, const std::vector<std::string>& args);
}  // namespace spin_testgen::process
