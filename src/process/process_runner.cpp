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

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <storm/utility/macros.h>

#include "exceptions/spin_testgen_exceptions.hpp"
#include "process/process_runner.hpp"

namespace spin_testgen::process {

ProcessResult PosixProcessRunner::run(
    const std::string& command, const std::vector<std::string>& args, const std::filesystem::path& working_folder) {
    // Prepare everything before forking: the child only calls async-signal-safe functions
    std::vector<std::string> argv_strings;
    argv_strings.reserve(args.size() + 1U);
    argv_strings.emplace_back(command);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_strings.size() + 1U);
    for (auto& arg : argv_strings) {
        argv.emplace_back(arg.data());
    }
    argv.emplace_back(nullptr);
    const std::string working_folder_str = working_folder.string();

    std::array<int, 2> pipe_fds{-1, -1};
    const bool pipe_created = ::pipe(pipe_fds.data()) == 0;
    const int pipe_errno = errno;
    STORM_LOG_THROW(
        pipe_created, exceptions::ExternalToolFailureException,
        "Cannot create the output pipe for " << command << ": " << std::strerror(pipe_errno));
    // Avoid the child inheriting pending output
    std::cout.flush();
    const pid_t child_pid = ::fork();
    if (child_pid < 0) {
        const int fork_errno = errno;
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        STORM_LOG_THROW(false, exceptions::ExternalToolFailureException, "Cannot fork to run " << command << ": " << std::strerror(fork_errno));
    }
    if (child_pid == 0) {
        ::close(pipe_fds[0]);
        if (::dup2(pipe_fds[1], STDOUT_FILENO) < 0) {
            ::_exit(EXIT_STATUS_NOT_EXECUTED);
        }
        ::close(pipe_fds[1]);
        if (!working_folder_str.empty() && ::chdir(working_folder_str.c_str()) != 0) {
            ::_exit(EXIT_STATUS_NOT_EXECUTED);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(EXIT_STATUS_NOT_EXECUTED);
    }

    ::close(pipe_fds[1]);
    ProcessResult result;
    std::array<char, 4096U> buffer;
    while (true) {
        const ssize_t n_read = ::read(pipe_fds[0], buffer.data(), buffer.size());
        if (n_read > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n_read));
        } else if (n_read == 0) {
            break;
        } else if (errno != EINTR) {
            STORM_LOG_WARN("Stopped reading the output of " << command << ": " << std::strerror(errno));
            break;
        }
    }
    ::close(pipe_fds[0]);

    int wait_status = 0;
    while (::waitpid(child_pid, &wait_status, 0) == -1) {
        const int wait_errno = errno;
        STORM_LOG_THROW(
            wait_errno == EINTR, exceptions::ExternalToolFailureException,
            "Cannot wait for " << command << " to terminate: " << std::strerror(wait_errno));
    }
    if (WIFEXITED(wait_status)) {
        result.exit_status = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.exit_status = EXIT_STATUS_SIGNAL_BASE + WTERMSIG(wait_status);
    } else {
        result.exit_status = -1;
    }
    STORM_LOG_INFO("'" << toCommandLine(command, args) << "' terminated with exit status " << result.exit_status);
    return result;
}

std::string toCommandLine(const std::string& command, const std::vector<std::string>& args) {
    std::string command_line = command;
    for (const auto& arg : args) {
        command_line += " " + arg;
    }
    return command_line;
}

}  // namespace spin_testgen::process
