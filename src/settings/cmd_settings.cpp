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

#include <stdexcept>

#include <storm/exceptions/IllegalFunctionCallException.h>
#include <storm/exceptions/InvalidArgumentException.h>
#include <storm/utility/macros.h>

#include "settings/cmd_settings.hpp"

namespace spin_testgen::settings {

CmdSettings::CmdSettings() : _parser{"spin_testgen", VERSION} {
    _parser.add_description("Generates C tests from the counterexamples of Promela models and deploys them in the test tree.");
    _parser.add_argument("verb").help("The action to perform: help, clean, zero, generate, copy, compile or run.");
    _parser.add_argument("model")
        .help("The model to process. Required by clean, generate and copy, not allowed otherwise.")
        .default_value(std::string(""));
    _parser.add_argument("--config")
        .help("Path to the YAML configuration file.")
        .default_value(_loaded_settings.config_file);
    _parser.add_argument("--workdir")
        .help("Folder containing the model files. Defaults to the current folder.")
        .default_value(_loaded_settings.working_folder);
    _parser.add_argument("--verbose").help("Print the info messages of each step.").default_value(false).implicit_value(true);
}

void CmdSettings::parse(int argc, char* argv[]) {
    try {
        _parser.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        STORM_LOG_THROW(false, storm::exceptions::InvalidArgumentException, err.what());
    }
    const std::string verb_str = _parser.get<std::string>("verb");
    const std::string model = _parser.get<std::string>("model");
    const auto verb = parseVerb(verb_str);
    STORM_LOG_THROW(verb.has_value(), storm::exceptions::InvalidArgumentException, "Unknown verb '" << verb_str << "'.");
    STORM_LOG_THROW(
        verbRequiresModel(*verb) != model.empty(), storm::exceptions::InvalidArgumentException,
        "The verb '" << verb_str << "' " << (verbRequiresModel(*verb) ? "requires a model name." : "does not accept a model name."));
    _loaded_settings.verb = *verb;
    _loaded_settings.model = model;
    _loaded_settings.config_file = _parser.get<std::string>("--config");
    _loaded_settings.working_folder = _parser.get<std::string>("--workdir");
    _loaded_settings.verbose = _parser.get<bool>("--verbose");
    _parsing_done = true;
}

UserSettings CmdSettings::getSettings() const {
    STORM_LOG_THROW(_parsing_done, storm::exceptions::IllegalFunctionCallException, "Cannot get the settings before parsing them.");
    return _loaded_settings;
}

void CmdSettings::printUsage(std::ostream& out_stream) const {
    printVerbs(out_stream);
    out_stream << "\n" << _parser;
}

void printVerbs(std::ostream& out_stream) {
    out_stream << "USAGE:\n"
               << "help - these instructions\n"
               << "clean modelname - remove spin, test files\n"
               << "zero  - remove all testfiles from the test manifest\n"
               << "generate modelname - generate spin and test files\n"
               << "copy modelname - copy test files and configuration to the test tree\n"
               << "compile - compiles the tests\n"
               << "run - runs the tests\n";
}

}  // namespace spin_testgen::settings
