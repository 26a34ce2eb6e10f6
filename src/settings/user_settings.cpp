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

#include <storm/exceptions/UnexpectedException.h>
#include <storm/utility/macros.h>

#include "settings/user_settings.hpp"

namespace spin_testgen::settings {

std::optional<Verb> parseVerb(const std::string& verb_str) {
    if (verb_str == "help") {
        return Verb::HELP;
    }
    if (verb_str == "clean") {
        return Verb::CLEAN;
    }
    if (verb_str == "zero") {
        return Verb::ZERO;
    }
    if (verb_str == "generate") {
        return Verb::GENERATE;
    }
    if (verb_str == "copy") {
        return Verb::COPY;
    }
    if (verb_str == "compile") {
        return Verb::COMPILE;
    }
    if (verb_str == "run") {
        return Verb::RUN;
    }
    return std::nullopt;
}

std::string toString(const Verb& verb) {
    switch (verb) {
        case Verb::HELP:
            return "help";
        case Verb::CLEAN:
            return "clean";
        case Verb::ZERO:
            return "zero";
        case Verb::GENERATE:
            return "generate";
        case Verb::COPY:
            return "copy";
        case Verb::COMPILE:
            return "compile";
        case Verb::RUN:
            return "run";
    }
    STORM_LOG_THROW(false, storm::exceptions::UnexpectedException, "Unknown verb.");
}

bool verbRequiresModel(const Verb& verb) {
    return verb == Verb::CLEAN || verb == Verb::GENERATE || verb == Verb::COPY;
}

}  // namespace spin_testgen::settings
