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

#include <storm/exceptions/BaseException.h>
#include <storm/exceptions/ExceptionMacros.h>

// Filesystem failures (delete / copy / open) are reported with storm::exceptions::FileIoException,
// invalid settings with storm::exceptions::InvalidSettingsException.
namespace spin_testgen::exceptions {
using storm::exceptions::BaseException;

// One or more files of a model's readiness set are missing
STORM_NEW_EXCEPTION(MissingInputException)

// The build manifest is absent or malformed
STORM_NEW_EXCEPTION(ManifestParseException)

// An external tool (checker, generator, build tool, simulator) could not be run or returned non-zero
STORM_NEW_EXCEPTION(ExternalToolFailureException)
}  // namespace spin_testgen::exceptions
