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

#include "manifest/source_set.hpp"

namespace spin_testgen::manifest {

SourceSet::SourceSet(const std::vector<std::string>& sources) : _sources{sources.begin(), sources.end()} {}

bool SourceSet::insert(const std::string& source) {
    return _sources.emplace(source).second;
}

void SourceSet::merge(const std::vector<std::string>& sources) {
    _sources.insert(sources.begin(), sources.end());
}

void SourceSet::reset(const std::string& baseline_source) {
    _sources.clear();
    _sources.emplace(baseline_source);
}

std::vector<std::string> SourceSet::toSortedVector() const {
    return {_sources.begin(), _sources.end()};
}

}  // namespace spin_testgen::manifest
