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

#include <set>
#include <string>
#include <vector>

namespace spin_testgen::manifest {
/*!
 * @brief The set of source files of a build configuration.
 * Entries are unique and always iterated in lexicographic order, independently from the insertion order.
 */
class SourceSet {
  public:
    using const_iterator = std::set<std::string>::const_iterator;

    SourceSet() = default;

    explicit SourceSet(const std::vector<std::string>& sources);

    /*!
     * @brief Add a source to the set.
     * @return true if the source was not in the set yet
     */
    bool insert(const std::string& source);

    /*!
     * @brief Union of the current sources with the provided ones. Duplicates are silently ignored.
     */
    void merge(const std::vector<std::string>& sources);

    /*!
     * @brief Drop all the sources and keep only the baseline one.
     */
    void reset(const std::string& baseline_source);

    inline bool contains(const std::string& source) const {
        return _sources.contains(source);
    }

    inline size_t size() const {
        return _sources.size();
    }

    inline bool empty() const {
        return _sources.empty();
    }

    inline const_iterator begin() const {
        return _sources.begin();
    }

    inline const_iterator end() const {
        return _sources.end();
    }

    std::vector<std::string> toSortedVector() const;

    bool operator==(const SourceSet& other) const = default;

  private:
    std::set<std::string> _sources;
};
}  // namespace spin_testgen::manifest
