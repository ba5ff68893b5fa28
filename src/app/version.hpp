/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <string>

#define PADLINK_VERSION_BASE "0.1.0"
#define PADLINK_VERSION_STAGE "release"

#ifndef PADLINK_COMMIT_COUNT
#define PADLINK_COMMIT_COUNT "0"
#endif

namespace padlink::app {

inline const std::string& version_string() {
    static const std::string v = [] {
        const std::string base  = PADLINK_VERSION_BASE;
        const std::string stage = PADLINK_VERSION_STAGE;
        const std::string cnt   = PADLINK_COMMIT_COUNT;

        if (stage == "release") {
            return base + "+" + cnt;
        }
        return base + "-" + stage + "+" + cnt;
    }();
    return v;
}

} // namespace padlink::app
