/*
 * <Some global definitions for the bonding engine.>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

#include "src/core/valency_logger.h"

// for convenience
using json = nlohmann::json;

const double pi = 3.14159265359;

typedef Eigen::Vector3d Position;

typedef std::pair<int, int> IntPair;
typedef std::vector<std::string> StringList;

/*! \brief Unordered atom pair as (min, max) */
inline IntPair OrderedPair(int a, int b)
{
    return a < b ? IntPair(a, b) : IntPair(b, a);
}

/*! \brief Canonical "min-max" key of an atom pair, used as bond id */
inline std::string PairKey(int a, int b)
{
    IntPair pair = OrderedPair(a, b);
    return std::to_string(pair.first) + "-" + std::to_string(pair.second);
}

/*! \brief Parse "-command -key value ..." into {"command": {"key": value}}
 *
 * Numbers become doubles, "true"/"false" and bare flags become booleans,
 * everything else stays a string. "-verbose" and "-silent" map to verbosity.
 */
inline json CLI2Json(int argc, char** argv)
{
    json controller;
    json key = json::object();
    if (argc < 2)
        return controller;

    std::string keyword = argv[1];
    if (!keyword.empty() && keyword[0] == '-')
        keyword.erase(0, 1);

    for (int i = 2; i < argc; ++i) {
        std::string current = argv[i];
        if (current.empty() || current[0] != '-')
            continue;
        current.erase(0, 1);

        if (current == "silent" || current == "quiet") {
            key["verbosity"] = 0;
            continue;
        } else if (current == "verbose") {
            key["verbosity"] = 3;
            continue;
        }

        if ((i + 1) >= argc || argv[i + 1][0] == '-' || argv[i + 1] == std::string("true")) {
            key[current] = true;
        } else if (argv[i + 1] == std::string("false")) {
            key[current] = false;
            ++i;
        } else {
            std::string next = argv[i + 1];
            bool isNumber = next.find(",") == std::string::npos;
            if (isNumber) {
                try {
                    std::size_t consumed = 0;
                    std::stod(next, &consumed);
                    isNumber = consumed == next.size();
                } catch (const std::invalid_argument&) {
                    isNumber = false;
                }
            }
            if (isNumber)
                key[current] = std::stod(next);
            else
                key[current] = next;
            ++i;
        }
    }
    controller[keyword] = key;
    return controller;
}
