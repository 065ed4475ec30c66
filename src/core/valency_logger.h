/*
 * <Valency Logging System>
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

#include <fmt/color.h>
#include <fmt/core.h>

#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>
#include <utility>

/**
 * @brief Unified console output with verbosity levels and optional colors
 *
 * Verbosity: 0 silent (errors only), 1 normal, 2 informative, 3 verbose.
 * Colors are disabled automatically if stdout is not a terminal or
 * VALENCY_NO_COLOR is set.
 */
class ValencyLogger {
private:
    static int m_verbosity;
    static bool m_use_colors;

public:
    static void set_verbosity(int level) { m_verbosity = level; }

    // Initialize logger with environment detection
    static void initialize(int verbosity = 1, bool auto_detect_colors = true);

    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void success(const std::string& msg);
    static void info(const std::string& msg);
    static void debug(const std::string& msg);

    static void param(const std::string& key, const std::string& value);
    static void param(const std::string& key, const char* value);
    static void param(const std::string& key, int value);
    static void param(const std::string& key, double value);
    static void param(const std::string& key, bool value);

    static void param_table(const nlohmann::json& parameters, const std::string& title = "Parameters");

    static void result_raw(const std::string& data);
    static void progress(int current, int total, const std::string& msg);
    static void header(const std::string& title);

    // Energy in simulation units and temperature in Kelvin
    static void energy(double value, const std::string& label);
    static void temperature(double kelvin, const std::string& label);

    template <typename... Args>
    static void error_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        error(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        warn(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void success_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        success(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        info(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        if (m_verbosity >= 3)
            debug(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename T>
    static void param_value(const std::string& key, const T& value)
    {
        if constexpr (std::is_same_v<T, bool>) {
            param(key, value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            param(key, value);
        } else if constexpr (std::is_integral_v<T>) {
            param(key, static_cast<int>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            param(key, static_cast<double>(value));
        } else {
            param(key, fmt::format("{}", value));
        }
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain = false);
    static void log_plain(const std::string& msg);
    static std::string format_json_value(const nlohmann::json& value);
};
