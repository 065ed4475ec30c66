/*
 * <Valency Logging System Implementation>
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

#include "src/core/valency_logger.h"

#include <algorithm>
#include <cstdlib>

#include <unistd.h>

int ValencyLogger::m_verbosity = 1;
bool ValencyLogger::m_use_colors = true;

void ValencyLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;
    if (auto_detect_colors)
        m_use_colors = isatty(STDOUT_FILENO) && (std::getenv("VALENCY_NO_COLOR") == nullptr);
}

void ValencyLogger::error(const std::string& msg)
{
    // Errors always visible
    log_colored(fmt::color::red, "[ERROR] ", msg);
}

void ValencyLogger::warn(const std::string& msg)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::orange, "[WARN]  ", msg);
}

void ValencyLogger::success(const std::string& msg)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::lime_green, "[OK]    ", msg);
}

void ValencyLogger::info(const std::string& msg)
{
    if (m_verbosity >= 2)
        log_plain("        " + msg);
}

void ValencyLogger::debug(const std::string& msg)
{
    if (m_verbosity >= 3)
        log_colored(fmt::color::magenta, "[DEBUG] ", msg);
}

void ValencyLogger::param(const std::string& key, const std::string& value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + value);
}

void ValencyLogger::param(const std::string& key, const char* value)
{
    param(key, std::string(value));
}

void ValencyLogger::param(const std::string& key, int value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + std::to_string(value));
}

void ValencyLogger::param(const std::string& key, double value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", fmt::format("{}: {:.6g}", key, value));
}

void ValencyLogger::param(const std::string& key, bool value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + (value ? "true" : "false"));
}

void ValencyLogger::param_table(const nlohmann::json& parameters, const std::string& title)
{
    if (m_verbosity < 1 || parameters.empty())
        return;

    log_colored(fmt::color::cyan, "[TABLE] ", title);
    log_plain("        " + std::string(title.length() + 8, '-'));

    size_t max_key_length = 0;
    for (const auto& item : parameters.items())
        max_key_length = std::max(max_key_length, item.key().length());

    for (const auto& item : parameters.items()) {
        std::string padded_key = item.key();
        padded_key.resize(max_key_length, ' ');
        log_colored(fmt::color::cornflower_blue, "        ", padded_key + " : " + format_json_value(item.value()));
    }
    log_plain("");
}

void ValencyLogger::result_raw(const std::string& data)
{
    // Raw results for scripting - no colors, no prefix
    fmt::print("{}\n", data);
}

void ValencyLogger::progress(int current, int total, const std::string& msg)
{
    if (m_verbosity < 2 || total <= 0)
        return;
    double percent = (100.0 * current) / total;
    log_colored(fmt::color::yellow, "[PROG]  ", fmt::format("{} [{:3.0f}%] {}/{}", msg, percent, current, total));
}

void ValencyLogger::header(const std::string& title)
{
    if (m_verbosity < 2)
        return;
    std::string separator(title.length() + 4, '=');
    log_colored(fmt::color::cyan, "", separator);
    log_colored(fmt::color::cyan, "", "  " + title);
    log_colored(fmt::color::cyan, "", separator);
}

void ValencyLogger::energy(double value, const std::string& label)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::cornflower_blue, "[ENERGY]", fmt::format(" {}: {:.3f}", label, value));
}

void ValencyLogger::temperature(double kelvin, const std::string& label)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::cornflower_blue, "[TEMP]  ", fmt::format("{}: {:.1f} K", label, kelvin));
}

std::string ValencyLogger::format_json_value(const nlohmann::json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    else if (value.is_number_integer())
        return std::to_string(value.get<int>());
    else if (value.is_number_float())
        return fmt::format("{:.6g}", value.get<double>());
    else if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    else if (value.is_array())
        return fmt::format("[{} items]", value.size());
    return value.dump();
}

void ValencyLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain)
{
    if (m_use_colors && !force_plain)
        fmt::print(fmt::fg(color), "{}{}\n", prefix, msg);
    else
        fmt::print("{}{}\n", prefix, msg);
}

void ValencyLogger::log_plain(const std::string& msg)
{
    fmt::print("{}\n", msg);
}
