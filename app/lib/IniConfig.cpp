#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::err) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr const char* kBlank = " \t\r";

std::string strip(const std::string& text, std::size_t from = 0, std::size_t to = std::string::npos)
{
    const std::string slice = text.substr(from, to == std::string::npos ? to : to - from);
    const auto first = slice.find_first_not_of(kBlank);
    if (first == std::string::npos) {
        return {};
    }
    return slice.substr(first, slice.find_last_not_of(kBlank) - first + 1);
}
}


bool IniConfig::read_line(const std::string& raw_line, std::string& section)
{
    const std::string line = strip(raw_line);
    if (line.empty() || line.starts_with(';') || line.starts_with('#')) {
        return true;
    }
    if (line.starts_with('[') && line.ends_with(']')) {
        section = strip(line, 1, line.size() - 1);
        return true;
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos || equals == 0) {
        return false;
    }
    sections[section][strip(line, 0, equals)] = strip(line, equals + 1);
    return true;
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream in(Utils::utf8_to_path(filename));
    if (!in) {
        ini_log(spdlog::level::debug, "No config file at {}", filename);
        return false;
    }

    sections.clear();
    std::string section;
    std::string raw_line;
    for (std::size_t number = 1; std::getline(in, raw_line); ++number) {
        if (!read_line(raw_line, section)) {
            ini_log(spdlog::level::warn, "{}:{}: ignoring line without 'key = value'", filename, number);
        }
    }
    return true;
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream out(Utils::utf8_to_path(filename), std::ios::trunc);
    for (const auto& [name, entries] : sections) {
        out << '[' << name << "]\n";
        for (const auto& [key, value] : entries) {
            out << key << " = " << value << '\n';
        }
        out << '\n';
    }
    out.flush();

    if (!out) {
        ini_log(spdlog::level::err, "Could not write config file {}", filename);
        return false;
    }
    return true;
}


const std::string* IniConfig::find(const std::string& section, const std::string& key) const
{
    const auto section_it = sections.find(section);
    if (section_it == sections.end()) {
        return nullptr;
    }
    const auto key_it = section_it->second.find(key);
    return key_it == section_it->second.end() ? nullptr : &key_it->second;
}


std::string IniConfig::getValue(const std::string& section, const std::string& key,
                                const std::string& default_value) const
{
    const std::string* value = find(section, key);
    return value ? *value : default_value;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    sections[section][key] = value;
}


bool IniConfig::getBool(const std::string& section, const std::string& key, bool default_value) const
{
    const std::string* raw = find(section, key);
    if (!raw) {
        return default_value;
    }

    std::string value = *raw;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (const char* word : {"true", "yes", "on", "1"}) {
        if (value == word) {
            return true;
        }
    }
    for (const char* word : {"false", "no", "off", "0"}) {
        if (value == word) {
            return false;
        }
    }
    ini_log(spdlog::level::warn, "[{}] {} = '{}' is not a boolean", section, key, *raw);
    return default_value;
}


std::optional<long> IniConfig::getInt(const std::string& section, const std::string& key) const
{
    const std::string* raw = find(section, key);
    if (!raw) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const long parsed = std::stol(*raw, &consumed);
        if (consumed == raw->size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    ini_log(spdlog::level::warn, "[{}] {} = '{}' is not an integer", section, key, *raw);
    return std::nullopt;
}
