#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <optional>
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

std::string strip_inline_comment(const std::string& value)
{
    for (const char* marker : {" ;", " #", "\t;", "\t#"}) {
        const auto pos = value.find(marker);
        if (pos != std::string::npos) {
            return Utils::trim_copy(value.substr(0, pos));
        }
    }
    return value;
}

std::optional<std::pair<std::string, std::string>> split_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim_copy(line.substr(0, delimiter));
    if (key.empty()) {
        return std::nullopt;
    }
    std::string value = strip_inline_comment(Utils::trim_copy(line.substr(delimiter + 1)));
    return std::make_pair(std::move(key), std::move(value));
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }
    parse(file);
    ini_log(spdlog::level::debug, "Loaded {} section(s) from {}", section_order_.size(), filename);
    return true;
}


void IniConfig::parse(std::istream& input)
{
    std::string raw_line;
    std::string section;
    int line_number = 0;
    while (std::getline(input, raw_line)) {
        ++line_number;
        const std::string line = Utils::trim_copy(raw_line);
        if (line.empty() || line.front() == ';' || line.front() == '#') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            section = Utils::trim_copy(line.substr(1, line.size() - 2));
            remember_section(section);
            continue;
        }
        if (auto key_value = split_key_value(line)) {
            remember_section(section);
            data_[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed config line {}: {}", line_number, line);
        }
    }
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& section : section_order_) {
        const auto it = data_.find(section);
        if (it == data_.end()) {
            continue;
        }
        if (!section.empty()) {
            file << "[" << section << "]\n";
        }
        for (const auto& [key, value] : it->second) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}


std::string IniConfig::get_value(const std::string& section,
                                 const std::string& key,
                                 const std::string& default_value) const
{
    const auto sec_it = data_.find(section);
    if (sec_it == data_.end()) {
        return default_value;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it != sec_it->second.end() ? key_it->second : default_value;
}


void IniConfig::set_value(const std::string& section, const std::string& key, const std::string& value)
{
    remember_section(section);
    data_[section][key] = value;
}


bool IniConfig::has_value(const std::string& section, const std::string& key) const
{
    const auto sec_it = data_.find(section);
    return sec_it != data_.end() && sec_it->second.count(key) > 0;
}


std::vector<std::string> IniConfig::sections() const
{
    std::vector<std::string> names;
    for (const auto& section : section_order_) {
        if (!section.empty()) {
            names.push_back(section);
        }
    }
    return names;
}


bool IniConfig::has_section(const std::string& section) const
{
    return std::find(section_order_.begin(), section_order_.end(), section) != section_order_.end();
}


void IniConfig::remember_section(const std::string& section)
{
    if (!has_section(section)) {
        section_order_.push_back(section);
    }
}
