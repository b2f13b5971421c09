#include "config_loader.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace FallGuardSDK {

std::string ConfigLoader::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

void ConfigLoader::parseLine(const std::string& raw, std::string& section) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == ';' || line[0] == '#') return;

    if (line[0] == '[') {
        size_t end = line.find(']');
        if (end != std::string::npos) {
            section = trim(line.substr(1, end - 1));
        }
        return;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) return;

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    // Trailing comment
    size_t comment = val.find_first_of(";#");
    if (comment != std::string::npos) val = trim(val.substr(0, comment));

    if (key.empty()) return;
    if (!section.empty()) key = section + "." + key;
    data[key] = val;
}

bool ConfigLoader::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string line, section;
    while (std::getline(file, line)) {
        parseLine(line, section);
    }
    return true;
}

bool ConfigLoader::loadFromString(const std::string& text) {
    std::istringstream in(text);
    std::string line, section;
    while (std::getline(in, line)) {
        parseLine(line, section);
    }
    return true;
}

bool ConfigLoader::has(const std::string& key) const {
    return data.find(key) != data.end();
}

std::string ConfigLoader::getString(const std::string& key, const std::string& defaultVal) const {
    auto it = data.find(key);
    if (it != data.end()) return it->second;
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& key, int defaultVal) const {
    auto it = data.find(key);
    if (it == data.end()) return defaultVal;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] Bad integer for " << key << ": '" << it->second << "'" << std::endl;
    }
    return defaultVal;
}

double ConfigLoader::getDouble(const std::string& key, double defaultVal) const {
    auto it = data.find(key);
    if (it == data.end()) return defaultVal;
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] Bad number for " << key << ": '" << it->second << "'" << std::endl;
    }
    return defaultVal;
}

bool ConfigLoader::getBool(const std::string& key, bool defaultVal) const {
    auto it = data.find(key);
    if (it == data.end()) return defaultVal;

    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;

    std::cerr << "[ConfigLoader] Bad boolean for " << key << ": '" << it->second << "'" << std::endl;
    return defaultVal;
}

} // namespace FallGuardSDK
