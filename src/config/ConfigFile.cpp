//
// ConfigFile.cpp - Settings file parsing and writing
//

#include "ConfigFile.h"
#include "../Log.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>

#include <tracy/Tracy.hpp>

namespace hexkit
{

namespace
{
    const std::string VERSION_PREFIX = "# hexkit config v";

    std::string Trim(const std::string& text)
    {
        const char* whitespace = " \t\r\n";
        size_t first = text.find_first_not_of(whitespace);
        if (first == std::string::npos) return {};
        size_t last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    // Whole-string conversions; trailing garbage is an error
    std::optional<int> ToInt(const std::string& value)
    {
        try
        {
            size_t used = 0;
            int result = std::stoi(value, &used);
            if (used != value.size()) return std::nullopt;
            return result;
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    std::optional<float> ToFloat(const std::string& value)
    {
        try
        {
            size_t used = 0;
            float result = std::stof(value, &used);
            if (used != value.size()) return std::nullopt;
            return result;
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    std::optional<Orientation> ToOrientation(const std::string& value)
    {
        if (value == "pointy") return Orientation::PointyTop;
        if (value == "flat") return Orientation::FlatTop;
        return std::nullopt;
    }

    std::optional<OffsetParity> ToParity(const std::string& value)
    {
        if (value == "odd-row") return OffsetParity::OddRow;
        if (value == "even-row") return OffsetParity::EvenRow;
        if (value == "odd-column") return OffsetParity::OddColumn;
        if (value == "even-column") return OffsetParity::EvenColumn;
        return std::nullopt;
    }

    const char* OrientationName(Orientation orientation)
    {
        return orientation == Orientation::PointyTop ? "pointy" : "flat";
    }

    const char* ParityName(OffsetParity parity)
    {
        switch (parity)
        {
            case OffsetParity::OddRow: return "odd-row";
            case OffsetParity::EvenRow: return "even-row";
            case OffsetParity::OddColumn: return "odd-column";
            case OffsetParity::EvenColumn: return "even-column";
        }
        return "odd-row";
    }
}

bool ConfigFile::CreateDirectoryIfNeeded(const std::string& filepath) {
    std::filesystem::path path(filepath);
    std::filesystem::path dir = path.parent_path();

    if (dir.empty()) return true;

    std::error_code error;
    std::filesystem::create_directories(dir, error);
    if (error) {
        LogError("Failed to create directory %s: %s", dir.string().c_str(), error.message().c_str());
        return false;
    }
    return true;
}

bool ConfigFile::Load(const std::string& filepath) {
    ZoneScoped;
    std::ifstream file(filepath);
    if (!file.is_open()) {
        LogError("Failed to open config file: %s", filepath.c_str());
        return false;
    }

    if (!Parse(file)) {
        LogError("Failed to parse config file: %s", filepath.c_str());
        return false;
    }

    LogInfo("Loaded config: %s", filepath.c_str());
    return true;
}

bool ConfigFile::Parse(std::istream& in) {
    _isLoaded = false;

    // Only replaces the current config when the whole input is valid
    HexKitConfig parsed;

    std::string line;
    std::string section;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        lineNumber++;
        line = Trim(line);

        if (line.empty()) continue;

        if (line[0] == '#') {
            if (line.rfind(VERSION_PREFIX, 0) == 0) {
                auto version = ToInt(Trim(line.substr(VERSION_PREFIX.size())));
                if (!version || *version != CONFIG_VERSION) {
                    LogError("Config line %d: unsupported header '%s'", lineNumber, line.c_str());
                    return false;
                }
            }
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            if (section != "LAYOUT" && section != "OFFSET" && section != "PATHFINDER") {
                LogWarn("Config line %d: unknown section [%s]", lineNumber, section.c_str());
            }
            continue;
        }

        // Parse key=value
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            LogWarn("Config line %d: expected key=value, got '%s'", lineNumber, line.c_str());
            continue;
        }

        std::string key = Trim(line.substr(0, eqPos));
        std::string value = Trim(line.substr(eqPos + 1));

        if (!ApplyValue(parsed, section, key, value)) {
            LogError("Config line %d: invalid value '%s' for %s", lineNumber, value.c_str(), key.c_str());
            return false;
        }
    }

    _config = parsed;
    _isLoaded = true;
    return true;
}

bool ConfigFile::ApplyValue(HexKitConfig& config, const std::string& section, const std::string& key, const std::string& value) {
    if (section == "LAYOUT") {
        if (key == "orientation") {
            auto orientation = ToOrientation(value);
            if (!orientation) return false;
            config.layout.orientation = *orientation;
        }
        else if (key == "hexSize") {
            auto size = ToFloat(value);
            if (!size || !(*size > 0.0f)) return false;
            config.layout.hexSize = *size;
        }
        else if (key == "originX") {
            auto x = ToFloat(value);
            if (!x) return false;
            config.layout.origin.x = *x;
        }
        else if (key == "originY") {
            auto y = ToFloat(value);
            if (!y) return false;
            config.layout.origin.y = *y;
        }
        else LogWarn("Unknown [LAYOUT] key: %s", key.c_str());
    }
    else if (section == "OFFSET") {
        if (key == "orientation") {
            auto orientation = ToOrientation(value);
            if (!orientation) return false;
            config.offset.orientation = *orientation;
        }
        else if (key == "parity") {
            auto parity = ToParity(value);
            if (!parity) return false;
            config.offset.parity = *parity;
        }
        else LogWarn("Unknown [OFFSET] key: %s", key.c_str());
    }
    else if (section == "PATHFINDER") {
        if (key == "maxExpansions") {
            auto limit = ToInt(value);
            if (!limit || *limit < 0) return false;
            config.pathfinder.maxExpansions = *limit;
        }
        else if (key == "maxCost") {
            auto limit = ToInt(value);
            if (!limit || *limit < 0) return false;
            config.pathfinder.maxCost = *limit;
        }
        else LogWarn("Unknown [PATHFINDER] key: %s", key.c_str());
    }
    else {
        LogWarn("Ignoring key %s outside a known section", key.c_str());
    }

    return true;
}

void ConfigFile::Write(std::ostream& out, const HexKitConfig& config) {
    // Enough digits for every float to read back unchanged
    const std::streamsize oldPrecision = out.precision(std::numeric_limits<float>::max_digits10);

    out << "# hexkit config v" << CONFIG_VERSION << "\n";
    out << "[LAYOUT]\n";
    out << "orientation=" << OrientationName(config.layout.orientation) << "\n";
    out << "hexSize=" << config.layout.hexSize << "\n";
    out << "originX=" << config.layout.origin.x << "\n";
    out << "originY=" << config.layout.origin.y << "\n";
    out << "\n[OFFSET]\n";
    out << "orientation=" << OrientationName(config.offset.orientation) << "\n";
    out << "parity=" << ParityName(config.offset.parity) << "\n";
    out << "\n[PATHFINDER]\n";
    out << "maxExpansions=" << config.pathfinder.maxExpansions << "\n";
    out << "maxCost=" << config.pathfinder.maxCost << "\n";

    out.precision(oldPrecision);
}

bool ConfigFile::Save(const std::string& filepath, const HexKitConfig& config) {
    if (!CreateDirectoryIfNeeded(filepath)) {
        return false;
    }

    std::ofstream file(filepath, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        LogError("Failed to open config file for writing: %s", filepath.c_str());
        return false;
    }

    Write(file, config);
    file.flush();
    if (!file) {
        LogError("Failed to write config file: %s", filepath.c_str());
        return false;
    }
    return true;
}

} // namespace hexkit
