//
// ConfigFile.h - Loading and saving library settings
//

#ifndef HEXKIT_CONFIGFILE_H
#define HEXKIT_CONFIGFILE_H

#include "../hex/HexCoord.h"
#include "../hex/HexLayout.h"
#include "../path/Pathfinder.h"
#include <iosfwd>
#include <string>

namespace hexkit
{

struct HexKitConfig {
    HexLayoutConfig layout;
    OffsetLayout offset;
    PathfinderConfig pathfinder;
};

// Line based format:
//   # hexkit config v1
//   [LAYOUT]     orientation=pointy|flat, hexSize, originX, originY
//   [OFFSET]     orientation=pointy|flat, parity=odd-row|even-row|odd-column|even-column
//   [PATHFINDER] maxExpansions, maxCost
class ConfigFile {
public:
    static constexpr int CONFIG_VERSION = 1;

    ConfigFile() = default;

    bool Load(const std::string& filepath);
    // On failure the previous config is kept and IsLoaded() is false.
    // A "# hexkit config v<N>" header with N other than CONFIG_VERSION is an error.
    bool Parse(std::istream& in);

    static bool Save(const std::string& filepath, const HexKitConfig& config);
    static void Write(std::ostream& out, const HexKitConfig& config);

    [[nodiscard]] const HexKitConfig& GetConfig() const { return _config; }
    [[nodiscard]] bool IsLoaded() const { return _isLoaded; }

private:
    HexKitConfig _config;
    bool _isLoaded = false;

    static bool ApplyValue(HexKitConfig& config, const std::string& section, const std::string& key,
                           const std::string& value);
    static bool CreateDirectoryIfNeeded(const std::string& filepath);
};

} // namespace hexkit

#endif // HEXKIT_CONFIGFILE_H
