#pragma once
#include <filesystem>

namespace parasync::infrastructure {

/**
 * @brief XDG base directories, falling back to the usual $HOME locations.
 */
class PathUtils {
public:
    static std::filesystem::path GetDataHome();   ///< $XDG_DATA_HOME or ~/.local/share
    static std::filesystem::path GetConfigHome(); ///< $XDG_CONFIG_HOME or ~/.config
    static std::filesystem::path GetStateHome();  ///< $XDG_STATE_HOME or ~/.local/state
};

} // namespace parasync::infrastructure
