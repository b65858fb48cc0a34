#ifndef WEBSHELL_APP_PATHS_H
#define WEBSHELL_APP_PATHS_H

#include <cstdlib>
#include <string>

namespace webshell {

/**
 * Build the app data path using identifier/channel structure.
 *
 * @param basePath The base application data path (e.g., ~/.local/share)
 * @param identifier The app identifier (e.g., "dev.webshell.hello")
 * @param channel The release channel (e.g., "dev", "canary", "stable")
 * @param suffix Optional suffix to append (e.g., "WebKit")
 * @return The full path: basePath/identifier/channel/suffix
 */
inline std::string buildAppDataPath(
    const std::string& basePath,
    const std::string& identifier,
    const std::string& channel,
    const std::string& suffix = ""
) {
    std::string appId = !identifier.empty() ? identifier : "webshell";
    std::string channelPath = !channel.empty() ? channel : "default";

    std::string result = basePath;
    if (result.empty() || result.back() != '/') {
        result += '/';
    }
    result += appId;
    result += '/';
    result += channelPath;

    if (!suffix.empty()) {
        result += '/';
        result += suffix;
    }

    return result;
}

// $XDG_DATA_HOME, falling back to ~/.local/share
inline std::string defaultDataHome() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "/tmp") + "/.local/share";
}

} // namespace webshell

#endif // WEBSHELL_APP_PATHS_H
