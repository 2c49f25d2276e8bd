#pragma once

#include <cstdlib>
#include <filesystem>

namespace lanlink::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::current_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "lanlink"
                                             / "logs";

inline const std::filesystem::path kConfigDir = kHomeDir / ".config" / "lanlink";

inline const std::filesystem::path kSystemDownloadDir = kHomeDir / "Downloads";

} // namespace path
} // namespace lanlink::core
