#include <boost/asio/ip/host_name.hpp>
#include <cctype>
#include <core/util/system.h>
#include <spdlog/spdlog.h>

namespace lanlink::core {

namespace system {

std::string Hostname() {
    std::string hostname;
    try {
        hostname = boost::asio::ip::host_name();
    } catch (const std::exception& e) {
        spdlog::error("Failed to get host name: {}", e.what());
        return "lanlink";
    }
    if (hostname.ends_with(".local")) {
        hostname = hostname.substr(0, hostname.size() - 6);
    } else if (hostname.ends_with(".localdomain")) {
        hostname = hostname.substr(0, hostname.size() - 12);
    } else if (hostname.ends_with(".domain")) {
        hostname = hostname.substr(0, hostname.size() - 7);
    }
    // Device names travel as a single wire token
    for (auto& ch : hostname) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            ch = '_';
        }
    }
    return hostname;
}

} // namespace system

} // namespace lanlink::core
