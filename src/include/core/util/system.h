#pragma once

#include <string>

namespace lanlink::core {

namespace system {

std::string Hostname();

} // namespace system

} // namespace lanlink::core
