#pragma once

#include <string>

namespace pfetch::detail {

// Random RFC 4122 version 4 UUID in canonical lowercase form.
std::string generateTaskId();

} // namespace pfetch::detail
