#pragma once

#include <cstddef>
#include <string>

namespace sitepull::util {

// Random [A-Za-z0-9] identifier used for job ids.
std::string GenerateJobId(std::size_t length = 20);

// Opaque id stamped into export cursors.
std::string GenerateSessionId();

} // namespace sitepull::util
