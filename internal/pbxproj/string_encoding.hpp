#pragma once

#include <string>

namespace pbxpatch::pbxproj {

// Quotes and escapes a value unless it is made only of [A-Za-z0-9$./_].
std::string EncodeString(const std::string& value);

} // namespace pbxpatch::pbxproj
