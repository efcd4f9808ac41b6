#pragma once

#include <string>

namespace haven {
namespace protocol {

// Content-Type for a file name, from its extension (case ignored).
// Unknown extensions give "application/octet-stream".
std::string MimeTypeForPath(const std::string& path);

} // namespace protocol
} // namespace haven
