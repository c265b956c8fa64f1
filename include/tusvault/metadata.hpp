#pragma once

#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tusvault
{

// Upload-Metadata keys mapped to their decoded values
using Metadata = std::map<std::string, std::string>;

std::pair<std::error_code, Metadata> ParseUploadMetadata(std::string_view header);
std::string EncodeUploadMetadata(const Metadata& md);

std::string Base64Encode(std::string_view data);
// false when the input is not padded base64
std::pair<bool, std::string> Base64Decode(std::string_view data);

} // namespace tusvault
