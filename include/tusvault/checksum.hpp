#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tusvault
{

class ChecksumHasher
{
public:
    virtual ~ChecksumHasher() = default;

    virtual void Update(const void* data, std::size_t size) = 0;
    // Raw digest bytes; the hasher must not be updated afterwards.
    virtual std::string Digest() = 0;
};

// nullptr when the algorithm is not supported
std::unique_ptr<ChecksumHasher> MakeChecksumHasher(std::string_view algorithm);
bool IsSupportedChecksumAlgorithm(std::string_view algorithm);

struct ExpectedChecksum
{
    std::string algorithm;
    std::string digest; // raw bytes, base64-decoded
};

// "<algorithm> <base64 digest>"; the digest may be omitted when allow_bare_algorithm is set
std::pair<std::error_code, ExpectedChecksum>
ParseUploadChecksum(std::string_view header, bool allow_bare_algorithm = false);

std::string HexString(const std::string& bytes);

extern const std::string TUS_CHECKSUM_ALGORITHMS;

} // namespace tusvault
