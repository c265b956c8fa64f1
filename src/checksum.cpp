#include "tusvault/checksum.hpp"
#include "tusvault/error.hpp"
#include "tusvault/metadata.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <boost/uuid/detail/sha1.hpp>

#include <iterator>

namespace tusvault
{

const std::string TUS_CHECKSUM_ALGORITHMS = "sha1,md5";

namespace
{
// Older Boost hands digests out as big-endian words, newer as octets.
template <typename DigestType>
std::string Words_To_Bytes(const DigestType& dig)
{
    std::string ret;
    if constexpr (sizeof(dig[0]) == 1)
    {
        ret.assign(reinterpret_cast<const char*>(&dig[0]), sizeof(dig));
    }
    else
    {
        for (auto word : dig)
        {
            for (int shift = 24; shift >= 0; shift -= 8)
                ret.push_back(static_cast<char>((word >> shift) & 0xff));
        }
    }
    return ret;
}

class Sha1Hasher : public ChecksumHasher
{
    boost::uuids::detail::sha1 gen_;

public:
    void Update(const void* data, std::size_t size) override
    {
        gen_.process_bytes(data, size);
    }

    std::string Digest() override
    {
        boost::uuids::detail::sha1::digest_type dig;
        gen_.get_digest(dig);
        return Words_To_Bytes(dig);
    }
};

class Md5Hasher : public ChecksumHasher
{
    boost::uuids::detail::md5 gen_;

public:
    void Update(const void* data, std::size_t size) override
    {
        gen_.process_bytes(data, size);
    }

    std::string Digest() override
    {
        boost::uuids::detail::md5::digest_type dig;
        gen_.get_digest(dig);
        return Words_To_Bytes(dig);
    }
};
} // namespace

std::unique_ptr<ChecksumHasher> MakeChecksumHasher(std::string_view algorithm)
{
    if (algorithm == "sha1")
        return std::make_unique<Sha1Hasher>();
    if (algorithm == "md5")
        return std::make_unique<Md5Hasher>();
    return nullptr;
}

bool IsSupportedChecksumAlgorithm(std::string_view algorithm)
{
    return algorithm == "sha1" || algorithm == "md5";
}

std::pair<std::error_code, ExpectedChecksum>
ParseUploadChecksum(std::string_view header, bool allow_bare_algorithm)
{
    std::pair<std::error_code, ExpectedChecksum> ret;

    const auto space = header.find(' ');
    const auto algo = header.substr(0, space);
    if (!IsSupportedChecksumAlgorithm(algo))
    {
        ret.first = errc::bad_request;
        return ret;
    }
    ret.second.algorithm = std::string(algo);

    if (space == std::string_view::npos)
    {
        if (!allow_bare_algorithm)
            ret.first = errc::bad_request;
        return ret;
    }

    auto [ok, digest] = Base64Decode(header.substr(space + 1));
    if (!ok || digest.empty())
    {
        ret.first = errc::bad_request;
        return ret;
    }
    ret.second.digest = std::move(digest);
    return ret;
}

std::string HexString(const std::string& bytes)
{
    std::string ret;
    ret.reserve(bytes.size() * 2);
    boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(ret));
    return ret;
}

} // namespace tusvault
