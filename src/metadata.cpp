#include "tusvault/metadata.hpp"
#include "tusvault/error.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <cctype>

namespace tusvault
{

namespace base64 = boost::beast::detail::base64;

namespace
{
bool Is_Base64_Char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::string_view Trim(std::string_view sv)
{
    while (!sv.empty() && sv.front() == ' ')
        sv.remove_prefix(1);
    while (!sv.empty() && sv.back() == ' ')
        sv.remove_suffix(1);
    return sv;
}
} // namespace

std::string Base64Encode(std::string_view data)
{
    std::string ret(base64::encoded_size(data.size()), '\0');
    ret.resize(base64::encode(&ret[0], data.data(), data.size()));
    return ret;
}

std::pair<bool, std::string> Base64Decode(std::string_view data)
{
    std::pair<bool, std::string> ret(false, "");
    if (data.size() % 4 != 0)
        return ret;

    std::size_t padding = 0;
    for (std::size_t i = 0; i < data.size(); ++i)
    {
        if (data[i] == '=')
        {
            // padding only at the tail, at most two characters
            if (i + 2 < data.size() || ++padding > 2)
                return ret;
            continue;
        }
        if (padding > 0 || !Is_Base64_Char(data[i]))
            return ret;
    }

    ret.second.resize(base64::decoded_size(data.size()));
    const auto [written, read] = base64::decode(&ret.second[0], data.data(), data.size());
    ret.second.resize(written);
    ret.first = read == data.size() - padding;
    return ret;
}

std::pair<std::error_code, Metadata> ParseUploadMetadata(std::string_view header)
{
    std::pair<std::error_code, Metadata> ret;
    if (Trim(header).empty())
    {
        ret.first = errc::bad_request;
        return ret;
    }

    while (!header.empty())
    {
        const auto comma = header.find(',');
        auto pair = Trim(header.substr(0, comma));
        header.remove_prefix(comma == std::string_view::npos ? header.size() : comma + 1);

        if (pair.empty())
            continue;

        const auto space = pair.find(' ');
        const auto key = pair.substr(0, space);
        const auto value = space == std::string_view::npos ? std::string_view{} : pair.substr(space + 1);

        if (key.empty() || value.find(' ') != std::string_view::npos)
        {
            ret.first = errc::bad_request;
            return ret;
        }
        for (char c : key)
        {
            if (static_cast<unsigned char>(c) < 0x21 || static_cast<unsigned char>(c) > 0x7e)
            {
                ret.first = errc::bad_request;
                return ret;
            }
        }

        auto [ok, decoded] = Base64Decode(value);
        if (!ok)
        {
            ret.first = errc::bad_request;
            return ret;
        }
        if (!ret.second.emplace(std::string(key), std::move(decoded)).second)
        {
            // duplicate key
            ret.first = errc::bad_request;
            return ret;
        }
    }
    return ret;
}

std::string EncodeUploadMetadata(const Metadata& md)
{
    std::string ret;
    for (const auto& [key, value] : md)
    {
        if (!ret.empty())
            ret += ',';
        ret += key;
        if (!value.empty())
        {
            ret += ' ';
            ret += Base64Encode(value);
        }
    }
    return ret;
}

} // namespace tusvault
