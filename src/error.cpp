#include "tusvault/error.hpp"

namespace tusvault
{

namespace
{
class UploadCategory : public std::error_category
{
public:
    const char* name() const noexcept override { return "tusvault"; }

    std::string message(int ev) const override
    {
        switch (static_cast<errc>(ev))
        {
        case errc::not_found:              return "upload not found";
        case errc::offset_conflict:        return "upload offset conflict";
        case errc::checksum_mismatch:      return "checksum mismatch";
        case errc::payload_too_large:      return "payload too large";
        case errc::unsupported_version:    return "unsupported protocol version";
        case errc::invalid_state:          return "operation invalid for upload state";
        case errc::hook_rejected:          return "rejected by creation hook";
        case errc::resource_exhausted:     return "too many concurrent uploads";
        case errc::io_failure:             return "storage i/o failure";
        case errc::bad_request:            return "malformed request";
        case errc::unsupported_media_type: return "unsupported media type";
        case errc::forbidden:              return "operation forbidden";
        case errc::invariant_violation:    return "internal invariant violated";
        }
        return "unknown tusvault error";
    }
};
} // namespace

const std::error_category& upload_category() noexcept
{
    static const UploadCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), upload_category()};
}

unsigned Http_Status(const std::error_code& ec) noexcept
{
    if (!ec)
        return 200;
    if (ec.category() != upload_category())
        return 500;

    switch (static_cast<errc>(ec.value()))
    {
    case errc::not_found:              return 404;
    case errc::offset_conflict:        return 409;
    case errc::checksum_mismatch:      return 460;
    case errc::payload_too_large:      return 413;
    case errc::unsupported_version:    return 412;
    case errc::invalid_state:          return 400;
    case errc::hook_rejected:          return 403;
    case errc::resource_exhausted:     return 503;
    case errc::io_failure:             return 500;
    case errc::bad_request:            return 400;
    case errc::unsupported_media_type: return 415;
    case errc::forbidden:              return 403;
    case errc::invariant_violation:    return 500;
    }
    return 500;
}

} // namespace tusvault
