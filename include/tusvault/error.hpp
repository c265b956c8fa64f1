#pragma once

#include <string>
#include <system_error>

namespace tusvault
{

enum class errc
{
    not_found = 1,
    offset_conflict,
    checksum_mismatch,
    payload_too_large,
    unsupported_version,
    invalid_state,
    hook_rejected,
    resource_exhausted,
    io_failure,
    bad_request,
    unsupported_media_type,
    forbidden,
    invariant_violation
};

const std::error_category& upload_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

// HTTP status code a tus client expects for the given error
unsigned Http_Status(const std::error_code& ec) noexcept;

} // namespace tusvault

namespace std
{
template <>
struct is_error_code_enum<tusvault::errc> : true_type
{
};
} // namespace std
