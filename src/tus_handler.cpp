#include "tusvault/tus_handler.hpp"
#include "tusvault/error.hpp"

#include <charconv>
#include <ctime>
#include <iostream>

namespace http = boost::beast::http;

namespace
{
using Request = tusvault::TusHandler::Request;
using Response = tusvault::TusHandler::Response;

std::string_view To_Sv(boost::beast::string_view v)
{
    return std::string_view(v.data(), v.size());
}

// first: header present and a complete unsigned number
template <typename NumType, typename T>
auto Parse_Number_From_Req(const Request& req, const T& tag)
{
    auto it = req.find(tag);
    std::pair<bool, NumType> ret(it != req.cend(), static_cast<NumType>(0));
    if (!ret.first) return ret;
    const auto v = it->value();
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), ret.second);
    if (ec != std::errc() || ptr != v.data() + v.size() || v.empty()) ret.first = false;
    return ret;
}

template <typename T>
auto Parse_From_Req(const Request& req, const T& tag)
{
    auto it = req.find(tag);
    std::pair<bool, std::string> ret(it != req.cend(), "");
    if (!ret.first) return ret;
    ret.second = std::string(it->value().data(), it->value().size());
    return ret;
}

std::string_view Strip_Query(std::string_view target)
{
    const auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

bool Common_Checks(const Request& req, Response& resp)
{
    const auto [found, version] = Parse_From_Req(req, tusvault::TusHandler::TAG_TUS_RESUMABLE);
    if (!found || version != tusvault::ProtocolEngine::TUS_VERSION)
    {
        resp.set(tusvault::TusHandler::TAG_TUS_VERSION, tusvault::TusHandler::TUS_SUPPORTED_VERSIONS);
        resp.result(http::status::precondition_failed);
        return false;
    }
    return true;
}

bool Has_Octet_Stream_Body(const Request& req)
{
    const auto [found, ctype] = Parse_From_Req(req, http::field::content_type);
    return found && ctype == tusvault::TusHandler::PATCH_EXPECTED_CONTENT_TYPE;
}
}

namespace tusvault
{

const std::string TusHandler::TAG_TUS_RESUMABLE          = "Tus-Resumable";
const std::string TusHandler::TAG_TUS_VERSION            = "Tus-Version";
const std::string TusHandler::TAG_TUS_MAXSZ              = "Tus-Max-Size";
const std::string TusHandler::TAG_TUS_EXTENSION          = "Tus-Extension";
const std::string TusHandler::TAG_TUS_CHECKSUM_ALGORITHM = "Tus-Checksum-Algorithm";
const std::string TusHandler::TAG_UPLOAD_LENGTH          = "Upload-Length";
const std::string TusHandler::TAG_UPLOAD_DEFER_LENGTH    = "Upload-Defer-Length";
const std::string TusHandler::TAG_UPLOAD_METADATA        = "Upload-Metadata";
const std::string TusHandler::TAG_UPLOAD_OFFSET          = "Upload-Offset";
const std::string TusHandler::TAG_UPLOAD_CHECKSUM        = "Upload-Checksum";
const std::string TusHandler::TAG_UPLOAD_CONCAT          = "Upload-Concat";
const std::string TusHandler::TAG_UPLOAD_EXPIRES         = "Upload-Expires";
const std::string TusHandler::TAG_METHOD_OVERRIDE        = "X-HTTP-Method-Override";

const std::string TusHandler::TUS_SUPPORTED_VERSIONS   = "1.0.0";
const std::string TusHandler::TUS_SUPPORTED_EXTENSIONS =
    "creation,creation-with-upload,creation-defer-length,termination,checksum,concatenation,expiration";
const std::string TusHandler::PATCH_EXPECTED_CONTENT_TYPE = "application/offset+octet-stream";

std::string Http_Date(Clock::time_point tp)
{
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    const auto n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string(buf, n);
}

TusHandler::Response TusHandler::MakeResponse(const Request& req)
{
    Response resp;
    resp.version(req.version());
    resp.keep_alive(false);
    resp.set(http::field::server, "tusvault 0.1");
    resp.set(TAG_TUS_RESUMABLE, ProtocolEngine::TUS_VERSION);

    auto method = req.method();
    const auto [ov_found, override_method] = Parse_From_Req(req, TAG_METHOD_OVERRIDE);
    if (ov_found)
        method = http::string_to_verb(override_method);

    switch (method)
    {
    case http::verb::options:
        processOptions(req, resp);
        break;

    case http::verb::head:
        processHead(req, resp);
        break;

    case http::verb::post:
        processPost(req, resp);
        break;

    case http::verb::patch:
        processPatch(req, resp);
        break;

    case http::verb::delete_:
        processDelete(req, resp);
        break;

    default:
        resp.result(http::status::bad_request);
        break;
    }

    resp.set(http::field::content_length, std::to_string(resp.body().size()));
    return resp;
}

bool TusHandler::isCollectionTarget(std::string_view target) const
{
    const auto& mount = engine_.Configuration().mount_path;
    target = Strip_Query(target);
    if (target == mount)
        return true;
    if (mount == "/")
        return false;
    return target.size() == mount.size() + 1 && target.substr(0, mount.size()) == mount && target.back() == '/';
}

std::string TusHandler::UploadIdFromTarget(std::string_view target) const
{
    const auto& mount = engine_.Configuration().mount_path;
    target = Strip_Query(target);
    const std::string prefix = mount == "/" ? mount : mount + "/";
    if (target.size() <= prefix.size() || target.substr(0, prefix.size()) != prefix)
        return std::string();
    const auto id = target.substr(prefix.size());
    if (id.find('/') != std::string_view::npos)
        return std::string();
    return std::string(id);
}

std::string TusHandler::UploadIdFromUrl(std::string_view url) const
{
    const auto& base = engine_.Configuration().base_url;
    if (!base.empty() && url.substr(0, base.size()) == base)
    {
        url.remove_prefix(base.size());
    }
    else if (const auto scheme = url.find("://"); scheme != std::string_view::npos)
    {
        const auto path = url.find('/', scheme + 3);
        if (path == std::string_view::npos)
            return std::string();
        url.remove_prefix(path);
    }
    return UploadIdFromTarget(url);
}

std::string TusHandler::UploadUrl(const std::string& id) const
{
    const auto& config = engine_.Configuration();
    return config.base_url + (config.mount_path == "/" ? "" : config.mount_path) + "/" + id;
}

void TusHandler::setUploadHeaders(Response& resp, const UploadSession& session) const
{
    resp.set(TAG_UPLOAD_OFFSET, std::to_string(session.offset));
    if (session.length)
        resp.set(TAG_UPLOAD_LENGTH, std::to_string(*session.length));
    else
        resp.set(TAG_UPLOAD_DEFER_LENGTH, "1");
    if (!session.metadata.empty())
        resp.set(TAG_UPLOAD_METADATA, EncodeUploadMetadata(session.metadata));
    if (session.state != UploadState::completed)
        resp.set(TAG_UPLOAD_EXPIRES, Http_Date(session.expires_at));

    if (session.kind == UploadKind::partial)
    {
        resp.set(TAG_UPLOAD_CONCAT, "partial");
    }
    else if (session.kind == UploadKind::final)
    {
        std::string urls;
        for (const auto& part : session.parts)
        {
            if (!urls.empty()) urls += ' ';
            urls += UploadUrl(part);
        }
        resp.set(TAG_UPLOAD_CONCAT, "final;" + urls);
    }
}

void TusHandler::setFailure(Response& resp, const EngineResult& res) const
{
    resp.result(Http_Status(res.error));
    if (res.error == errc::offset_conflict && !res.upload.id.empty())
        resp.set(TAG_UPLOAD_OFFSET, std::to_string(res.upload.offset));
}

void TusHandler::processOptions(const Request& req, Response& resp)
{
    const auto target = Strip_Query(To_Sv(req.target()));
    if (!isCollectionTarget(target) && UploadIdFromTarget(target).empty())
    {
        resp.result(http::status::not_found);
        return;
    }

    resp.set(TAG_TUS_VERSION, TUS_SUPPORTED_VERSIONS);
    resp.set(TAG_TUS_MAXSZ, std::to_string(engine_.Configuration().max_size));
    resp.set(TAG_TUS_EXTENSION, TUS_SUPPORTED_EXTENSIONS);
    resp.set(TAG_TUS_CHECKSUM_ALGORITHM, TUS_CHECKSUM_ALGORITHMS);
    resp.result(http::status::no_content);
}

void TusHandler::processHead(const Request& req, Response& resp)
{
    const auto id = UploadIdFromTarget(To_Sv(req.target()));
    if (id.empty())
    {
        resp.result(http::status::not_found);
        return;
    }
    if (!Common_Checks(req, resp)) return;

    const auto res = engine_.Head(id);
    if (res.error)
    {
        setFailure(resp, res);
        return;
    }

    setUploadHeaders(resp, res.upload);
    resp.set(http::field::cache_control, "no-store");
    resp.result(http::status::no_content);
}

void TusHandler::processPost(const Request& req, Response& resp)
{
    if (!isCollectionTarget(To_Sv(req.target())))
    {
        resp.result(http::status::not_found);
        return;
    }
    if (!Common_Checks(req, resp)) return;

    CreateRequest creq;
    creq.version = ProtocolEngine::TUS_VERSION;

    const auto [cc_found, concat] = Parse_From_Req(req, TAG_UPLOAD_CONCAT);
    if (cc_found)
    {
        if (concat.compare(0, 6, "final;") == 0)
        {
            processConcatenation(req, resp, concat);
            return;
        }
        if (concat != "partial")
        {
            resp.result(http::status::bad_request);
            return;
        }
        creq.partial = true;
    }

    const bool has_length = req.count(TAG_UPLOAD_LENGTH) > 0;
    const bool has_defer = req.count(TAG_UPLOAD_DEFER_LENGTH) > 0;
    if (has_length == has_defer)
    {
        resp.result(http::status::bad_request);
        return;
    }
    if (has_length)
    {
        const auto [ul_valid, uploadlen] = Parse_Number_From_Req<std::uint64_t>(req, TAG_UPLOAD_LENGTH);
        if (!ul_valid)
        {
            resp.result(http::status::bad_request);
            return;
        }
        creq.length = uploadlen;
    }
    else if (Parse_From_Req(req, TAG_UPLOAD_DEFER_LENGTH).second != "1")
    {
        resp.result(http::status::bad_request);
        return;
    }

    const auto [md_found, mtdata] = Parse_From_Req(req, TAG_UPLOAD_METADATA);
    if (md_found)
    {
        auto [mec, md] = ParseUploadMetadata(mtdata);
        if (mec)
        {
            resp.result(Http_Status(mec));
            return;
        }
        creq.metadata = std::move(md);
    }

    const auto [ck_found, checksum] = Parse_From_Req(req, TAG_UPLOAD_CHECKSUM);
    if (ck_found)
    {
        auto [kec, expected] = ParseUploadChecksum(checksum, true);
        if (kec)
        {
            resp.result(Http_Status(kec));
            return;
        }
        creq.checksum_algorithm = expected.algorithm;
        if (!expected.digest.empty())
            creq.checksum = std::move(expected);
    }

    const auto [cl_found, contentlen] = Parse_Number_From_Req<std::uint64_t>(req, http::field::content_length);
    if ((cl_found && contentlen > 0) || req.body().size() > 0)
    {
        if (!Has_Octet_Stream_Body(req))
        {
            resp.result(http::status::unsupported_media_type);
            return;
        }
        creq.body = &req.body();
    }

    const auto res = engine_.Create(creq);
    if (res.error)
    {
        setFailure(resp, res);
        return;
    }

    resp.set(http::field::location, UploadUrl(res.upload.id));
    if (res.upload.state != UploadState::completed)
        resp.set(TAG_UPLOAD_EXPIRES, Http_Date(res.upload.expires_at));
    if (creq.body != nullptr)
        resp.set(TAG_UPLOAD_OFFSET, std::to_string(res.upload.offset));
    resp.result(http::status::created);
}

void TusHandler::processConcatenation(const Request& req, Response& resp, std::string_view concat)
{
    if (req.count(TAG_UPLOAD_LENGTH) > 0 || req.count(TAG_UPLOAD_DEFER_LENGTH) > 0 || req.body().size() > 0)
    {
        resp.result(http::status::bad_request);
        return;
    }

    ConcatRequest creq;
    concat.remove_prefix(6);
    while (!concat.empty())
    {
        const auto sep = concat.find(' ');
        const auto url = concat.substr(0, sep);
        concat.remove_prefix(sep == std::string_view::npos ? concat.size() : sep + 1);
        if (url.empty())
            continue;
        auto id = UploadIdFromUrl(url);
        if (id.empty())
        {
            resp.result(http::status::bad_request);
            return;
        }
        creq.parts.push_back(std::move(id));
    }

    const auto [md_found, mtdata] = Parse_From_Req(req, TAG_UPLOAD_METADATA);
    if (md_found)
    {
        auto [mec, md] = ParseUploadMetadata(mtdata);
        if (mec)
        {
            resp.result(Http_Status(mec));
            return;
        }
        creq.metadata = std::move(md);
    }

    const auto res = engine_.Concatenate(creq);
    if (res.error)
    {
        setFailure(resp, res);
        return;
    }

    resp.set(http::field::location, UploadUrl(res.upload.id));
    resp.result(http::status::created);
}

void TusHandler::processPatch(const Request& req, Response& resp)
{
    const auto id = UploadIdFromTarget(To_Sv(req.target()));
    if (id.empty())
    {
        resp.result(http::status::not_found);
        return;
    }
    if (!Common_Checks(req, resp)) return;

    if (!Has_Octet_Stream_Body(req))
    {
        resp.result(http::status::unsupported_media_type);
        return;
    }

    PatchRequest preq;
    preq.id = id;

    const auto [uo_valid, offset] = Parse_Number_From_Req<std::uint64_t>(req, TAG_UPLOAD_OFFSET);
    if (!uo_valid)
    {
        resp.result(http::status::bad_request);
        return;
    }
    preq.offset = offset;

    const auto [cl_valid, contentlen] = Parse_Number_From_Req<std::uint64_t>(req, http::field::content_length);
    preq.content_length = cl_valid ? contentlen : req.body().size();
    preq.body = &req.body();

    if (req.count(TAG_UPLOAD_LENGTH) > 0)
    {
        const auto [ul_valid, uploadlen] = Parse_Number_From_Req<std::uint64_t>(req, TAG_UPLOAD_LENGTH);
        if (!ul_valid)
        {
            resp.result(http::status::bad_request);
            return;
        }
        preq.length = uploadlen;
    }

    const auto [ck_found, checksum] = Parse_From_Req(req, TAG_UPLOAD_CHECKSUM);
    if (ck_found)
    {
        auto [kec, expected] = ParseUploadChecksum(checksum);
        if (kec)
        {
            resp.result(Http_Status(kec));
            return;
        }
        preq.checksum = std::move(expected);
    }

    const auto res = engine_.Patch(preq);
    if (res.error)
    {
        if (res.error == errc::invariant_violation || res.error == errc::io_failure)
            std::cerr << "patch of upload " << id << " failed: " << res.error.message() << std::endl;
        setFailure(resp, res);
        return;
    }

    resp.set(TAG_UPLOAD_OFFSET, std::to_string(res.upload.offset));
    if (res.upload.state != UploadState::completed)
        resp.set(TAG_UPLOAD_EXPIRES, Http_Date(res.upload.expires_at));
    resp.result(http::status::no_content);
}

void TusHandler::processDelete(const Request& req, Response& resp)
{
    const auto id = UploadIdFromTarget(To_Sv(req.target()));
    if (id.empty())
    {
        resp.result(http::status::not_found);
        return;
    }
    if (!Common_Checks(req, resp)) return;

    const auto [cl_found, contentlen] = Parse_Number_From_Req<std::uint64_t>(req, http::field::content_length);
    if ((cl_found && contentlen > 0) || req.body().size() > 0)
    {
        resp.result(http::status::bad_request);
        return;
    }

    const auto res = engine_.Terminate(id);
    if (res.error)
    {
        setFailure(resp, res);
        return;
    }
    resp.result(http::status::no_content);
}

} // namespace tusvault
