#pragma once

#include "tusvault/protocol_engine.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <string>
#include <string_view>

namespace tusvault
{

/*
  Translates tus HTTP requests into ProtocolEngine operations and engine
  results back into tus responses.
*/
class TusHandler
{
    ProtocolEngine& engine_;

public:
    using Request = boost::beast::http::request<boost::beast::http::dynamic_body>;
    using Response = boost::beast::http::response<boost::beast::http::dynamic_body>;

    static const std::string TAG_TUS_RESUMABLE;
    static const std::string TAG_TUS_VERSION;
    static const std::string TAG_TUS_MAXSZ;
    static const std::string TAG_TUS_EXTENSION;
    static const std::string TAG_TUS_CHECKSUM_ALGORITHM;
    static const std::string TAG_UPLOAD_LENGTH;
    static const std::string TAG_UPLOAD_DEFER_LENGTH;
    static const std::string TAG_UPLOAD_METADATA;
    static const std::string TAG_UPLOAD_OFFSET;
    static const std::string TAG_UPLOAD_CHECKSUM;
    static const std::string TAG_UPLOAD_CONCAT;
    static const std::string TAG_UPLOAD_EXPIRES;
    static const std::string TAG_METHOD_OVERRIDE;

    static const std::string TUS_SUPPORTED_VERSIONS;
    static const std::string TUS_SUPPORTED_EXTENSIONS;
    static const std::string PATCH_EXPECTED_CONTENT_TYPE;

    explicit TusHandler(ProtocolEngine& engine) : engine_(engine) {}

    Response MakeResponse(const Request& req);

    // Upload id named by a target below the mount path, empty otherwise
    std::string UploadIdFromTarget(std::string_view target) const;
    std::string UploadIdFromUrl(std::string_view url) const;
    std::string UploadUrl(const std::string& id) const;

private:
    void processOptions(const Request& req, Response& resp);
    void processHead(const Request& req, Response& resp);
    void processPost(const Request& req, Response& resp);
    void processConcatenation(const Request& req, Response& resp, std::string_view concat);
    void processPatch(const Request& req, Response& resp);
    void processDelete(const Request& req, Response& resp);

    bool isCollectionTarget(std::string_view target) const;
    void setUploadHeaders(Response& resp, const UploadSession& session) const;
    void setFailure(Response& resp, const EngineResult& res) const;
};

std::string Http_Date(Clock::time_point tp);

} // namespace tusvault
