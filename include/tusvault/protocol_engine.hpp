#pragma once

#include "tusvault/checksum.hpp"
#include "tusvault/chunk_store.hpp"
#include "tusvault/config.hpp"
#include "tusvault/hook_dispatcher.hpp"
#include "tusvault/metadata.hpp"
#include "tusvault/upload_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tusvault
{

/*
  Outcome of an engine operation. upload is a snapshot of the session
  after the operation; on failure it is filled whenever the session is
  known, so an offset_conflict reports the true offset.
*/
struct EngineResult
{
    std::error_code error;
    UploadSession upload;
};

struct CreateRequest
{
    std::string version;
    std::optional<std::uint64_t> length; // unset: deferred length
    Metadata metadata;
    std::optional<std::string> checksum_algorithm;
    bool partial = false;

    // creation-with-upload
    const Body* body = nullptr;
    std::optional<ExpectedChecksum> checksum;
};

struct PatchRequest
{
    std::string id;
    std::uint64_t offset = 0;
    std::uint64_t content_length = 0;
    const Body* body = nullptr;
    std::optional<ExpectedChecksum> checksum;
    // declares the final size of a deferred-length upload before appending
    std::optional<std::uint64_t> length;
};

struct ConcatRequest
{
    std::vector<std::string> parts;
    Metadata metadata;
};

class ProtocolEngine
{
    const Config config_;
    UploadRegistry registry_;
    ChunkStore store_;
    HookDispatcher hooks_;

public:
    static const std::string TUS_VERSION;

    explicit ProtocolEngine(const Config& config, Hooks hooks = Hooks());

    EngineResult Create(const CreateRequest& req);
    EngineResult Patch(const PatchRequest& req);
    EngineResult Head(const std::string& id) const;
    EngineResult FinalizeLength(const std::string& id, std::uint64_t length);
    EngineResult Concatenate(const ConcatRequest& req);
    EngineResult Terminate(const std::string& id);

    const Config& Configuration() const { return config_; }
    UploadRegistry& Registry() { return registry_; }
    ChunkStore& Store() { return store_; }
    const HookDispatcher& Dispatcher() const { return hooks_; }

private:
    std::pair<std::error_code, bool> appendLocked(const UploadRegistry::Guard& guard, const UploadSession& session,
                                                  std::uint64_t offset, std::uint64_t content_length,
                                                  const Body* body, const std::optional<ExpectedChecksum>& checksum);
    std::pair<std::error_code, bool> finalizeLengthLocked(const UploadRegistry::Guard& guard,
                                                          const UploadSession& session, std::uint64_t length);
    void complete(const UploadSession& session);
    EngineResult failure(std::error_code ec, const std::string& id) const;
};

} // namespace tusvault
