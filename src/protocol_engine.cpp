#include "tusvault/protocol_engine.hpp"
#include "tusvault/error.hpp"

#include <iostream>
#include <unordered_set>

namespace tusvault
{

const std::string ProtocolEngine::TUS_VERSION = "1.0.0";

ProtocolEngine::ProtocolEngine(const Config& config, Hooks hooks)
    : config_(config),
      registry_(config.session_ttl, config.max_concurrent_uploads, config.keep_on_disk, config.refresh_expiry),
      store_(config.temp_dir),
      hooks_(std::move(hooks))
{
}

EngineResult ProtocolEngine::Create(const CreateRequest& req)
{
    if (req.version != TUS_VERSION)
        return {errc::unsupported_version, UploadSession()};
    if (req.length && *req.length > config_.max_size)
        return {errc::payload_too_large, UploadSession()};
    if (req.checksum_algorithm && !IsSupportedChecksumAlgorithm(*req.checksum_algorithm))
        return {errc::bad_request, UploadSession()};

    const auto now = Clock::now();

    UploadSession draft;
    draft.length = req.length;
    draft.metadata = req.metadata;
    draft.checksum_algorithm = req.checksum_algorithm;
    draft.kind = req.partial ? UploadKind::partial : UploadKind::regular;
    draft.created_at = now;
    draft.expires_at = now + config_.session_ttl;
    if (auto hec = hooks_.PreCreation(draft))
        return {hec, UploadSession()};

    NewUpload nu;
    nu.length = req.length;
    nu.metadata = req.metadata;
    nu.checksum_algorithm = req.checksum_algorithm;
    nu.kind = draft.kind;

    auto [cec, guard] = registry_.Create(nu, now);
    if (cec)
        return {cec, UploadSession()};
    const auto id = guard.Id();

    if (auto aec = store_.Allocate(id, req.length))
    {
        registry_.Discard(guard);
        return {aec, UploadSession()};
    }

    bool completed = false;
    if (req.body != nullptr || (req.length && *req.length == 0))
    {
        const auto [sec, session] = registry_.Get(id);
        auto [pec, done] = appendLocked(guard, session, 0, req.body ? req.body->size() : 0, req.body, req.checksum);
        if (pec)
        {
            store_.Delete(id);
            registry_.Discard(guard);
            return {pec, UploadSession()};
        }
        completed = done;
    }

    const auto snapshot = registry_.Get(id).second;
    hooks_.PostCreation(snapshot);
    if (completed)
        complete(snapshot);
    return {std::error_code(), snapshot};
}

EngineResult ProtocolEngine::Patch(const PatchRequest& req)
{
    auto [gec, guard] = registry_.Acquire(req.id);
    if (gec)
        return failure(gec, req.id);

    auto [sec, session] = registry_.Get(req.id);
    if (sec)
        return {sec, UploadSession()};
    if (session.kind == UploadKind::final)
        return failure(errc::forbidden, req.id);
    if (session.state == UploadState::completed)
        return failure(errc::invalid_state, req.id);

    if (req.length && session.length && *session.length != *req.length)
        return failure(errc::invalid_state, req.id);

    // a deferred length is fixed only once the chunk it arrives with is stored
    const bool declares_length = req.length && !session.length;
    if (declares_length)
    {
        if (*req.length > config_.max_size)
            return failure(errc::payload_too_large, req.id);
        if (session.offset > *req.length)
            return failure(errc::invalid_state, req.id);
    }

    UploadSession candidate = session;
    if (declares_length)
        candidate.length = req.length;

    const auto [aec, appended] = appendLocked(guard, candidate, req.offset, req.content_length, req.body, req.checksum);
    if (aec)
        return failure(aec, req.id);

    bool completed = appended;
    if (declares_length)
    {
        const auto [fec, done] = finalizeLengthLocked(guard, registry_.Get(req.id).second, *req.length);
        if (fec)
            return failure(fec, req.id);
        completed = done;
    }

    const auto snapshot = registry_.Get(req.id).second;
    if (completed)
        complete(snapshot);
    return {std::error_code(), snapshot};
}

EngineResult ProtocolEngine::Head(const std::string& id) const
{
    auto [ec, session] = registry_.Get(id);
    return {ec, std::move(session)};
}

EngineResult ProtocolEngine::FinalizeLength(const std::string& id, std::uint64_t length)
{
    auto [gec, guard] = registry_.Acquire(id);
    if (gec)
        return failure(gec, id);

    const auto [sec, session] = registry_.Get(id);
    if (sec)
        return {sec, UploadSession()};

    const auto [fec, done] = finalizeLengthLocked(guard, session, length);
    if (fec)
        return failure(fec, id);

    const auto snapshot = registry_.Get(id).second;
    if (done)
        complete(snapshot);
    return {std::error_code(), snapshot};
}

EngineResult ProtocolEngine::Concatenate(const ConcatRequest& req)
{
    if (req.parts.empty())
        return {errc::bad_request, UploadSession()};
    if (std::unordered_set<std::string>(req.parts.begin(), req.parts.end()).size() != req.parts.size())
        return {errc::bad_request, UploadSession()};

    // parts stay held until their bytes are copied
    std::vector<UploadRegistry::Guard> held;
    std::uint64_t total = 0;
    for (const auto& part : req.parts)
    {
        auto [gec, pguard] = registry_.Acquire(part);
        if (gec)
            return {gec, UploadSession()};
        const auto [sec, ps] = registry_.Get(part);
        if (sec)
            return {sec, UploadSession()};
        if (ps.kind != UploadKind::partial || ps.state != UploadState::completed)
            return {errc::invalid_state, UploadSession()};

        if (*ps.length > config_.max_size - total)
            return {errc::payload_too_large, UploadSession()};
        total += *ps.length;
        held.push_back(std::move(pguard));
    }
    const auto now = Clock::now();

    UploadSession draft;
    draft.length = total;
    draft.metadata = req.metadata;
    draft.kind = UploadKind::final;
    draft.parts = req.parts;
    draft.created_at = now;
    draft.expires_at = now + config_.session_ttl;
    if (auto hec = hooks_.PreCreation(draft))
        return {hec, UploadSession()};

    NewUpload nu;
    nu.length = total;
    nu.metadata = req.metadata;
    nu.kind = UploadKind::final;
    nu.parts = req.parts;

    auto [cec, guard] = registry_.Create(nu, now);
    if (cec)
        return {cec, UploadSession()};
    const auto id = guard.Id();

    if (auto aec = store_.Allocate(id, total))
    {
        registry_.Discard(guard);
        return {aec, UploadSession()};
    }
    if (auto ccec = store_.Concatenate(id, req.parts))
    {
        store_.Delete(id);
        registry_.Discard(guard);
        return {ccec, UploadSession()};
    }

    const auto [adv_ec, done] = registry_.Advance(guard, total, 0, now);
    if (adv_ec)
    {
        std::cerr << "invariant violated: concatenated upload " << id << " rejected offset " << total
                  << ": " << adv_ec.message() << std::endl;
        store_.Delete(id);
        registry_.Discard(guard);
        return {errc::invariant_violation, UploadSession()};
    }

    const auto snapshot = registry_.Get(id).second;
    hooks_.PostCreation(snapshot);
    if (done)
        complete(snapshot);
    return {std::error_code(), snapshot};
}

EngineResult ProtocolEngine::Terminate(const std::string& id)
{
    auto [gec, guard] = registry_.Acquire(id);
    if (gec)
        return failure(gec, id);

    auto [sec, session] = registry_.Get(id);
    if (sec)
        return {sec, UploadSession()};

    if (auto tec = registry_.Terminate(guard))
        return {tec, UploadSession()};
    store_.Delete(id);

    session.state = UploadState::terminated;
    hooks_.PostTermination(session);
    return {std::error_code(), session};
}

std::pair<std::error_code, bool>
ProtocolEngine::appendLocked(const UploadRegistry::Guard& guard, const UploadSession& session,
                             std::uint64_t offset, std::uint64_t content_length,
                             const Body* body, const std::optional<ExpectedChecksum>& checksum)
{
    if (offset != session.offset)
        return {errc::offset_conflict, false};
    if ((body ? body->size() : 0) != content_length)
        return {errc::bad_request, false};
    if (content_length > config_.max_size || offset > config_.max_size - content_length)
        return {errc::payload_too_large, false};
    if (session.length && content_length > *session.length - offset)
        return {errc::payload_too_large, false};

    if (content_length > 0 && session.checksum_algorithm
        && (!checksum || checksum->algorithm != *session.checksum_algorithm))
        return {errc::bad_request, false};

    const auto [rec_ec, rec] = store_.Record(session.id);
    if (rec_ec)
        return {rec_ec, false};
    if (rec.tail != session.offset)
    {
        std::cerr << "invariant violated: upload " << session.id << " registry offset " << session.offset
                  << " differs from stored tail " << rec.tail << std::endl;
        return {errc::invariant_violation, false};
    }

    std::uint64_t written = 0;
    if (content_length > 0)
    {
        const auto [wec, n] = store_.Append(session.id, offset, *body, checksum);
        if (wec)
            return {wec, false};
        written = n;
    }

    const auto [adv_ec, completed] = registry_.Advance(guard, offset + written, offset, Clock::now());
    if (adv_ec)
    {
        std::cerr << "invariant violated: upload " << session.id << " stored " << written
                  << " bytes the registry refused: " << adv_ec.message() << std::endl;
        return {errc::invariant_violation, false};
    }
    return {std::error_code(), completed};
}

std::pair<std::error_code, bool>
ProtocolEngine::finalizeLengthLocked(const UploadRegistry::Guard& guard, const UploadSession& session,
                                     std::uint64_t length)
{
    if (length > config_.max_size)
        return {errc::payload_too_large, false};
    if (session.length || session.offset > length)
        return {errc::invalid_state, false};

    if (auto sec = store_.SetLength(session.id, length))
        return {sec, false};
    return registry_.FinalizeLength(guard, length);
}

void ProtocolEngine::complete(const UploadSession& session)
{
    const auto [ec, path] = store_.Finalize(session.id);
    if (ec)
    {
        std::cerr << "finalize of completed upload " << session.id << " failed: " << ec.message() << std::endl;
        return;
    }
    hooks_.PostCompletion(session, path);
}

EngineResult ProtocolEngine::failure(std::error_code ec, const std::string& id) const
{
    EngineResult ret{ec, UploadSession()};
    auto [gec, session] = registry_.Get(id);
    if (!gec)
        ret.upload = std::move(session);
    return ret;
}

} // namespace tusvault
