#include "tusvault/upload_registry.hpp"
#include "tusvault/error.hpp"

#include <boost/uuid/uuid_io.hpp>

namespace tusvault
{

const char* to_string(UploadState state) noexcept
{
    switch (state)
    {
    case UploadState::created:     return "created";
    case UploadState::in_progress: return "in_progress";
    case UploadState::completed:   return "completed";
    case UploadState::terminated:  return "terminated";
    }
    return "unknown";
}

UploadRegistry::Guard::~Guard() noexcept
{
    if (registry_ != nullptr)
        registry_->release(id_);
}

UploadRegistry::Guard::Guard(Guard&& o) noexcept : registry_(o.registry_), id_(std::move(o.id_))
{
    o.registry_ = nullptr;
}

UploadRegistry::Guard& UploadRegistry::Guard::operator=(Guard&& o) noexcept
{
    if (this != &o)
    {
        if (registry_ != nullptr)
            registry_->release(id_);
        registry_ = o.registry_;
        id_ = std::move(o.id_);
        o.registry_ = nullptr;
    }
    return *this;
}

UploadRegistry::UploadRegistry(std::chrono::seconds ttl, std::size_t max_concurrent, bool retain_completed,
                               bool refresh_expiry)
    : ttl_(ttl), max_concurrent_(max_concurrent), retain_completed_(retain_completed),
      refresh_expiry_(refresh_expiry)
{
}

std::pair<std::error_code, UploadRegistry::Guard>
UploadRegistry::Create(const NewUpload& req, Clock::time_point now)
{
    std::lock_guard lock(mtx_);

    if (max_concurrent_ > 0 && activeCount() >= max_concurrent_)
        return {errc::resource_exhausted, Guard()};

    const auto id = newUniqueId();
    Entry entry;
    entry.in_use = true;
    auto& s = entry.session;
    s.id = id;
    s.length = req.length;
    s.metadata = req.metadata;
    s.checksum_algorithm = req.checksum_algorithm;
    s.created_at = now;
    s.expires_at = now + ttl_;
    s.kind = req.kind;
    s.parts = req.parts;
    s.storage_ref = id;
    entries_.emplace(id, std::move(entry));

    return {std::error_code(), Guard(*this, id)};
}

std::pair<std::error_code, UploadSession> UploadRegistry::Get(const std::string& id) const
{
    std::lock_guard lock(mtx_);

    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.session.state == UploadState::terminated)
        return {errc::not_found, UploadSession()};
    return {std::error_code(), it->second.session};
}

std::pair<std::error_code, UploadRegistry::Guard> UploadRegistry::Acquire(const std::string& id)
{
    std::lock_guard lock(mtx_);

    auto it = entries_.find(id);
    if (it == entries_.end())
        return {errc::not_found, Guard()};
    if (it->second.in_use)
        return {errc::offset_conflict, Guard()};

    it->second.in_use = true;
    return {std::error_code(), Guard(*this, id)};
}

std::pair<std::error_code, bool>
UploadRegistry::Advance(const Guard& guard, std::uint64_t new_offset, std::uint64_t expected_offset,
                        Clock::time_point now)
{
    std::lock_guard lock(mtx_);

    auto* entry = heldEntry(guard);
    if (entry == nullptr || entry->session.state == UploadState::terminated)
        return {errc::not_found, false};

    auto& s = entry->session;
    if (s.state == UploadState::completed)
        return {errc::invalid_state, false};
    if (s.offset != expected_offset)
        return {errc::offset_conflict, false};
    if (new_offset < expected_offset || (s.length && new_offset > *s.length))
        return {errc::invalid_state, false};

    s.offset = new_offset;
    if (refresh_expiry_)
        s.expires_at = now + ttl_;

    if (s.length && s.offset == *s.length)
    {
        s.state = UploadState::completed;
        return {std::error_code(), true};
    }
    if (s.offset > 0)
        s.state = UploadState::in_progress;
    return {std::error_code(), false};
}

std::pair<std::error_code, bool> UploadRegistry::FinalizeLength(const Guard& guard, std::uint64_t length)
{
    std::lock_guard lock(mtx_);

    auto* entry = heldEntry(guard);
    if (entry == nullptr || entry->session.state == UploadState::terminated)
        return {errc::not_found, false};

    auto& s = entry->session;
    if (s.length || s.offset > length)
        return {errc::invalid_state, false};

    s.length = length;
    if (s.offset == length)
    {
        s.state = UploadState::completed;
        return {std::error_code(), true};
    }
    return {std::error_code(), false};
}

std::error_code UploadRegistry::Terminate(const Guard& guard)
{
    std::lock_guard lock(mtx_);

    auto* entry = heldEntry(guard);
    if (entry == nullptr)
        return errc::not_found;

    entry->session.state = UploadState::terminated;
    return {};
}

void UploadRegistry::Discard(Guard& guard) noexcept
{
    if (guard.registry_ != this)
        return;

    std::lock_guard lock(mtx_);
    entries_.erase(guard.id_);
    guard.registry_ = nullptr;
}

std::vector<SweptUpload> UploadRegistry::Sweep(Clock::time_point now)
{
    std::lock_guard lock(mtx_);

    std::vector<SweptUpload> ret;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        const auto& s = it->second.session;

        // a live request holds it, next pass
        if (it->second.in_use)
        {
            ++it;
            continue;
        }
        if (s.state == UploadState::terminated)
        {
            it = entries_.erase(it);
            continue;
        }

        std::optional<SweepReason> reason;
        if (s.state == UploadState::completed)
        {
            if (retain_completed_)
            {
                if (s.expires_at <= now)
                    reason = SweepReason::retention_expired;
            }
            else if (s.kind != UploadKind::partial || s.expires_at <= now)
            {
                // partial uploads wait for their ttl to stay available for concatenation
                reason = SweepReason::completed;
            }
        }
        else if (s.expires_at <= now)
        {
            reason = SweepReason::expired;
        }

        if (!reason)
        {
            ++it;
            continue;
        }
        ret.push_back(SweptUpload{s, *reason});
        it = entries_.erase(it);
    }
    return ret;
}

size_t UploadRegistry::Size() const
{
    std::lock_guard lock(mtx_);
    return entries_.size();
}

size_t UploadRegistry::ActiveCount() const
{
    std::lock_guard lock(mtx_);
    return activeCount();
}

void UploadRegistry::release(const std::string& id) noexcept
{
    std::lock_guard lock(mtx_);

    auto it = entries_.find(id);
    if (it != entries_.end())
        it->second.in_use = false;
}

UploadRegistry::Entry* UploadRegistry::heldEntry(const Guard& guard)
{
    if (guard.registry_ != this)
        return nullptr;
    auto it = entries_.find(guard.id_);
    if (it == entries_.end() || !it->second.in_use)
        return nullptr;
    return &it->second;
}

std::string UploadRegistry::newUniqueId()
{
    std::string uuidstr;
    do {
        boost::uuids::uuid uuid = random_uuid_generator_();
        uuidstr = boost::uuids::to_string(uuid);
    } while (entries_.find(uuidstr) != entries_.end());
    return uuidstr;
}

size_t UploadRegistry::activeCount() const
{
    size_t ret = 0;
    for (const auto& kv : entries_)
    {
        const auto state = kv.second.session.state;
        if (state == UploadState::created || state == UploadState::in_progress)
            ++ret;
    }
    return ret;
}

} // namespace tusvault
