#pragma once

#include "tusvault/metadata.hpp"

#include <boost/uuid/random_generator.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tusvault
{

using Clock = std::chrono::system_clock;

enum class UploadState
{
    created,
    in_progress,
    completed,
    terminated
};

// Concatenation extension: partial uploads are assembled into a final one.
enum class UploadKind
{
    regular,
    partial,
    final
};

const char* to_string(UploadState state) noexcept;

struct UploadSession
{
    std::string id;
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> length; // unset: deferred length
    Metadata metadata;
    std::optional<std::string> checksum_algorithm;
    Clock::time_point created_at;
    Clock::time_point expires_at;
    UploadState state = UploadState::created;
    UploadKind kind = UploadKind::regular;
    std::vector<std::string> parts; // final uploads only
    std::string storage_ref;
};

struct NewUpload
{
    std::optional<std::uint64_t> length;
    Metadata metadata;
    std::optional<std::string> checksum_algorithm;
    UploadKind kind = UploadKind::regular;
    std::vector<std::string> parts;
};

enum class SweepReason
{
    expired,            // incomplete upload outlived its ttl
    completed,          // completed and not retained
    retention_expired   // completed, retained on disk, record outlived its ttl
};

struct SweptUpload
{
    UploadSession session;
    SweepReason reason;
};

class UploadRegistry
{
    struct Entry
    {
        UploadSession session;
        bool in_use = false;
    };

public:
    /*
      Exclusive hold on one upload id. Every mutation of a session (and of
      its chunk store resource) happens while a Guard for that id is alive;
      the hold is released when the Guard is destroyed.
    */
    class Guard
    {
        friend class UploadRegistry;

        UploadRegistry* registry_;
        std::string id_;

        Guard(UploadRegistry& registry, const std::string& id) : registry_(&registry), id_(id) {}

    public:
        Guard() : registry_(nullptr) {}
        ~Guard() noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& o) noexcept;
        Guard& operator=(Guard&& o) noexcept;

        bool Owns() const { return registry_ != nullptr; }
        const std::string& Id() const { return id_; }
    };

    UploadRegistry(std::chrono::seconds ttl, std::size_t max_concurrent, bool retain_completed,
                   bool refresh_expiry = true);

    // The new id is returned already held by the guard.
    std::pair<std::error_code, Guard> Create(const NewUpload& req, Clock::time_point now);

    std::pair<std::error_code, UploadSession> Get(const std::string& id) const;

    // offset_conflict while another request holds the id
    std::pair<std::error_code, Guard> Acquire(const std::string& id);

    // On success the second member tells whether this call completed the upload.
    std::pair<std::error_code, bool> Advance(const Guard& guard, std::uint64_t new_offset,
                                             std::uint64_t expected_offset, Clock::time_point now);
    std::pair<std::error_code, bool> FinalizeLength(const Guard& guard, std::uint64_t length);

    std::error_code Terminate(const Guard& guard);
    // Removes a session whose resources could not be set up.
    void Discard(Guard& guard) noexcept;

    std::vector<SweptUpload> Sweep(Clock::time_point now);

    size_t Size() const;
    size_t ActiveCount() const;

private:
    void release(const std::string& id) noexcept;
    Entry* heldEntry(const Guard& guard);
    std::string newUniqueId();
    size_t activeCount() const;

    const std::chrono::seconds ttl_;
    const std::size_t max_concurrent_;
    const bool retain_completed_;
    const bool refresh_expiry_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    boost::uuids::random_generator random_uuid_generator_;
};

} // namespace tusvault
