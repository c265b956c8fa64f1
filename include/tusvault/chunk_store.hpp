#pragma once

#include "tusvault/checksum.hpp"

#include <boost/beast/core/multi_buffer.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tusvault
{

using Body = boost::beast::multi_buffer;

class ChunkStore;

// Contents of the <id>.mdata sidecar
struct StoreRecord
{
    std::uint64_t tail = 0;
    std::optional<std::uint64_t> length;
};

/*
  Appends to one upload's data file starting at its committed tail.
  Bytes become part of the upload only on Commit(); a writer destroyed
  without a successful commit truncates the data file back to the tail
  it started from.
*/
class ChunkWriter
{
    friend class ChunkStore;

    ChunkStore* store_;
    std::string id_;
    std::uint64_t prior_tail_;
    std::uint64_t written_;
    std::fstream fstream_dt_;
    bool committed_;

    ChunkWriter(ChunkStore& store, const std::string& id, std::uint64_t prior_tail);

public:
    ChunkWriter() : store_(nullptr), prior_tail_(0), written_(0), committed_(true) {}
    ~ChunkWriter() noexcept;
    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;
    ChunkWriter(ChunkWriter&& o);

    bool IsOpen() const { return fstream_dt_.is_open(); }
    std::uint64_t Written() const { return written_; }

    bool Write(const void* data, std::size_t size);
    bool Write(std::string_view data) { return Write(data.data(), data.size()); }

    std::error_code Commit();

private:
    void rollback() noexcept;
};

class ChunkStore
{
    friend class ChunkWriter;

    std::string dirpath_;
    mutable std::mutex ids_mtx_;
    std::unordered_set<std::string> all_ids_;
    std::unordered_set<std::string> finalized_ids_;

public:
    static const std::string METADATA_FNAME_SUFFIX;
    static constexpr std::uint64_t DEFERRED_LENGTH = std::numeric_limits<std::uint64_t>::max();

    explicit ChunkStore(const std::string& dirpath);

    std::error_code Allocate(const std::string& id, std::optional<std::uint64_t> length);

    std::pair<std::error_code, ChunkWriter> OpenWriter(const std::string& id, std::uint64_t at_offset);

    // Writes body at at_offset, verifying the digest before the bytes are committed.
    std::pair<std::error_code, std::uint64_t>
        Append(const std::string& id, std::uint64_t at_offset, const Body& body,
               const std::optional<ExpectedChecksum>& checksum = std::nullopt);

    // Fills an empty resource with the committed bytes of parts, in order.
    std::error_code Concatenate(const std::string& id, const std::vector<std::string>& parts);

    std::error_code SetLength(const std::string& id, std::uint64_t length);
    std::pair<std::error_code, StoreRecord> Record(const std::string& id) const;

    std::pair<std::error_code, std::string> Finalize(const std::string& id);
    void Delete(const std::string& id) noexcept;
    // Stops tracking id, leaving its files on disk.
    void Forget(const std::string& id) noexcept;

    bool Contains(const std::string& id) const;
    std::string DataPath(const std::string& id) const { return makeFPath(id); }
    const std::string& Directory() const { return dirpath_; }

    size_t Size() const;
    size_t RmAllFiles();

private:
    std::string makeFPath(std::string_view sv) const;
    bool deleteFiles(const std::string& id) noexcept;
    std::error_code writeRecord(const std::string& id, const StoreRecord& rec);
};

} // namespace tusvault
