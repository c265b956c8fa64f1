#include "tusvault/chunk_store.hpp"
#include "tusvault/error.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace tusvault
{

namespace fs = std::filesystem;

const std::string ChunkStore::METADATA_FNAME_SUFFIX = ".mdata";

ChunkWriter::ChunkWriter(ChunkStore& store, const std::string& id, std::uint64_t prior_tail)
    : store_(&store), id_(id), prior_tail_(prior_tail), written_(0), committed_(false)
{
    fstream_dt_.open(store_->makeFPath(id_), std::ios_base::in | std::ios_base::out | std::ios_base::binary);
    if (fstream_dt_.is_open())
        fstream_dt_.seekp(static_cast<std::streamoff>(prior_tail_), std::ios_base::beg);
}

ChunkWriter::ChunkWriter(ChunkWriter&& o)
    : store_(o.store_), id_(std::move(o.id_)), prior_tail_(o.prior_tail_), written_(o.written_),
      fstream_dt_(std::move(o.fstream_dt_)), committed_(o.committed_)
{
    o.store_ = nullptr;
    o.committed_ = true;
}

ChunkWriter::~ChunkWriter() noexcept
{
    fstream_dt_.close();
    if (!committed_)
        rollback();
}

bool ChunkWriter::Write(const void* data, std::size_t size)
{
    if (!fstream_dt_.is_open() || committed_)
        return false;
    if (!fstream_dt_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size)))
        return false;
    written_ += size;
    return true;
}

std::error_code ChunkWriter::Commit()
{
    if (!fstream_dt_.is_open() || committed_)
        return errc::invalid_state;
    if (!fstream_dt_.flush())
        return errc::io_failure;

    auto [ec, rec] = store_->Record(id_);
    if (ec)
        return ec;
    rec.tail = prior_tail_ + written_;
    if (auto wec = store_->writeRecord(id_, rec))
        return wec;

    committed_ = true;
    return {};
}

void ChunkWriter::rollback() noexcept
{
    if (store_ == nullptr)
        return;
    std::error_code ec;
    fs::resize_file(store_->makeFPath(id_), prior_tail_, ec);
    if (ec)
        std::cerr << "rollback of " << id_ << " to " << prior_tail_ << " failed: " << ec.message() << std::endl;
}

ChunkStore::ChunkStore(const std::string& dirpath) : dirpath_(dirpath)
{
    std::error_code ec;
    fs::create_directories(dirpath_, ec);
    if (ec)
        std::cerr << "create directory " << dirpath_ << " failed: " << ec.message() << std::endl;
}

std::error_code ChunkStore::Allocate(const std::string& id, std::optional<std::uint64_t> length)
{
    {
        std::lock_guard lock(ids_mtx_);
        if (!all_ids_.insert(id).second)
            return errc::invalid_state;
    }

    std::ofstream dt_ostr(makeFPath(id), std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
    if (!dt_ostr.good())
    {
        std::cerr << "write error: " << makeFPath(id) << " couldn't be opened" << std::endl;
        std::lock_guard lock(ids_mtx_);
        all_ids_.erase(id);
        return errc::io_failure;
    }
    dt_ostr.close();

    if (auto ec = writeRecord(id, StoreRecord{0, length}))
    {
        deleteFiles(id);
        std::lock_guard lock(ids_mtx_);
        all_ids_.erase(id);
        return ec;
    }
    return {};
}

std::pair<std::error_code, ChunkWriter> ChunkStore::OpenWriter(const std::string& id, std::uint64_t at_offset)
{
    {
        std::lock_guard lock(ids_mtx_);
        if (all_ids_.find(id) == all_ids_.end())
            return {errc::not_found, ChunkWriter()};
        if (finalized_ids_.find(id) != finalized_ids_.end())
            return {errc::invalid_state, ChunkWriter()};
    }

    const auto [ec, rec] = Record(id);
    if (ec)
        return {ec, ChunkWriter()};
    if (rec.tail != at_offset)
        return {errc::offset_conflict, ChunkWriter()};

    // Drop bytes a crashed writer may have left past the committed tail
    std::error_code fec;
    const auto dtsize = fs::file_size(makeFPath(id), fec);
    if (fec)
    {
        std::cerr << "stat " << makeFPath(id) << " failed: " << fec.message() << std::endl;
        return {errc::io_failure, ChunkWriter()};
    }
    if (dtsize < rec.tail)
    {
        std::cerr << "data file " << makeFPath(id) << " is shorter (" << dtsize
                  << ") than its committed tail (" << rec.tail << ")" << std::endl;
        return {errc::invariant_violation, ChunkWriter()};
    }
    if (dtsize > rec.tail)
    {
        fs::resize_file(makeFPath(id), rec.tail, fec);
        if (fec)
            return {errc::io_failure, ChunkWriter()};
    }

    ChunkWriter writer(*this, id, rec.tail);
    if (!writer.IsOpen())
        return {errc::io_failure, ChunkWriter()};
    return {std::error_code(), std::move(writer)};
}

std::pair<std::error_code, std::uint64_t>
ChunkStore::Append(const std::string& id, std::uint64_t at_offset, const Body& body,
                   const std::optional<ExpectedChecksum>& checksum)
{
    std::unique_ptr<ChecksumHasher> hasher;
    if (checksum)
    {
        hasher = MakeChecksumHasher(checksum->algorithm);
        if (!hasher)
            return {errc::bad_request, 0};
    }

    auto [ec, writer] = OpenWriter(id, at_offset);
    if (ec)
        return {ec, 0};

    for (const auto& constbuf : body.cdata())
    {
        if (hasher)
            hasher->Update(constbuf.data(), constbuf.size());
        if (!writer.Write(constbuf.data(), constbuf.size()))
        {
            std::cerr << "write error: " << makeFPath(id) << " at " << at_offset + writer.Written() << std::endl;
            return {errc::io_failure, 0};
        }
    }

    if (hasher)
    {
        const auto digest = hasher->Digest();
        if (digest != checksum->digest)
        {
            std::cerr << "checksum mismatch on " << id << ": " << checksum->algorithm << " expected "
                      << HexString(checksum->digest) << " got " << HexString(digest) << std::endl;
            return {errc::checksum_mismatch, 0};
        }
    }

    if (auto cec = writer.Commit())
        return {cec, 0};
    return {std::error_code(), writer.Written()};
}

std::error_code ChunkStore::Concatenate(const std::string& id, const std::vector<std::string>& parts)
{
    auto [ec, writer] = OpenWriter(id, 0);
    if (ec)
        return ec;

    char datblock[64 * 1024];
    for (const auto& part : parts)
    {
        const auto [rec_ec, rec] = Record(part);
        if (rec_ec)
            return rec_ec;

        std::ifstream istr(makeFPath(part), std::ios_base::in | std::ios_base::binary);
        if (!istr.is_open())
        {
            std::cerr << "read error: " << makeFPath(part) << " couldn't be opened" << std::endl;
            return errc::io_failure;
        }

        auto remaining = rec.tail;
        while (remaining > 0)
        {
            const auto chunk = std::min<std::uint64_t>(remaining, sizeof(datblock));
            if (!istr.read(datblock, static_cast<std::streamsize>(chunk)))
            {
                std::cerr << "read error: " << makeFPath(part) << " ended before its tail" << std::endl;
                return errc::io_failure;
            }
            if (!writer.Write(datblock, chunk))
                return errc::io_failure;
            remaining -= chunk;
        }
    }
    return writer.Commit();
}

std::error_code ChunkStore::SetLength(const std::string& id, std::uint64_t length)
{
    auto [ec, rec] = Record(id);
    if (ec)
        return ec;
    rec.length = length;
    return writeRecord(id, rec);
}

std::pair<std::error_code, StoreRecord> ChunkStore::Record(const std::string& id) const
{
    std::pair<std::error_code, StoreRecord> ret;
    if (!Contains(id))
    {
        ret.first = errc::not_found;
        return ret;
    }

    std::ifstream md_istr(makeFPath(id + METADATA_FNAME_SUFFIX), std::ios_base::in | std::ios_base::binary);
    std::uint64_t length = 0;
    md_istr.read(reinterpret_cast<char*>(&ret.second.tail), sizeof(ret.second.tail));
    md_istr.read(reinterpret_cast<char*>(&length), sizeof(length));
    if (!md_istr)
    {
        std::cerr << "read error: " << makeFPath(id + METADATA_FNAME_SUFFIX) << " is missing or truncated" << std::endl;
        ret.first = errc::io_failure;
        return ret;
    }
    if (length != DEFERRED_LENGTH)
        ret.second.length = length;
    return ret;
}

std::pair<std::error_code, std::string> ChunkStore::Finalize(const std::string& id)
{
    std::lock_guard lock(ids_mtx_);
    if (all_ids_.find(id) == all_ids_.end())
        return {errc::not_found, ""};
    finalized_ids_.insert(id);
    return {std::error_code(), makeFPath(id)};
}

void ChunkStore::Delete(const std::string& id) noexcept
{
    {
        std::lock_guard lock(ids_mtx_);
        finalized_ids_.erase(id);
        if (all_ids_.erase(id) == 0)
        {
            std::cerr << "delete " << id << ": no such resource" << std::endl;
            return;
        }
    }
    deleteFiles(id);
}

void ChunkStore::Forget(const std::string& id) noexcept
{
    std::lock_guard lock(ids_mtx_);
    finalized_ids_.erase(id);
    all_ids_.erase(id);
}

bool ChunkStore::Contains(const std::string& id) const
{
    std::lock_guard lock(ids_mtx_);
    return all_ids_.find(id) != all_ids_.end();
}

size_t ChunkStore::Size() const
{
    std::lock_guard lock(ids_mtx_);
    return all_ids_.size();
}

size_t ChunkStore::RmAllFiles()
{
    std::lock_guard lock(ids_mtx_);

    auto ret = all_ids_.size();
    for (const auto& id : all_ids_)
        deleteFiles(id);

    all_ids_.clear();
    finalized_ids_.clear();
    return ret;
}

std::string ChunkStore::makeFPath(std::string_view sv) const
{
    auto ret = dirpath_ + '/';
    ret += sv;
    return ret;
}

bool ChunkStore::deleteFiles(const std::string& id) noexcept
{
    auto rm_or_log = [](const std::string& fpath) {
        std::error_code ec;
        if (!fs::remove(fpath, ec))
        {
            std::cerr << "remove " << fpath << " failed: " << (ec ? ec.message() : "no such file") << std::endl;
            return false;
        }
        return true;
    };
    auto ret = rm_or_log(makeFPath(id));
    ret &= rm_or_log(makeFPath(id + METADATA_FNAME_SUFFIX));
    return ret;
}

std::error_code ChunkStore::writeRecord(const std::string& id, const StoreRecord& rec)
{
    const auto fpath = makeFPath(id + METADATA_FNAME_SUFFIX);
    const auto tmppath = fpath + ".tmp";
    {
        std::ofstream md_ostr(tmppath, std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
        const std::uint64_t length = rec.length ? *rec.length : DEFERRED_LENGTH;
        md_ostr.write(reinterpret_cast<const char*>(&rec.tail), sizeof(rec.tail));
        md_ostr.write(reinterpret_cast<const char*>(&length), sizeof(length));
        md_ostr.flush();
        if (!md_ostr)
        {
            std::cerr << "write error: " << tmppath << " couldn't be written/opened" << std::endl;
            std::error_code ec;
            fs::remove(tmppath, ec);
            return errc::io_failure;
        }
    }

    // rename keeps the previous record intact until the new one is complete
    std::error_code ec;
    fs::rename(tmppath, fpath, ec);
    if (ec)
    {
        std::cerr << "rename " << tmppath << " failed: " << ec.message() << std::endl;
        fs::remove(tmppath, ec);
        return errc::io_failure;
    }
    return {};
}

} // namespace tusvault
