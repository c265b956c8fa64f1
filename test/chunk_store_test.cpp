#include "tusvault/chunk_store.hpp"
#include "tusvault/error.hpp"
#include "tusvault/metadata.hpp"

#include <boost/asio/buffer.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>


#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>

namespace fs = std::filesystem;

using tusvault::ChunkStore;
using tusvault::errc;

namespace
{
tusvault::Body Make_Body(const std::string& s)
{
    tusvault::Body mb;
    mb.commit(boost::asio::buffer_copy(mb.prepare(s.size()), boost::asio::buffer(s)));
    return mb;
}

std::string Read_File(const std::string& path)
{
    std::ifstream istr(path, std::ios_base::in | std::ios_base::binary);
    return std::string(std::istreambuf_iterator<char>(istr), std::istreambuf_iterator<char>());
}

std::string Test_Dir(const std::string& name)
{
    const auto dir = fs::temp_directory_path() / ("tusvault_chunk_store_" + name);
    fs::remove_all(dir);
    return dir.string();
}
}

TEST_CASE( "In directory where write is not allowed", "[ChunkStore]" )
{
    ChunkStore cs("/proc/tusvault-not-writable");

    auto ec = cs.Allocate("aaaa-bbbb", 10);
    CHECK(ec == errc::io_failure);
    REQUIRE(cs.Size() == 0);
    CHECK(!cs.Contains("aaaa-bbbb"));
}

TEST_CASE( "Allocate and record", "[ChunkStore]" )
{
    const auto dir = Test_Dir("allocate");
    ChunkStore cs(dir);

    SECTION("known length")
    {
        REQUIRE(!cs.Allocate("up-1", 1007));
        REQUIRE(cs.Size() == 1);
        CHECK(fs::exists(dir + "/up-1"));
        CHECK(fs::exists(dir + "/up-1" + ChunkStore::METADATA_FNAME_SUFFIX));

        const auto [ec, rec] = cs.Record("up-1");
        CHECK(!ec);
        CHECK(rec.tail == 0);
        REQUIRE(rec.length);
        CHECK(*rec.length == 1007);
    }

    SECTION("deferred length then declared")
    {
        REQUIRE(!cs.Allocate("up-2", std::nullopt));
        {
            const auto [ec, rec] = cs.Record("up-2");
            CHECK(!ec);
            CHECK(!rec.length);
        }
        REQUIRE(!cs.SetLength("up-2", 42));
        const auto [ec, rec] = cs.Record("up-2");
        CHECK(!ec);
        REQUIRE(rec.length);
        CHECK(*rec.length == 42);
    }

    SECTION("same id twice")
    {
        REQUIRE(!cs.Allocate("up-3", 10));
        CHECK(cs.Allocate("up-3", 10) == errc::invalid_state);
        CHECK(cs.Size() == 1);
    }

    SECTION("record of unknown id")
    {
        const auto [ec, rec] = cs.Record("nott-exis-tent");
        CHECK(ec == errc::not_found);
    }

    cs.RmAllFiles();
    REQUIRE(cs.Size() == 0);
    fs::remove_all(dir);
}

TEST_CASE( "Append", "[ChunkStore]" )
{
    const auto dir = Test_Dir("append");
    ChunkStore cs(dir);
    REQUIRE(!cs.Allocate("up", 11));

    SECTION("appends advance the tail")
    {
        {
            const auto [ec, n] = cs.Append("up", 0, Make_Body("hello "));
            CHECK(!ec);
            CHECK(n == 6);
        }
        {
            const auto [ec, n] = cs.Append("up", 6, Make_Body("world"));
            CHECK(!ec);
            CHECK(n == 5);
        }
        CHECK(cs.Record("up").second.tail == 11);
        CHECK(Read_File(cs.DataPath("up")) == "hello world");
    }

    SECTION("wrong offset")
    {
        const auto [ec, n] = cs.Append("up", 3, Make_Body("lo"));
        CHECK(ec == errc::offset_conflict);
        CHECK(n == 0);
        CHECK(cs.Record("up").second.tail == 0);
    }

    SECTION("unknown id")
    {
        const auto [ec, n] = cs.Append("nott-exis-tent", 0, Make_Body("x"));
        CHECK(ec == errc::not_found);
    }

    SECTION("matching checksum")
    {
        const auto [dok, digest] = tusvault::Base64Decode("Kq5sNclPz7QV2+lfQIuc6R7oRu0=");
        REQUIRE(dok);
        const auto [ec, n] = cs.Append("up", 0, Make_Body("hello world"), tusvault::ExpectedChecksum{"sha1", digest});
        CHECK(!ec);
        CHECK(n == 11);
    }

    SECTION("checksum mismatch leaves nothing behind")
    {
        REQUIRE(!cs.Append("up", 0, Make_Body("hello ")).first);

        const auto [dok, digest] = tusvault::Base64Decode("Kq5sNclPz7QV2+lfQIuc6R7oRu0=");
        REQUIRE(dok);
        const auto [ec, n] = cs.Append("up", 6, Make_Body("wrold"), tusvault::ExpectedChecksum{"sha1", digest});
        CHECK(ec == errc::checksum_mismatch);
        CHECK(n == 0);
        CHECK(cs.Record("up").second.tail == 6);
        CHECK(fs::file_size(cs.DataPath("up")) == 6);
    }

    SECTION("unknown checksum algorithm")
    {
        const auto [ec, n] = cs.Append("up", 0, Make_Body("hello"), tusvault::ExpectedChecksum{"crc32", "abcd"});
        CHECK(ec == errc::bad_request);
        CHECK(fs::file_size(cs.DataPath("up")) == 0);
    }

    SECTION("stray bytes past the tail are dropped")
    {
        REQUIRE(!cs.Append("up", 0, Make_Body("hello")).first);
        {
            std::ofstream ostr(cs.DataPath("up"), std::ios_base::app | std::ios_base::binary);
            ostr << "garbage";
        }
        REQUIRE(!cs.Append("up", 5, Make_Body(" you!")).first);
        CHECK(Read_File(cs.DataPath("up")) == "hello you!");
    }

    SECTION("data file shorter than tail")
    {
        REQUIRE(!cs.Append("up", 0, Make_Body("hello")).first);
        fs::resize_file(cs.DataPath("up"), 2);
        const auto [ec, n] = cs.Append("up", 5, Make_Body("!"));
        CHECK(ec == errc::invariant_violation);
    }

    cs.RmAllFiles();
    fs::remove_all(dir);
}

TEST_CASE( "Writer rollback", "[ChunkStore]" )
{
    const auto dir = Test_Dir("rollback");
    ChunkStore cs(dir);
    REQUIRE(!cs.Allocate("up", std::nullopt));
    REQUIRE(!cs.Append("up", 0, Make_Body("keep")).first);

    SECTION("not committed - truncated back")
    {
        {
            auto [ec, writer] = cs.OpenWriter("up", 4);
            REQUIRE(!ec);
            CHECK(writer.Write("dropped"));
            CHECK(writer.Written() == 7);
        }
        CHECK(fs::file_size(cs.DataPath("up")) == 4);
        CHECK(cs.Record("up").second.tail == 4);
    }

    SECTION("committed - kept")
    {
        {
            auto [ec, writer] = cs.OpenWriter("up", 4);
            REQUIRE(!ec);
            CHECK(writer.Write("!"));
            CHECK(!writer.Commit());
            CHECK(writer.Commit() == errc::invalid_state);
        }
        CHECK(Read_File(cs.DataPath("up")) == "keep!");
        CHECK(cs.Record("up").second.tail == 5);
    }

    SECTION("moved writer rolls back once")
    {
        {
            auto [ec, writer] = cs.OpenWriter("up", 4);
            REQUIRE(!ec);
            tusvault::ChunkWriter other(std::move(writer));
            CHECK(other.Write("xy"));
        }
        CHECK(fs::file_size(cs.DataPath("up")) == 4);
    }

    cs.RmAllFiles();
    fs::remove_all(dir);
}

TEST_CASE( "Concatenate", "[ChunkStore]" )
{
    const auto dir = Test_Dir("concat");
    ChunkStore cs(dir);

    REQUIRE(!cs.Allocate("p1", 6));
    REQUIRE(!cs.Allocate("p2", 5));
    REQUIRE(!cs.Append("p1", 0, Make_Body("hello ")).first);
    REQUIRE(!cs.Append("p2", 0, Make_Body("world")).first);
    REQUIRE(!cs.Allocate("final", 11));

    SECTION("parts in order")
    {
        REQUIRE(!cs.Concatenate("final", {"p1", "p2"}));
        CHECK(Read_File(cs.DataPath("final")) == "hello world");
        CHECK(cs.Record("final").second.tail == 11);
        CHECK(Read_File(cs.DataPath("p1")) == "hello ");
    }

    SECTION("missing part leaves the target empty")
    {
        CHECK(cs.Concatenate("final", {"p1", "nott-exis-tent"}) == errc::not_found);
        CHECK(fs::file_size(cs.DataPath("final")) == 0);
        CHECK(cs.Record("final").second.tail == 0);
    }

    cs.RmAllFiles();
    fs::remove_all(dir);
}

TEST_CASE( "Finalize and Delete", "[ChunkStore]" )
{
    const auto dir = Test_Dir("delete");
    ChunkStore cs(dir);
    REQUIRE(!cs.Allocate("up", 2));
    REQUIRE(!cs.Append("up", 0, Make_Body("ok")).first);

    SECTION("finalized resource refuses writers")
    {
        const auto [ec, path] = cs.Finalize("up");
        CHECK(!ec);
        CHECK(path == cs.DataPath("up"));
        CHECK(cs.OpenWriter("up", 2).first == errc::invalid_state);
        CHECK(cs.Finalize("nott-exis-tent").first == errc::not_found);
    }

    SECTION("delete removes both files, twice is harmless")
    {
        cs.Delete("up");
        CHECK(!cs.Contains("up"));
        CHECK(!fs::exists(cs.DataPath("up")));
        CHECK(!fs::exists(cs.DataPath("up") + ChunkStore::METADATA_FNAME_SUFFIX));
        cs.Delete("up");
        CHECK(cs.Size() == 0);
    }

    SECTION("forget keeps the files")
    {
        cs.Forget("up");
        CHECK(!cs.Contains("up"));
        CHECK(Read_File(cs.DataPath("up")) == "ok");
        CHECK(cs.Record("up").first == errc::not_found);
    }

    cs.RmAllFiles();
    fs::remove_all(dir);
}
