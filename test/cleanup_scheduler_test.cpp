#include "tusvault/cleanup_scheduler.hpp"
#include "tusvault/error.hpp"

#include <boost/asio/buffer.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>

#include <catch2/catch.hpp>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

using tusvault::CleanupScheduler;
using tusvault::Clock;
using tusvault::Config;
using tusvault::CreateRequest;
using tusvault::errc;
using tusvault::ProtocolEngine;
using tusvault::UploadSession;

namespace
{
Config Test_Config(const std::string& name)
{
    Config config;
    config.temp_dir = (fs::temp_directory_path() / ("tusvault_cleanup_" + name)).string();
    fs::remove_all(config.temp_dir);
    config.session_ttl = 60s;
    return config;
}

std::string Create_Upload(ProtocolEngine& engine, std::uint64_t length, const std::string& content = "",
                          bool partial = false)
{
    CreateRequest req;
    req.version = ProtocolEngine::TUS_VERSION;
    req.length = length;
    req.partial = partial;
    tusvault::Body body;
    if (!content.empty())
    {
        body.commit(boost::asio::buffer_copy(body.prepare(content.size()), boost::asio::buffer(content)));
        req.body = &body;
    }
    const auto res = engine.Create(req);
    REQUIRE(!res.error);
    return res.upload.id;
}

struct TerminationLog
{
    std::atomic<int> terminated{0};
    std::atomic<int> completed{0};

    tusvault::Hooks MakeHooks()
    {
        tusvault::Hooks hooks;
        hooks.on_termination = [this](const UploadSession&) { ++terminated; };
        hooks.on_completed = [this](const UploadSession&, const std::string&) { ++completed; };
        return hooks;
    }
};
}

TEST_CASE("Sweep pass", "[CleanupScheduler]")
{
    boost::asio::io_context ioc;

    SECTION("expired incomplete upload is deleted and reported")
    {
        const auto config = Test_Config("expired");
        TerminationLog log;
        ProtocolEngine engine(config, log.MakeHooks());
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 10, "0123");
        const auto path = engine.Store().DataPath(id);

        CHECK(cs.RunOnce(Clock::now()) == 0);
        CHECK(!engine.Head(id).error);

        CHECK(cs.RunOnce(Clock::now() + 61s) == 1);
        CHECK(engine.Head(id).error == errc::not_found);
        CHECK(!engine.Store().Contains(id));
        CHECK(!fs::exists(path));
        CHECK(log.terminated == 1);

        fs::remove_all(config.temp_dir);
    }

    SECTION("completed upload is deleted silently")
    {
        const auto config = Test_Config("completed");
        TerminationLog log;
        ProtocolEngine engine(config, log.MakeHooks());
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 4, "0123");
        CHECK(log.completed == 1);
        const auto path = engine.Store().DataPath(id);

        CHECK(cs.RunOnce(Clock::now()) == 1);
        CHECK(engine.Head(id).error == errc::not_found);
        CHECK(!fs::exists(path));
        CHECK(log.terminated == 0);

        fs::remove_all(config.temp_dir);
    }

    SECTION("retained upload stays queryable until its ttl")
    {
        auto config = Test_Config("retained");
        config.keep_on_disk = true;
        TerminationLog log;
        ProtocolEngine engine(config, log.MakeHooks());
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 4, "0123");
        const auto path = engine.Store().DataPath(id);

        CHECK(cs.RunOnce(Clock::now()) == 0);
        CHECK(engine.Head(id).upload.offset == 4);

        CHECK(cs.RunOnce(Clock::now() + 61s) == 1);
        CHECK(engine.Head(id).error == errc::not_found);
        CHECK(fs::exists(path));
        CHECK(log.terminated == 0);

        fs::remove_all(config.temp_dir);
    }

    SECTION("completed partial upload waits for concatenation")
    {
        const auto config = Test_Config("partial");
        ProtocolEngine engine(config);
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 4, "0123", true);
        CHECK(cs.RunOnce(Clock::now()) == 0);
        CHECK(!engine.Head(id).error);
        CHECK(cs.RunOnce(Clock::now() + 61s) == 1);

        fs::remove_all(config.temp_dir);
    }

    SECTION("terminated upload leaves nothing to report")
    {
        const auto config = Test_Config("terminated");
        TerminationLog log;
        ProtocolEngine engine(config, log.MakeHooks());
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 10);
        REQUIRE(!engine.Terminate(id).error);
        CHECK(cs.RunOnce(Clock::now() + 61s) == 0);
        CHECK(engine.Registry().Size() == 0);
        CHECK(log.terminated == 1);

        fs::remove_all(config.temp_dir);
    }

    SECTION("upload held by a request is left alone")
    {
        const auto config = Test_Config("held");
        ProtocolEngine engine(config);
        CleanupScheduler cs(ioc, engine);

        const auto id = Create_Upload(engine, 10);
        {
            auto [ec, guard] = engine.Registry().Acquire(id);
            REQUIRE(!ec);
            CHECK(cs.RunOnce(Clock::now() + 61s) == 0);
        }
        CHECK(cs.RunOnce(Clock::now() + 61s) == 1);

        fs::remove_all(config.temp_dir);
    }
}

TEST_CASE("Periodic sweeps", "[CleanupScheduler]")
{
    auto config = Test_Config("periodic");
    config.session_ttl = 1s;
    TerminationLog log;
    ProtocolEngine engine(config, log.MakeHooks());

    boost::asio::io_context ioc;
    CleanupScheduler cs(ioc, engine, 50ms);

    const auto id = Create_Upload(engine, 10, "01");
    cs.Start();

    ioc.run_for(300ms);
    CHECK(!engine.Head(id).error);

    ioc.run_for(1500ms);
    CHECK(engine.Head(id).error == errc::not_found);
    CHECK(!engine.Store().Contains(id));
    CHECK(log.terminated == 1);

    cs.Stop();
    ioc.restart();
    ioc.run_for(1s);
    CHECK(ioc.stopped());

    fs::remove_all(config.temp_dir);
}
