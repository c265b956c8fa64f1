#pragma once

#include "tusvault/protocol_engine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>

namespace tusvault
{

class CleanupScheduler
{
    UploadRegistry& registry_;
    ChunkStore& store_;
    const HookDispatcher& hooks_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    const std::chrono::steady_clock::duration interval_;
    std::atomic<bool> stopped_;

public:
    CleanupScheduler(boost::asio::io_context& ioc, ProtocolEngine& engine);
    CleanupScheduler(boost::asio::io_context& ioc, ProtocolEngine& engine,
                     std::chrono::steady_clock::duration interval);

    void Start();
    void Stop();

    // One sweep pass; returns the number of uploads removed from the registry.
    std::size_t RunOnce(Clock::time_point now);

private:
    void schedule();
};

} // namespace tusvault
