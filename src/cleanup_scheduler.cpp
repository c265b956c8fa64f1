#include "tusvault/cleanup_scheduler.hpp"

#include <boost/asio/dispatch.hpp>

#include <iostream>

namespace tusvault
{

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc, ProtocolEngine& engine)
    : CleanupScheduler(ioc, engine, engine.Configuration().cleanup_interval)
{
}

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc, ProtocolEngine& engine,
                                   std::chrono::steady_clock::duration interval)
    : registry_(engine.Registry()), store_(engine.Store()), hooks_(engine.Dispatcher()),
      strand_(boost::asio::make_strand(ioc)), timer_(strand_), interval_(interval), stopped_(true)
{
}

void CleanupScheduler::Start()
{
    stopped_ = false;
    boost::asio::dispatch(strand_, [this] { schedule(); });
}

void CleanupScheduler::Stop()
{
    stopped_ = true;
    boost::asio::dispatch(strand_, [this] { timer_.cancel(); });
}

std::size_t CleanupScheduler::RunOnce(Clock::time_point now)
{
    auto swept = registry_.Sweep(now);
    for (auto& item : swept)
    {
        auto& session = item.session;
        switch (item.reason)
        {
        case SweepReason::expired:
            store_.Delete(session.id);
            session.state = UploadState::terminated;
            hooks_.PostTermination(session);
            break;

        case SweepReason::completed:
            store_.Delete(session.id);
            break;

        case SweepReason::retention_expired:
            // record goes, the file stays where the completion hook saw it
            store_.Forget(session.id);
            break;
        }
    }

    if (!swept.empty())
        std::cout << "cleanup: removed " << swept.size() << " upload(s), "
                  << registry_.Size() << " remaining" << std::endl;
    return swept.size();
}

void CleanupScheduler::schedule()
{
    if (stopped_)
        return;

    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec)
    {
        if (ec || stopped_)
            return;
        try
        {
            RunOnce(Clock::now());
        }
        catch (const std::exception& e)
        {
            std::cerr << "cleanup pass failed: " << e.what() << std::endl;
        }
        schedule();
    });
}

} // namespace tusvault
