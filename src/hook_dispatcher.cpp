#include "tusvault/hook_dispatcher.hpp"
#include "tusvault/error.hpp"

#include <exception>
#include <iostream>

namespace tusvault
{

namespace
{
template <typename Fn>
void Notify(const char* hook, const std::string& id, Fn&& fn) noexcept
{
    try
    {
        fn();
    }
    catch (const std::exception& e)
    {
        std::cerr << hook << " hook failed for " << id << ": " << e.what() << std::endl;
    }
    catch (...)
    {
        std::cerr << hook << " hook failed for " << id << ": unknown exception" << std::endl;
    }
}
} // namespace

std::error_code HookDispatcher::PreCreation(const UploadSession& draft) const
{
    if (!hooks_.on_creation)
        return {};

    std::error_code ec;
    try
    {
        ec = hooks_.on_creation(draft);
    }
    catch (const std::exception& e)
    {
        std::cerr << "creation hook threw: " << e.what() << std::endl;
        return errc::hook_rejected;
    }
    catch (...)
    {
        std::cerr << "creation hook threw an unknown exception" << std::endl;
        return errc::hook_rejected;
    }
    if (ec)
    {
        std::cerr << "creation vetoed by hook: " << ec.message() << std::endl;
        return errc::hook_rejected;
    }
    return {};
}

void HookDispatcher::PostCreation(const UploadSession& session) const noexcept
{
    if (hooks_.on_created)
        Notify("created", session.id, [&] { hooks_.on_created(session); });
}

void HookDispatcher::PostCompletion(const UploadSession& session, const std::string& path) const noexcept
{
    if (hooks_.on_completed)
        Notify("completed", session.id, [&] { hooks_.on_completed(session, path); });
}

void HookDispatcher::PostTermination(const UploadSession& session) const noexcept
{
    if (hooks_.on_termination)
        Notify("termination", session.id, [&] { hooks_.on_termination(session); });
}

} // namespace tusvault
