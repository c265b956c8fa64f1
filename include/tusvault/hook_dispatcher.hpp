#pragma once

#include "tusvault/upload_registry.hpp"

#include <functional>
#include <string>
#include <system_error>

namespace tusvault
{

/*
  Lifecycle callbacks supplied by the embedding application at startup.
  Any slot may be left empty.

  on_creation runs before the upload is registered and receives a draft
  session without an id; a non-zero error_code (or an exception) vetoes
  the creation. The other hooks are notifications: their failures are
  logged and never undo the transition they report.
*/
struct Hooks
{
    std::function<std::error_code(const UploadSession& draft)> on_creation;
    std::function<void(const UploadSession&)> on_created;
    std::function<void(const UploadSession&, const std::string& path)> on_completed;
    std::function<void(const UploadSession&)> on_termination;
};

class HookDispatcher
{
    Hooks hooks_;

public:
    explicit HookDispatcher(Hooks hooks = Hooks()) : hooks_(std::move(hooks)) {}

    // errc::hook_rejected when vetoed
    std::error_code PreCreation(const UploadSession& draft) const;

    void PostCreation(const UploadSession& session) const noexcept;
    void PostCompletion(const UploadSession& session, const std::string& path) const noexcept;
    void PostTermination(const UploadSession& session) const noexcept;
};

} // namespace tusvault
