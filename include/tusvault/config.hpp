#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tusvault
{

/*
  Settings read once at startup. The engine receives a copy and never
  changes it.
*/
struct Config
{
    std::string mount_path = "/files";
    std::string temp_dir = "files";
    std::uint64_t max_size = 1073741824;
    std::chrono::seconds session_ttl{24 * 60 * 60};
    bool keep_on_disk = false;
    std::size_t max_concurrent_uploads = 0; // 0: unlimited
    std::chrono::seconds cleanup_interval{60};
    std::chrono::seconds read_timeout{60};
    bool refresh_expiry = true;
    std::string base_url;
    unsigned threads = 1;
};

// Throws std::runtime_error on unreadable files, unknown keys or bad values.
Config LoadConfigFromYaml(const std::string& path);

void Validate(const Config& config);

} // namespace tusvault
