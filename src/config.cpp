#include "tusvault/config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace tusvault
{

namespace
{
template <typename T>
T Scalar_As(const YAML::Node& node, const std::string& key)
{
    if (!node.IsScalar())
        throw std::runtime_error("config key '" + key + "' must be a scalar");
    try
    {
        return node.as<T>();
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("config key '" + key + "' has invalid value: " + e.what());
    }
}

std::chrono::seconds Seconds_From(const YAML::Node& node, const std::string& key)
{
    const auto val = Scalar_As<long long>(node, key);
    if (val < 0)
        throw std::runtime_error("config key '" + key + "' must not be negative");
    return std::chrono::seconds(val);
}
} // namespace

Config LoadConfigFromYaml(const std::string& path)
{
    YAML::Node yaml;
    try
    {
        yaml = YAML::LoadFile(path);
    }
    catch (const std::exception& e)
    {
        throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
    }

    Config config;
    if (yaml.IsNull())
        return config;
    if (!yaml.IsMap())
        throw std::runtime_error("Invalid configuration: top level must be a map");

    for (const auto& kv : yaml)
    {
        const auto key = kv.first.as<std::string>();
        const auto& val = kv.second;

        if (key == "mount_path")
            config.mount_path = Scalar_As<std::string>(val, key);
        else if (key == "temp_dir")
            config.temp_dir = Scalar_As<std::string>(val, key);
        else if (key == "max_size")
            config.max_size = Scalar_As<std::uint64_t>(val, key);
        else if (key == "session_ttl")
            config.session_ttl = Seconds_From(val, key);
        else if (key == "keep_on_disk")
            config.keep_on_disk = Scalar_As<bool>(val, key);
        else if (key == "max_concurrent_uploads")
            config.max_concurrent_uploads = Scalar_As<std::size_t>(val, key);
        else if (key == "cleanup_interval")
            config.cleanup_interval = Seconds_From(val, key);
        else if (key == "read_timeout")
            config.read_timeout = Seconds_From(val, key);
        else if (key == "refresh_expiry")
            config.refresh_expiry = Scalar_As<bool>(val, key);
        else if (key == "base_url")
            config.base_url = Scalar_As<std::string>(val, key);
        else if (key == "threads")
            config.threads = Scalar_As<unsigned>(val, key);
        else
            throw std::runtime_error("Invalid configuration: unknown key '" + key + "'");
    }

    Validate(config);
    return config;
}

void Validate(const Config& config)
{
    if (config.mount_path.empty() || config.mount_path.front() != '/')
        throw std::runtime_error("Invalid configuration: mount_path must start with '/'");
    if (config.mount_path.size() > 1 && config.mount_path.back() == '/')
        throw std::runtime_error("Invalid configuration: mount_path must not end with '/'");
    if (config.temp_dir.empty())
        throw std::runtime_error("Invalid configuration: temp_dir is empty");
    if (config.max_size == 0)
        throw std::runtime_error("Invalid configuration: max_size must be positive");
    if (config.session_ttl.count() == 0)
        throw std::runtime_error("Invalid configuration: session_ttl must be positive");
    if (config.cleanup_interval.count() == 0)
        throw std::runtime_error("Invalid configuration: cleanup_interval must be positive");
    if (config.read_timeout.count() == 0)
        throw std::runtime_error("Invalid configuration: read_timeout must be positive");
    if (config.threads == 0)
        throw std::runtime_error("Invalid configuration: threads must be positive");
}

} // namespace tusvault
