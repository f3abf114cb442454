#include <fstream>
#include <paneldock/logger.hpp>
#include <paneldock/storage.hpp>
#include <sstream>
#include <system_error>

namespace paneldock
{

// ─── MemoryStorage ───────────────────────────────────────────────────────────

std::optional<std::string> MemoryStorage::get(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

bool MemoryStorage::set(const std::string& key, const std::string& value)
{
    values_[key] = value;
    return true;
}

bool MemoryStorage::remove(const std::string& key)
{
    return values_.erase(key) > 0;
}

// ─── FileStorage ─────────────────────────────────────────────────────────────

FileStorage::FileStorage(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path FileStorage::path_for(const std::string& key) const
{
    std::string name;
    name.reserve(key.size() + 5);
    for (char c : key)
    {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                    || c == '.' || c == '_' || c == '-';
        name += safe ? c : '_';
    }
    name += ".json";
    return directory_ / name;
}

std::optional<std::string> FileStorage::get(const std::string& key) const
{
    std::ifstream file(path_for(key));
    if (!file.is_open())
        return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad())
    {
        PANELDOCK_LOG_WARN("storage", "Failed to read {}", path_for(key).string());
        return std::nullopt;
    }
    return ss.str();
}

bool FileStorage::set(const std::string& key, const std::string& value)
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec)
    {
        PANELDOCK_LOG_WARN("storage",
                           "Cannot create storage directory {}: {}",
                           directory_.string(),
                           ec.message());
        return false;
    }

    // Written to a sibling temp file, then renamed over the target.
    auto target = path_for(key);
    auto temp   = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open())
            return false;
        file << value;
        if (!file.good())
            return false;
    }
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        PANELDOCK_LOG_WARN("storage", "Failed to write {}: {}", target.string(), ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool FileStorage::remove(const std::string& key)
{
    std::error_code ec;
    return std::filesystem::remove(path_for(key), ec);
}

}   // namespace paneldock
