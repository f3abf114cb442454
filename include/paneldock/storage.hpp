#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace paneldock
{

// String key/value store backing layout and focus-history persistence.
class KeyValueStorage
{
   public:
    virtual ~KeyValueStorage() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    // Returns false when the value could not be written.
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key)                         = 0;
};

class MemoryStorage : public KeyValueStorage
{
   public:
    std::optional<std::string> get(const std::string& key) const override;
    bool                       set(const std::string& key, const std::string& value) override;
    bool                       remove(const std::string& key) override;

    size_t size() const { return values_.size(); }
    void   clear() { values_.clear(); }

   private:
    std::map<std::string, std::string> values_;
};

// One file per key under `directory`. Key characters outside
// [A-Za-z0-9._-] are replaced in file names.
class FileStorage : public KeyValueStorage
{
   public:
    explicit FileStorage(std::filesystem::path directory);

    std::optional<std::string> get(const std::string& key) const override;
    bool                       set(const std::string& key, const std::string& value) override;
    bool                       remove(const std::string& key) override;

    const std::filesystem::path& directory() const { return directory_; }
    std::filesystem::path        path_for(const std::string& key) const;

   private:
    std::filesystem::path directory_;
};

}   // namespace paneldock
