#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace gt::save {

/// Letters, digits, '_', '-' and '.' only, and never "." or "..": the key maps to one file name.
bool IsSafeStorageKey(const std::string& key);

/**
 * @brief Durable string storage the session is persisted into.
 *
 * Values are opaque to the storage.
 */
class IKeyValueStorage {
public:
    virtual ~IKeyValueStorage() = default;

    virtual std::optional<std::string> Get(const std::string& key) const = 0;
    virtual bool Set(const std::string& key, const std::string& value) = 0;
    virtual bool Remove(const std::string& key) = 0;
};

class MemoryKeyValueStorage : public IKeyValueStorage {
public:
    std::optional<std::string> Get(const std::string& key) const override;
    bool Set(const std::string& key, const std::string& value) override;
    bool Remove(const std::string& key) override;

private:
    std::unordered_map<std::string, std::string> m_values;
};

/// One file per key inside a directory; writes go through a temporary file and a rename.
class FileKeyValueStorage : public IKeyValueStorage {
public:
    explicit FileKeyValueStorage(std::filesystem::path directory);

    const std::filesystem::path& Directory() const { return m_directory; }

    std::optional<std::string> Get(const std::string& key) const override;
    bool Set(const std::string& key, const std::string& value) override;
    bool Remove(const std::string& key) override;

    /// Empty when the key has characters unsafe for a file name.
    std::filesystem::path PathForKey(const std::string& key) const;

private:
    std::filesystem::path m_directory;
};

} // namespace gt::save
