#include "gt/save/KeyValueStorage.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

#include "gt/core/Logger.hpp"

namespace gt::save {

namespace {

constexpr const char* kValueExtension = ".json";
constexpr const char* kTempSuffix = ".tmp";

} // namespace

bool IsSafeStorageKey(const std::string& key) {
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::optional<std::string> MemoryKeyValueStorage::Get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStorage::Set(const std::string& key, const std::string& value) {
    m_values.insert_or_assign(key, value);
    return true;
}

bool MemoryKeyValueStorage::Remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

FileKeyValueStorage::FileKeyValueStorage(std::filesystem::path directory)
    : m_directory(std::move(directory)) {
    std::error_code ec;
    if (!std::filesystem::exists(m_directory, ec)) {
        if (!std::filesystem::create_directories(m_directory, ec)) {
            gt::core::Logger::Error("[FileKeyValueStorage] Failed to create directory: {} ({})",
                                    m_directory.string(), ec.message());
        }
    }
}

std::filesystem::path FileKeyValueStorage::PathForKey(const std::string& key) const {
    if (!IsSafeStorageKey(key)) {
        return {};
    }
    return m_directory / (key + kValueExtension);
}

std::optional<std::string> FileKeyValueStorage::Get(const std::string& key) const {
    const auto path = PathForKey(key);
    if (path.empty()) {
        gt::core::Logger::Warning("[FileKeyValueStorage] Rejecting unsafe key '{}'", key);
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        gt::core::Logger::Warning("[FileKeyValueStorage] Failed while reading {}", path.string());
        return std::nullopt;
    }
    return contents;
}

bool FileKeyValueStorage::Set(const std::string& key, const std::string& value) {
    const auto path = PathForKey(key);
    if (path.empty()) {
        gt::core::Logger::Warning("[FileKeyValueStorage] Rejecting unsafe key '{}'", key);
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);

    auto tempPath = path;
    tempPath += kTempSuffix;
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            gt::core::Logger::Error("[FileKeyValueStorage] Failed to open {} for writing", tempPath.string());
            return false;
        }
        out << value;
        out.flush();
        if (!out.good()) {
            gt::core::Logger::Error("[FileKeyValueStorage] Failed while writing {}", tempPath.string());
            return false;
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        gt::core::Logger::Error("[FileKeyValueStorage] Failed to move {} into place: {}",
                                tempPath.string(), ec.message());
        std::filesystem::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool FileKeyValueStorage::Remove(const std::string& key) {
    const auto path = PathForKey(key);
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        gt::core::Logger::Warning("[FileKeyValueStorage] Failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

} // namespace gt::save
