#pragma once

/**
 * @file session_store.hpp
 * @brief Fingerprint -> upload URL persistence used to resume uploads
 *
 * The upload client asks the store for a previously negotiated upload URL
 * before creating a new upload, records the URL after creation, and forgets
 * it once the upload completes. A new upload always gets a new URL, so there
 * is no update-in-place: set() simply overwrites (last write wins).
 *
 * Implementations must be safe to share between clients uploading different
 * files concurrently.
 */

#include "tusup/core/result.hpp"
#include "tusup/network/url.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tusup::upload {

class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Result<std::optional<network::Url>> get(const std::string& fingerprint) = 0;
    virtual Result<void> set(const std::string& fingerprint, const network::Url& url) = 0;
    virtual Result<void> remove(const std::string& fingerprint) = 0;
};

/**
 * @brief Process-local store
 *
 * Reads take a shared lock, writes an exclusive one.
 */
class MemorySessionStore : public SessionStore {
public:
    MemorySessionStore() = default;

    Result<std::optional<network::Url>> get(const std::string& fingerprint) override {
        std::shared_lock lock(mutex_);
        auto it = urls_.find(fingerprint);
        if (it == urls_.end()) {
            return Ok(std::optional<network::Url>{});
        }
        return Ok(std::optional<network::Url>{it->second});
    }

    Result<void> set(const std::string& fingerprint, const network::Url& url) override {
        std::unique_lock lock(mutex_);
        urls_[fingerprint] = url;
        return Ok();
    }

    Result<void> remove(const std::string& fingerprint) override {
        std::unique_lock lock(mutex_);
        urls_.erase(fingerprint);
        return Ok();
    }

    std::size_t size() const {
        std::shared_lock lock(mutex_);
        return urls_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, network::Url> urls_;
};

/**
 * @brief Store persisted as a JSON object on disk
 *
 * File format: {"<fingerprint>": "<upload url>", ...}
 *
 * The file is loaded on first use and rewritten through a temporary file and
 * rename on every mutation, so a crash leaves either the old or the new
 * content. An unreadable or corrupt file is logged and treated as empty.
 */
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(std::filesystem::path path);

    Result<std::optional<network::Url>> get(const std::string& fingerprint) override;
    Result<void> set(const std::string& fingerprint, const network::Url& url) override;
    Result<void> remove(const std::string& fingerprint) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void load_locked();
    Result<void> save_locked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    bool loaded_ = false;
    std::unordered_map<std::string, std::string> urls_;
};

} // namespace tusup::upload
