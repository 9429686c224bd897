#include "tusup/upload/session_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace tusup::upload {
namespace fs = std::filesystem;
using json = nlohmann::json;

FileSessionStore::FileSessionStore(fs::path path)
    : path_(std::move(path)) {}

Result<std::optional<network::Url>> FileSessionStore::get(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    load_locked();

    auto it = urls_.find(fingerprint);
    if (it == urls_.end()) {
        return Ok(std::optional<network::Url>{});
    }

    auto parsed = network::Url::parse(it->second);
    if (parsed.is_error()) {
        spdlog::warn("Ignoring unparsable upload URL stored for {}: {}", fingerprint, it->second);
        return Ok(std::optional<network::Url>{});
    }
    return Ok(std::optional<network::Url>{parsed.take_value()});
}

Result<void> FileSessionStore::set(const std::string& fingerprint, const network::Url& url) {
    std::lock_guard lock(mutex_);
    load_locked();
    urls_[fingerprint] = url.to_string();
    return save_locked();
}

Result<void> FileSessionStore::remove(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    load_locked();
    if (urls_.erase(fingerprint) == 0) {
        return Ok();
    }
    return save_locked();
}

void FileSessionStore::load_locked() {
    if (loaded_) {
        return;
    }
    loaded_ = true;
    urls_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return;
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        spdlog::warn("Cannot open session store {}, starting empty", path_.string());
        return;
    }
    std::ostringstream content;
    content << input.rdbuf();

    auto document = json::parse(content.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("Session store {} is corrupt, starting empty", path_.string());
        return;
    }

    for (const auto& [fingerprint, value] : document.items()) {
        if (value.is_string()) {
            urls_[fingerprint] = value.get<std::string>();
        }
    }
    spdlog::debug("Loaded {} resumable upload(s) from {}", urls_.size(), path_.string());
}

Result<void> FileSessionStore::save_locked() const {
    json document = json::object();
    for (const auto& [fingerprint, url] : urls_) {
        document[fingerprint] = url;
    }

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(io_error("Failed to create directory: " + parent.string()));
        }
    }

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(io_error("Failed to open session store for writing: " + temp.string()));
        }
        output << document.dump(2);
        if (!output) {
            return Err<void>(io_error("Failed to write session store: " + temp.string()));
        }
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(io_error("Failed to replace session store " + path_.string() + ": " + ec.message()));
    }
    return Ok();
}

} // namespace tusup::upload
