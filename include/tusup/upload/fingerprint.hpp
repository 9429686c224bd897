#pragma once

#include <functional>
#include <string>

namespace tusup::upload {

/**
 * @brief Derive the resume key for a local file
 *
 * Every maximal run of non-word characters (anything but [A-Za-z0-9_]) is
 * replaced by a single '.'. The result depends on the path only, so paths
 * differing just in punctuation share a fingerprint.
 *
 * "/home/me/My Video (1).mp4" -> ".home.me.My.Video.1.mp4"
 */
std::string generate_fingerprint(const std::string& file_path);

using FingerprintFn = std::function<std::string(const std::string& file_path)>;

} // namespace tusup::upload
