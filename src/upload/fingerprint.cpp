#include "tusup/upload/fingerprint.hpp"

#include <cctype>

namespace tusup::upload {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::string generate_fingerprint(const std::string& file_path) {
    std::string fingerprint;
    fingerprint.reserve(file_path.size());

    bool in_separator_run = false;
    for (char c : file_path) {
        if (is_word_char(c)) {
            fingerprint += c;
            in_separator_run = false;
        } else if (!in_separator_run) {
            fingerprint += '.';
            in_separator_run = true;
        }
    }
    return fingerprint;
}

} // namespace tusup::upload
