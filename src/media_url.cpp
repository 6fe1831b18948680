#include "media_url.hpp"

#include <cctype>

namespace elan_eaf {

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

}  // namespace

std::string path_to_file_url(const std::filesystem::path& path) {
    static const char* kHex = "0123456789ABCDEF";

    const std::string raw = path.generic_string();
    std::string out = "file://";
    out.reserve(out.size() + raw.size());
    for (unsigned char c : raw) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::filesystem::path file_url_to_path(const std::string& url) {
    std::string rest;
    if (url.starts_with("file://localhost/")) {
        rest = url.substr(16);
    } else if (url.starts_with("file://")) {
        rest = url.substr(7);
    } else if (url.starts_with("file:")) {
        rest = url.substr(5);
    } else {
        return std::filesystem::path(url);
    }
    return std::filesystem::path(percent_decode(rest));
}

}  // namespace elan_eaf
