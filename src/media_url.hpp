#pragma once

#include <filesystem>
#include <string>

namespace elan_eaf {

// "file://" URL for an absolute local path, percent-encoded like ELAN writes it.
std::string path_to_file_url(const std::filesystem::path& path);

// Inverse of path_to_file_url. Strings without a "file:" scheme are taken as plain paths.
std::filesystem::path file_url_to_path(const std::string& url);

}  // namespace elan_eaf
