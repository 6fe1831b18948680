#pragma once

namespace elan_eaf {

inline constexpr const char* kVersion = "2.0.0";
inline constexpr const char* kEafEncoding = "UTF-8";

inline constexpr const char* kDefaultTierName = "default";
inline constexpr const char* kDefaultTierTypeName = "default-lt";
inline constexpr const char* kAudioMimeType = "audio/x-wav";

}  // namespace elan_eaf
