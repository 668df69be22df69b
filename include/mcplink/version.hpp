#pragma once

namespace mcplink {

inline constexpr const char* kLibraryName = "mcplink";
inline constexpr const char* kLibraryVersion = "0.3.0";

}  // namespace mcplink
