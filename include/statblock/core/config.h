#ifndef STATBLOCK_CORE_CONFIG_H
#define STATBLOCK_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace statblock::core::config {

// Column defaults used when neither the record nor the caller says otherwise.
inline constexpr int kDefaultColumns = 1;
inline constexpr int kDefaultMaxColumns = 2;
inline constexpr const char kDefaultColumnWidth[] = "400px";

// Lower bound for the per-column height budget when no column count is forced.
inline constexpr double kMinSplitHeight = 600.0;

inline constexpr const char kDefaultSpellcastingHeading[] = "Spellcasting";

// Script sandbox limits, applied to every fresh runtime.
inline constexpr std::size_t kScriptMemoryLimit = 16 * 1024 * 1024;
inline constexpr std::size_t kScriptStackSize = 1024 * 1024;
inline constexpr std::uint32_t kScriptTimeoutMs = 250;

// Named layouts may reference each other; deeper chains are cut off.
inline constexpr int kMaxLayoutDepth = 16;

inline constexpr std::size_t kDiagnosticHistory = 512;

}  // namespace statblock::core::config

#endif  // STATBLOCK_CORE_CONFIG_H
