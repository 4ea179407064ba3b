#pragma once

#include <string>
#include <string_view>

namespace ipswdl {

// Character substituted for path separators in catalog-provided names.
inline constexpr char kSeparatorSubstitute = 'z';

// Makes a catalog name usable as a single directory or file name component:
// '/' and '\' become kSeparatorSubstitute, and names that would resolve to
// the parent or current directory are replaced by underscores. Idempotent.
inline std::string SanitizeDisplayName(std::string_view name) {
    if (name.empty() || name == ".") return "_";
    if (name == "..") return "__";

    std::string out(name);
    for (char& c : out) {
        if (c == '/' || c == '\\') c = kSeparatorSubstitute;
    }
    return out;
}

inline bool ContainsPathSeparator(std::string_view s) {
    return s.find_first_of("/\\") != std::string_view::npos;
}

} // namespace ipswdl
