#pragma once

#include <string>
#include <vector>
#include "core/errors/upload_errors.hpp"

namespace uploader::resolve {

// Doublestar-style globbing over '/'-separated paths.
//
// Within a segment: '*' any run of characters, '?' one character,
// "[a-z]" / "[!a-z]" character classes, "{x,y}" alternatives and '\'
// escapes. A segment that is exactly "**" matches zero or more segments.

core::errors::Status validate_pattern(const std::string& pattern);

core::errors::Result<bool> path_match(const std::string& pattern,
                                      const std::string& path);

// Expands the pattern against the filesystem. Matches come back in
// lexical order per directory, directories included.
core::errors::Result<std::vector<std::string>> glob(const std::string& pattern);

bool has_meta(const std::string& text);

// Quotes metacharacters so text matches only itself.
std::string escape(const std::string& text);

}  // namespace uploader::resolve
