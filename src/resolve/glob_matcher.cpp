#include "resolve/glob_matcher.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace uploader::resolve {

using core::errors::ErrorCategory;
using core::errors::Status;
using core::errors::UploadError;

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxBraceExpansions = 4096;

UploadError bad_pattern(const std::string& pattern, const std::string& reason) {
    return UploadError{ErrorCategory::Resolution,
                       "Syntax error in pattern '" + pattern + "': " + reason,
                       "bad_pattern"};
}

// Index of the ']' closing the class opened at p[i], or npos. A ']' right
// after the opening (and optional negation) is a literal member.
std::size_t class_end(const std::string& p, const std::size_t i) {
    std::size_t j = i + 1;
    if (j < p.size() && (p[j] == '!' || p[j] == '^')) {
        ++j;
    }
    bool first = true;
    while (j < p.size()) {
        if (p[j] == ']' && !first) {
            return j;
        }
        if (p[j] == '\\') {
            ++j;
            if (j >= p.size()) {
                return std::string::npos;
            }
        }
        ++j;
        first = false;
    }
    return std::string::npos;
}

std::size_t brace_end(const std::string& p, const std::size_t i) {
    int depth = 0;
    std::size_t j = i;
    while (j < p.size()) {
        const char c = p[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '[') {
            const auto end = class_end(p, j);
            if (end == std::string::npos) {
                return std::string::npos;
            }
            j = end + 1;
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return j;
            }
        }
        ++j;
    }
    return std::string::npos;
}

// Splits the body of a brace group on its top-level commas.
std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> alternatives;
    std::string current;
    int depth = 0;
    std::size_t j = 0;
    while (j < body.size()) {
        const char c = body[j];
        if (c == '\\' && j + 1 < body.size()) {
            current += body.substr(j, 2);
            j += 2;
            continue;
        }
        if (c == '[') {
            const auto end = class_end(body, j);
            if (end != std::string::npos) {
                current += body.substr(j, end - j + 1);
                j = end + 1;
                continue;
            }
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
        } else if (c == ',' && depth == 0) {
            alternatives.push_back(current);
            current.clear();
            ++j;
            continue;
        }
        current.push_back(c);
        ++j;
    }
    alternatives.push_back(current);
    return alternatives;
}

// Index of the first top-level '{', or npos.
std::size_t first_brace(const std::string& p) {
    std::size_t j = 0;
    while (j < p.size()) {
        const char c = p[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '[') {
            const auto end = class_end(p, j);
            if (end == std::string::npos) {
                return std::string::npos;
            }
            j = end + 1;
            continue;
        }
        if (c == '{') {
            return j;
        }
        ++j;
    }
    return std::string::npos;
}

core::errors::Result<std::vector<std::string>> expand_braces(const std::string& pattern) {
    std::vector<std::string> pending{pattern};
    std::vector<std::string> expanded;
    while (!pending.empty()) {
        std::string current = std::move(pending.back());
        pending.pop_back();

        const auto open = first_brace(current);
        if (open == std::string::npos) {
            expanded.push_back(std::move(current));
            continue;
        }
        const auto close = brace_end(current, open);
        if (close == std::string::npos) {
            return bad_pattern(pattern, "unterminated '{'");
        }

        const std::string prefix = current.substr(0, open);
        const std::string suffix = current.substr(close + 1);
        const auto alternatives = split_alternatives(current.substr(open + 1, close - open - 1));
        // Pushed in reverse so alternatives come out in written order.
        for (auto it = alternatives.rbegin(); it != alternatives.rend(); ++it) {
            pending.push_back(prefix + *it + suffix);
        }
        if (pending.size() + expanded.size() > kMaxBraceExpansions) {
            return bad_pattern(pattern, "too many brace alternatives");
        }
    }
    return expanded;
}

bool match_class(const std::string& p, const std::size_t open, const char ch,
                 std::size_t& next) {
    std::size_t j = open + 1;
    bool negate = false;
    if (j < p.size() && (p[j] == '!' || p[j] == '^')) {
        negate = true;
        ++j;
    }

    bool matched = false;
    bool first = true;
    while (j < p.size() && (p[j] != ']' || first)) {
        char lo = p[j];
        if (lo == '\\') {
            ++j;
            lo = p[j];
        }
        ++j;
        char hi = lo;
        if (j + 1 < p.size() && p[j] == '-' && p[j + 1] != ']') {
            ++j;
            hi = p[j];
            if (hi == '\\') {
                ++j;
                hi = p[j];
            }
            ++j;
        }
        if (lo <= ch && ch <= hi) {
            matched = true;
        }
        first = false;
    }
    next = j + 1;
    return matched != negate;
}

// Matches one brace-free segment pattern against one name.
bool match_segment(const std::string& p, std::size_t pi, const std::string& s,
                   std::size_t si) {
    while (pi < p.size()) {
        const char c = p[pi];
        if (c == '*') {
            while (pi < p.size() && p[pi] == '*') {
                ++pi;
            }
            if (pi == p.size()) {
                return true;
            }
            for (std::size_t k = si; k <= s.size(); ++k) {
                if (match_segment(p, pi, s, k)) {
                    return true;
                }
            }
            return false;
        }
        if (si == s.size()) {
            return false;
        }
        if (c == '?') {
            ++pi;
            ++si;
            continue;
        }
        if (c == '[') {
            std::size_t next = 0;
            if (!match_class(p, pi, s[si], next)) {
                return false;
            }
            pi = next;
            ++si;
            continue;
        }
        char literal = c;
        if (c == '\\' && pi + 1 < p.size()) {
            ++pi;
            literal = p[pi];
        }
        if (literal != s[si]) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == s.size();
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        const auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

bool match_segments(const std::vector<std::string>& pattern, std::size_t pi,
                    const std::vector<std::string>& path, std::size_t si) {
    while (pi < pattern.size()) {
        if (pattern[pi] == "**") {
            while (pi < pattern.size() && pattern[pi] == "**") {
                ++pi;
            }
            if (pi == pattern.size()) {
                return true;
            }
            for (std::size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pattern, pi, path, k)) {
                    return true;
                }
            }
            return false;
        }
        if (si == path.size()) {
            return false;
        }
        if (!match_segment(pattern[pi], 0, path[si], 0)) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == path.size();
}

std::string unescape(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '\\' && i + 1 < segment.size()) {
            ++i;
        }
        out.push_back(segment[i]);
    }
    return out;
}

Status list_sorted(const fs::path& dir, std::vector<fs::directory_entry>& entries) {
    const fs::path listing = dir.empty() ? fs::path(".") : dir;
    std::error_code ec;
    fs::directory_iterator it(listing, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory ||
            ec == std::errc::not_a_directory) {
            return core::errors::ok();
        }
        return UploadError{ErrorCategory::Resolution,
                           "Failed to read directory " + listing.string() + ": " +
                               ec.message(),
                           "directory_read_failed"};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return UploadError{ErrorCategory::Resolution,
                           "Failed to list directory " + listing.string() + ": " +
                               ec.message(),
                           "directory_read_failed"};
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });
    return core::errors::ok();
}

bool is_real_directory(const fs::directory_entry& entry) {
    std::error_code ec;
    if (entry.is_symlink(ec) || ec) {
        return false;
    }
    return entry.is_directory(ec) && !ec;
}

Status collect_all(const fs::path& dir, std::vector<std::string>& out) {
    std::vector<fs::directory_entry> entries;
    auto listed = list_sorted(dir, entries);
    if (core::errors::is_error(listed)) {
        return listed;
    }
    for (const auto& entry : entries) {
        out.push_back(entry.path().string());
        if (is_real_directory(entry)) {
            auto nested = collect_all(entry.path(), out);
            if (core::errors::is_error(nested)) {
                return nested;
            }
        }
    }
    return core::errors::ok();
}

Status walk(const fs::path& dir, const std::vector<std::string>& segments,
            const std::size_t i, std::vector<std::string>& out) {
    if (i == segments.size()) {
        out.push_back(dir.string());
        return core::errors::ok();
    }

    const std::string& segment = segments[i];
    const bool last = i + 1 == segments.size();
    if (segment.empty()) {
        return walk(dir, segments, i + 1, out);
    }

    if (segment == "**") {
        if (last) {
            out.push_back(dir.string());
            return collect_all(dir, out);
        }
        auto here = walk(dir, segments, i + 1, out);
        if (core::errors::is_error(here)) {
            return here;
        }
        std::vector<fs::directory_entry> entries;
        auto listed = list_sorted(dir, entries);
        if (core::errors::is_error(listed)) {
            return listed;
        }
        for (const auto& entry : entries) {
            if (!is_real_directory(entry)) {
                continue;
            }
            auto nested = walk(entry.path(), segments, i, out);
            if (core::errors::is_error(nested)) {
                return nested;
            }
        }
        return core::errors::ok();
    }

    std::error_code ec;
    if (!has_meta(segment)) {
        const fs::path child = dir / unescape(segment);
        const auto child_status = fs::symlink_status(child, ec);
        if (ec || !fs::exists(child_status)) {
            return core::errors::ok();
        }
        if (last) {
            out.push_back(child.string());
            return core::errors::ok();
        }
        if (fs::is_directory(child, ec) && !ec) {
            return walk(child, segments, i + 1, out);
        }
        return core::errors::ok();
    }

    std::vector<fs::directory_entry> entries;
    auto listed = list_sorted(dir, entries);
    if (core::errors::is_error(listed)) {
        return listed;
    }
    for (const auto& entry : entries) {
        if (!match_segment(segment, 0, entry.path().filename().string(), 0)) {
            continue;
        }
        if (last) {
            out.push_back(entry.path().string());
            continue;
        }
        if (entry.is_directory(ec) && !ec) {
            auto nested = walk(entry.path(), segments, i + 1, out);
            if (core::errors::is_error(nested)) {
                return nested;
            }
        }
    }
    return core::errors::ok();
}

}  // namespace

Status validate_pattern(const std::string& pattern) {
    std::size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                return bad_pattern(pattern, "trailing escape character");
            }
            i += 2;
            continue;
        }
        if (c == '[') {
            const auto end = class_end(pattern, i);
            if (end == std::string::npos) {
                return bad_pattern(pattern, "unterminated '['");
            }
            i = end + 1;
            continue;
        }
        if (c == '{' && brace_end(pattern, i) == std::string::npos) {
            return bad_pattern(pattern, "unterminated '{'");
        }
        ++i;
    }
    return core::errors::ok();
}

core::errors::Result<bool> path_match(const std::string& pattern,
                                      const std::string& path) {
    auto valid = validate_pattern(pattern);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    auto alternatives = expand_braces(pattern);
    if (core::errors::is_error(alternatives)) {
        return core::errors::get_error(alternatives);
    }

    const auto path_segments = split_segments(path);
    for (const auto& alternative : core::errors::get_value(alternatives)) {
        if (match_segments(split_segments(alternative), 0, path_segments, 0)) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::vector<std::string>> glob(const std::string& pattern) {
    auto valid = validate_pattern(pattern);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    auto alternatives = expand_braces(pattern);
    if (core::errors::is_error(alternatives)) {
        return core::errors::get_error(alternatives);
    }

    std::vector<std::string> raw;
    for (const auto& alternative : core::errors::get_value(alternatives)) {
        const auto segments = split_segments(alternative);
        const bool absolute = !alternative.empty() && alternative.front() == '/';
        auto walked = absolute ? walk(fs::path("/"), segments, 1, raw)
                               : walk(fs::path(), segments, 0, raw);
        if (core::errors::is_error(walked)) {
            return core::errors::get_error(walked);
        }
    }

    std::vector<std::string> matches;
    std::unordered_set<std::string> seen;
    for (const auto& match : raw) {
        std::string normalized = fs::path(match).lexically_normal().string();
        if (normalized.size() > 1 && normalized.back() == '/') {
            normalized.pop_back();
        }
        if (seen.insert(normalized).second) {
            matches.push_back(std::move(normalized));
        }
    }
    return matches;
}

bool has_meta(const std::string& text) {
    return text.find_first_of("*?[{\\") != std::string::npos;
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (const char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '{' || c == '}' ||
            c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

}  // namespace uploader::resolve
