#include "resolve/text_expander.hpp"

#include <cctype>
#include <utility>

namespace uploader::resolve {

namespace {

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string expand_once(const std::string& text, const core::config::Environment& env) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
            const auto close = text.find('}', i + 2);
            if (close != std::string::npos) {
                const std::string name = text.substr(i + 2, close - i - 2);
                const auto it = env.find(name);
                if (it != env.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        } else if (c == '$' && i + 1 < text.size() && is_name_char(text[i + 1])) {
            std::size_t end = i + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            const std::string name = text.substr(i + 1, end - i - 1);
            const auto it = env.find(name);
            if (it != env.end()) {
                out += it->second;
                i = end;
                continue;
            }
        } else if (c == '%') {
            const auto close = text.find('%', i + 1);
            if (close != std::string::npos && close > i + 1) {
                const std::string name = text.substr(i + 1, close - i - 1);
                const auto it = env.find(name);
                if (it != env.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }

        out.push_back(c);
        ++i;
    }
    return out;
}

}  // namespace

std::string expand_text(const std::string& text, const core::config::Environment& env) {
    constexpr int kMaxPasses = 10;
    std::string current = text;
    for (int pass = 0; pass < kMaxPasses; ++pass) {
        std::string next = expand_once(current, env);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

}  // namespace uploader::resolve
