#ifndef SAFESEQ_TEXT_HPP
#define SAFESEQ_TEXT_HPP

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "affix.hpp"

// Line and word splitting for text treated as a sequence of characters
//
//   lines("a\nb\n")        == {"a", "b"}     trailing newline adds nothing
//   lines("\n")            == {""}
//   lines("")              == {}
//   lines_cr("a\r\nb\n")   == {"a", "b"}     one trailing '\r' removed per line

namespace safeseq {

inline std::vector<std::string> lines(std::string_view text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            out.emplace_back(text.substr(start));
            break;
        }
        out.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

inline std::vector<std::string> lines_cr(std::string_view text) {
    std::vector<std::string> out = lines(text);
    for (auto& line : out) {
        line = drop_suffix("\r", line);
    }
    return out;
}

// Inverse of lines for text that ends in a newline
template<typename Lines>
std::string unlines(const Lines& input) {
    std::string out;
    for (const auto& line : input) {
        out.append(std::string_view(line));
        out.push_back('\n');
    }
    return out;
}

inline std::vector<std::string> words(std::string_view text) {
    auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_ws(text[i]))
            ++i;
        const std::size_t start = i;
        while (i < text.size() && !is_ws(text[i]))
            ++i;
        if (i > start) {
            out.emplace_back(text.substr(start, i - start));
        }
    }
    return out;
}

template<typename Words>
std::string unwords(const Words& input) {
    std::string out;
    bool first = true;
    for (const auto& word : input) {
        if (!first) {
            out.push_back(' ');
        }
        out.append(std::string_view(word));
        first = false;
    }
    return out;
}

} // namespace safeseq

#endif // SAFESEQ_TEXT_HPP
