#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "safeseq/safeseq.hpp"

// Parses a small key=value block with CRLF line endings without a single
// unchecked front(), back() or max_element().

using Entry = std::pair<std::string, std::string>;

static safeseq::Option<Entry> parse_entry(const std::string& line) {
    if (line.empty() || safeseq::is_prefix_of("#", line)) {
        return safeseq::None;
    }
    auto eq = safeseq::elem_index(line, '=');
    if (eq.is_none()) {
        return safeseq::None;
    }
    const std::size_t pos = eq.unwrap();
    return safeseq::Some(Entry(line.substr(0, pos), line.substr(pos + 1)));
}

int main() {
    const std::string text =
        "# service settings\r\n"
        "name=ledger\r\n"
        "listen_address=0.0.0.0\r\n"
        "\r\n"
        "workers=4\r\n";

    std::vector<Entry> entries;
    for (const auto& line : safeseq::lines_cr(text)) {
        auto entry = parse_entry(line);
        if (entry.is_some()) {
            entries.push_back(entry.unwrap());
        }
    }

    std::cout << "Parsed " << entries.size() << " entries\n";

    auto longest = safeseq::maximum_by_maybe(
        entries, safeseq::comparing([](const Entry& e) { return e.first.size(); }));
    if (longest.is_some()) {
        std::cout << "Longest key: " << longest.unwrap().first << "\n";
    }

    auto workers = safeseq::lookup(std::string("workers"), entries);
    std::cout << "Workers: " << workers.unwrap_or("1") << "\n";

    auto host = safeseq::lookup(std::string("listen_address"), entries)
                    .map([](std::string addr) { return safeseq::drop_suffix(".0", addr); });
    std::cout << "Address without last octet: " << host.unwrap_or("<none>") << "\n";

    std::vector<std::string> empty;
    std::cout << "First of nothing: "
              << (safeseq::head_maybe(empty).is_none() ? "None" : "Some") << "\n";

    return 0;
}
