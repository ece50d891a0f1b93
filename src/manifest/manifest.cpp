#include "runfiles/manifest.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace runfiles {

ManifestParseResult parse_runfiles_manifest(const std::string& content,
                                            const std::string& source) {
    ManifestParseResult out;

    size_t line_no = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) {
            end = content.size();
        }
        std::string line = content.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto space = line.find(' ');
        if (space == std::string::npos || space == 0) {
            out.ok = false;
            out.error_line = line_no;
            out.error = "bad runfiles manifest entry in " + source + " line #" +
                        std::to_string(line_no) + ": \"" + line + "\"";
            out.entries.clear();
            return out;
        }

        std::string key = line.substr(0, space);
        std::string value = line.substr(space + 1);

        auto [it, inserted] = out.entries.insert_or_assign(std::move(key), std::move(value));
        if (!inserted) {
            ++out.duplicates;
            spdlog::debug("runfiles manifest {} line #{}: \"{}\" overrides an earlier entry",
                          source, line_no, it->first);
        }
    }

    out.ok = true;
    return out;
}

} // namespace runfiles
