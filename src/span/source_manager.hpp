#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "span.hpp"

namespace span {

// Owns the texts handed to the parsers so that diagnostics can quote them.
// Inputs are labelled ("<argument>", "--match", ...) instead of file paths.
class SourceManager {
public:
    SourceId add_source(std::string label, std::string contents);

    const std::string &get_label(SourceId source) const;
    const std::string &get_source(SourceId source) const;

    LineCol to_line_col(SourceId source, uint32_t offset) const;
    std::string_view line_view(SourceId source, size_t line) const;
    std::string format_span(const Span &span) const;

private:
    struct SourceRecord {
        std::string label;
        std::string contents;
        std::vector<size_t> line_offsets; // start offset of each line
    };

    std::vector<SourceRecord> sources;

    const SourceRecord &lookup(SourceId source) const;
};

} // namespace span
