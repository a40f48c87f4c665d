#include "source_manager.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace span {

namespace {
std::vector<size_t> build_line_offsets(const std::string &contents) {
    std::vector<size_t> offsets{0};
    for (size_t i = 0; i < contents.size(); ++i) {
        if (contents[i] == '\n') {
            offsets.push_back(i + 1);
        }
    }
    return offsets;
}
} // namespace

SourceId SourceManager::add_source(std::string label, std::string contents) {
    SourceRecord record;
    record.label = std::move(label);
    record.contents = std::move(contents);
    record.line_offsets = build_line_offsets(record.contents);

    SourceId id = static_cast<SourceId>(sources.size());
    sources.push_back(std::move(record));
    return id;
}

const SourceManager::SourceRecord &SourceManager::lookup(SourceId source) const {
    if (source >= sources.size()) {
        throw std::out_of_range("Invalid SourceId");
    }
    return sources[source];
}

const std::string &SourceManager::get_label(SourceId source) const { return lookup(source).label; }
const std::string &SourceManager::get_source(SourceId source) const { return lookup(source).contents; }

LineCol SourceManager::to_line_col(SourceId source, uint32_t offset) const {
    const auto &offsets = lookup(source).line_offsets;
    size_t line_index = 0;
    while (line_index + 1 < offsets.size() && offsets[line_index + 1] <= offset) {
        ++line_index;
    }
    return {line_index + 1, offset - offsets[line_index] + 1};
}

std::string_view SourceManager::line_view(SourceId source, size_t line) const {
    const auto &record = lookup(source);
    const auto &offsets = record.line_offsets;
    if (line == 0 || line > offsets.size()) return {};
    size_t start = offsets[line - 1];
    size_t end = (line < offsets.size()) ? offsets[line] - 1 : record.contents.size();
    return std::string_view(record.contents).substr(start, end - start);
}

std::string SourceManager::format_span(const Span &span) const {
    if (!span.is_valid()) return "<unknown span>";

    auto loc = to_line_col(span.source, span.start);
    std::ostringstream oss;
    oss << get_label(span.source) << ":" << loc.line << ":" << loc.column;
    oss << "\n " << loc.line << " | " << line_view(span.source, loc.line);
    oss << "\n " << std::string(std::to_string(loc.line).length(), ' ') << " | ";
    oss << std::string(loc.column - 1, ' ');
    oss << std::string(std::max<uint32_t>(1, span.length()), '^');
    return oss.str();
}

} // namespace span
