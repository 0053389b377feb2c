#include <star_etl/mapping/template.h>

#include <arrow/status.h>

namespace star_etl {

namespace {

constexpr std::string_view kIriMarker = "~iri";

void AppendText(std::vector<TemplateSegment>& segments, std::string_view text) {
    if (text.empty()) {
        return;
    }
    if (!segments.empty() && segments.back().kind == TemplateSegment::Kind::Text) {
        segments.back().value.append(text);
        return;
    }
    segments.push_back({TemplateSegment::Kind::Text, std::string(text)});
}

} // namespace

arrow::Result<Template> Template::Parse(std::string_view text) {
    Template tmpl;
    tmpl.text_ = std::string(text);

    std::string_view body = text;
    if (body.size() >= kIriMarker.size() &&
        body.substr(body.size() - kIriMarker.size()) == kIriMarker) {
        tmpl.iri_marker_ = true;
        body.remove_suffix(kIriMarker.size());
    }

    size_t pos = 0;
    while (pos < body.size()) {
        size_t start = body.find("$(", pos);
        if (start == std::string_view::npos) {
            AppendText(tmpl.segments_, body.substr(pos));
            break;
        }

        // "\$(" escapes a literal "$("
        if (start > 0 && body[start - 1] == '\\') {
            AppendText(tmpl.segments_, body.substr(pos, start - 1 - pos));
            AppendText(tmpl.segments_, "$(");
            pos = start + 2;
            continue;
        }

        AppendText(tmpl.segments_, body.substr(pos, start - pos));

        size_t end = body.find(')', start + 2);
        if (end == std::string_view::npos) {
            return arrow::Status::Invalid("Unterminated reference in template '",
                                          std::string(text), "'");
        }
        std::string_view name = body.substr(start + 2, end - start - 2);
        if (name.empty()) {
            return arrow::Status::Invalid("Empty reference in template '",
                                          std::string(text), "'");
        }
        tmpl.segments_.push_back({TemplateSegment::Kind::Reference, std::string(name)});
        pos = end + 1;
    }

    return tmpl;
}

std::vector<std::string> Template::References() const {
    std::vector<std::string> refs;
    for (const auto& segment : segments_) {
        if (segment.kind == TemplateSegment::Kind::Reference) {
            refs.push_back(segment.value);
        }
    }
    return refs;
}

bool Template::IsConstant() const {
    for (const auto& segment : segments_) {
        if (segment.kind == TemplateSegment::Kind::Reference) {
            return false;
        }
    }
    return true;
}

} // namespace star_etl
