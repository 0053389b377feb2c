#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <arrow/result.h>

namespace star_etl {

// One piece of a template: literal text or a $(name) reference
struct TemplateSegment {
    enum class Kind { Text, Reference };

    Kind kind;
    std::string value;   // text, or the referenced column name

    bool operator==(const TemplateSegment& other) const {
        return kind == other.kind && value == other.value;
    }
};

// Placeholder-bearing string compiled once at parse time
//
// Examples:
//   "ex:dataset/$(id)"  -> [Text "ex:dataset/", Reference "id"]
//   "$(homepage)~iri"   -> [Reference "homepage"], iri marker set
//   "ex:Dataset"        -> [Text "ex:Dataset"] (constant)
class Template {
public:
    Template() = default;

    // Compile template text. Fails on an unterminated "$(" or an empty
    // reference name.
    static arrow::Result<Template> Parse(std::string_view text);

    // Template text as written in the mapping, including any ~iri marker
    const std::string& text() const { return text_; }
    const std::vector<TemplateSegment>& segments() const { return segments_; }

    // Column names referenced, in order of appearance (duplicates kept)
    std::vector<std::string> References() const;

    // True if the template ended in the "~iri" object-kind marker
    bool has_iri_marker() const { return iri_marker_; }

    // Exactly one reference and no surrounding text: "$(col)"
    bool IsDirectReference() const {
        return segments_.size() == 1 &&
               segments_[0].kind == TemplateSegment::Kind::Reference;
    }

    bool IsConstant() const;
    bool empty() const { return segments_.empty(); }

    bool operator==(const Template& other) const {
        return text_ == other.text_ && segments_ == other.segments_ &&
               iri_marker_ == other.iri_marker_;
    }

private:
    std::string text_;
    std::vector<TemplateSegment> segments_;
    bool iri_marker_ = false;
};

} // namespace star_etl
