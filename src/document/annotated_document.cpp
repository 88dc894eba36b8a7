#include <langextract/document/annotated_document.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace langextract::document {

AnnotatedDocument::AnnotatedDocument(Document document, std::vector<Extraction> extractions)
    : document_(std::move(document)), extractions_(std::move(extractions)) {}

std::vector<Extraction> AnnotatedDocument::byClass(const std::string& extractionClass) const {
    std::vector<Extraction> out;
    std::copy_if(extractions_.begin(), extractions_.end(), std::back_inserter(out),
                 [&](const Extraction& e) { return e.extractionClass == extractionClass; });
    return out;
}

std::vector<Extraction> AnnotatedDocument::byGroup(int groupIndex) const {
    std::vector<Extraction> out;
    std::copy_if(extractions_.begin(), extractions_.end(), std::back_inserter(out),
                 [&](const Extraction& e) { return e.groupIndex == groupIndex; });
    return out;
}

std::vector<std::string> AnnotatedDocument::uniqueClasses() const {
    std::vector<std::string> classes;
    std::unordered_set<std::string> seen;
    for (const auto& e : extractions_) {
        if (seen.insert(e.extractionClass).second) {
            classes.push_back(e.extractionClass);
        }
    }
    return classes;
}

std::vector<Extraction> AnnotatedDocument::sortedByPosition() const {
    std::vector<Extraction> sorted = extractions_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Extraction& a, const Extraction& b) {
        bool ga = a.isGrounded();
        bool gb = b.isGrounded();
        if (ga != gb) {
            return ga;
        }
        if (!ga) {
            return false;
        }
        if (a.charInterval->start != b.charInterval->start) {
            return a.charInterval->start < b.charInterval->start;
        }
        return a.charInterval->end < b.charInterval->end;
    });
    return sorted;
}

std::size_t AnnotatedDocument::groundedCount() const {
    return static_cast<std::size_t>(std::count_if(
        extractions_.begin(), extractions_.end(), [](const Extraction& e) { return e.isGrounded(); }));
}

double AnnotatedDocument::coverage() const {
    return computeCoverage(extractions_, document_.length());
}

nlohmann::json AnnotatedDocument::toJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& e : extractions_) {
        items.push_back(document::toJson(e));
    }
    nlohmann::json j;
    j["document_id"] = document_.id();
    j["text"] = document_.text();
    if (document_.additionalContext()) {
        j["additional_context"] = *document_.additionalContext();
    }
    j["extractions"] = std::move(items);
    return j;
}

double computeCoverage(const std::vector<Extraction>& extractions, std::size_t textLength) {
    if (textLength == 0) {
        return 0.0;
    }
    std::vector<CharInterval> spans;
    for (const auto& e : extractions) {
        if (e.isGrounded() && !e.charInterval->empty()) {
            spans.push_back(*e.charInterval);
        }
    }
    std::sort(spans.begin(), spans.end(),
              [](const CharInterval& a, const CharInterval& b) { return a.start < b.start; });

    std::size_t covered = 0;
    std::size_t cursor = 0;
    for (const auto& span : spans) {
        std::size_t start = std::max(span.start, cursor);
        std::size_t end = std::min(span.end, textLength);
        if (end > start) {
            covered += end - start;
            cursor = end;
        }
    }
    return static_cast<double>(covered) / static_cast<double>(textLength);
}

} // namespace langextract::document
