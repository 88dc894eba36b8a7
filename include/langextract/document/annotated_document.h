#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <langextract/document/document.h>
#include <langextract/document/extraction.h>

namespace langextract::document {

/**
 * @brief Sealed pipeline output: a document with its final grounded extractions.
 *
 * Renderers read it through the const accessors only.
 */
class AnnotatedDocument {
public:
    AnnotatedDocument(Document document, std::vector<Extraction> extractions);

    const Document& document() const noexcept { return document_; }
    const std::vector<Extraction>& extractions() const noexcept { return extractions_; }
    std::size_t size() const noexcept { return extractions_.size(); }

    std::vector<Extraction> byClass(const std::string& extractionClass) const;
    std::vector<Extraction> byGroup(int groupIndex) const;

    /// Distinct classes in first-seen order
    std::vector<std::string> uniqueClasses() const;

    /// Grounded extractions ordered by start offset, ungrounded ones trailing
    std::vector<Extraction> sortedByPosition() const;

    std::size_t groundedCount() const;

    /// Fraction of characters covered by the union of grounded intervals
    double coverage() const;

    nlohmann::json toJson() const;

private:
    Document document_;
    std::vector<Extraction> extractions_;
};

/// Fraction of [0, textLength) covered by the union of grounded intervals
double computeCoverage(const std::vector<Extraction>& extractions, std::size_t textLength);

} // namespace langextract::document
