#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <langextract/core/types.h>
#include <langextract/document/extraction.h>

namespace langextract::engine {

/**
 * @brief Turns raw model output into ungrounded extractions.
 *
 * The output must be a JSON object with an "extractions" array, optionally wrapped in a
 * markdown code fence. Items without a string class and text are skipped; "confidence",
 * "description" and "group_index" map to their fields and every other key becomes an
 * attribute.
 */
class ResponseParser {
public:
    Result<std::vector<document::Extraction>> parse(std::string_view raw) const;

    /// Body of the first ``` fenced block, or the trimmed input when there is none
    static std::string stripCodeFences(std::string_view raw);
};

} // namespace langextract::engine
