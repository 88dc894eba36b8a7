#include <langextract/core/format.h>
#include <langextract/document/extraction.h>

namespace langextract::document {

using json = nlohmann::json;

bool Extraction::isGrounded() const noexcept {
    return charInterval.has_value() && alignmentStatus.has_value() &&
           *alignmentStatus != AlignmentStatus::None;
}

bool Extraction::isWellGrounded() const noexcept {
    if (!isGrounded()) {
        return false;
    }
    double quality = alignmentQuality.value_or(nominalQuality(*alignmentStatus));
    return quality >= kWellGroundedQuality;
}

std::string Extraction::dedupKey() const {
    // Class names never contain a NUL, so the pair is unambiguous
    std::string key = extractionClass;
    key.push_back('\0');
    key += text;
    return key;
}

Result<void> ExampleData::validate() const {
    if (text.empty()) {
        return Error{ErrorCode::ValidationError, "example text cannot be empty"};
    }
    for (std::size_t i = 0; i < extractions.size(); ++i) {
        const auto& e = extractions[i];
        if (e.extractionClass.empty()) {
            return Error{ErrorCode::ValidationError,
                         format("example extraction {} has no class", i)};
        }
        if (e.text.empty()) {
            return Error{ErrorCode::ValidationError,
                         format("example extraction {} has no text", i)};
        }
    }
    return {};
}

json toJson(const Extraction& extraction) {
    json j;
    j["extraction_class"] = extraction.extractionClass;
    j["extraction_text"] = extraction.text;
    if (extraction.charInterval) {
        j["char_interval"] = {{"start_pos", extraction.charInterval->start},
                              {"end_pos", extraction.charInterval->end}};
    }
    if (extraction.tokenInterval) {
        j["token_interval"] = {{"start_token", extraction.tokenInterval->start},
                               {"end_token", extraction.tokenInterval->end}};
    }
    if (extraction.alignmentStatus) {
        j["alignment_status"] = toString(*extraction.alignmentStatus);
    }
    if (extraction.alignmentQuality) {
        j["alignment_quality"] = *extraction.alignmentQuality;
    }
    if (extraction.confidence) {
        j["confidence"] = *extraction.confidence;
    }
    if (extraction.index) {
        j["extraction_index"] = *extraction.index;
    }
    if (extraction.groupIndex) {
        j["group_index"] = *extraction.groupIndex;
    }
    if (extraction.description) {
        j["description"] = *extraction.description;
    }
    if (!extraction.attributes.empty()) {
        j["attributes"] = extraction.attributes;
    }
    return j;
}

Result<Extraction> extractionFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "extraction must be a JSON object"};
    }
    auto cls = j.find("extraction_class");
    auto txt = j.find("extraction_text");
    if (cls == j.end() || !cls->is_string() || txt == j.end() || !txt->is_string()) {
        return Error{ErrorCode::InvalidData,
                     "extraction requires string extraction_class and extraction_text"};
    }

    Extraction e(cls->get<std::string>(), txt->get<std::string>());
    try {
        if (auto it = j.find("char_interval"); it != j.end() && it->is_object()) {
            e.charInterval = CharInterval{it->at("start_pos").get<std::size_t>(),
                                          it->at("end_pos").get<std::size_t>()};
        }
        if (auto it = j.find("token_interval"); it != j.end() && it->is_object()) {
            e.tokenInterval = TokenInterval{it->at("start_token").get<std::size_t>(),
                                            it->at("end_token").get<std::size_t>()};
        }
        if (auto it = j.find("alignment_status"); it != j.end() && it->is_string()) {
            e.alignmentStatus = parseAlignmentStatus(it->get<std::string>());
        }
        if (auto it = j.find("alignment_quality"); it != j.end() && it->is_number()) {
            e.alignmentQuality = it->get<double>();
        }
        if (auto it = j.find("confidence"); it != j.end() && it->is_number()) {
            e.confidence = it->get<double>();
        }
        if (auto it = j.find("extraction_index"); it != j.end() && it->is_number_integer()) {
            e.index = it->get<int>();
        }
        if (auto it = j.find("group_index"); it != j.end() && it->is_number_integer()) {
            e.groupIndex = it->get<int>();
        }
        if (auto it = j.find("description"); it != j.end() && it->is_string()) {
            e.description = it->get<std::string>();
        }
        if (auto it = j.find("attributes"); it != j.end() && it->is_object()) {
            e.attributes = *it;
        }
    } catch (const json::exception& ex) {
        return Error{ErrorCode::InvalidData, format("malformed extraction: {}", ex.what())};
    }
    return e;
}

json toJson(const ExampleData& example) {
    json items = json::array();
    for (const auto& e : example.extractions) {
        items.push_back(toJson(e));
    }
    return {{"text", example.text}, {"extractions", std::move(items)}};
}

Result<ExampleData> exampleFromJson(const json& j) {
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        return Error{ErrorCode::InvalidData, "example requires a string 'text'"};
    }
    ExampleData example;
    example.text = j["text"].get<std::string>();
    if (auto it = j.find("extractions"); it != j.end()) {
        if (!it->is_array()) {
            return Error{ErrorCode::InvalidData, "example 'extractions' must be an array"};
        }
        for (const auto& item : *it) {
            auto parsed = extractionFromJson(item);
            if (!parsed) {
                return parsed.error();
            }
            example.extractions.push_back(std::move(parsed).value());
        }
    }
    return example;
}

} // namespace langextract::document
