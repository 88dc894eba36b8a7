#include <langextract/core/format.h>
#include <langextract/engine/response_parser.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

namespace langextract::engine {

using json = nlohmann::json;

namespace {

std::string trimmed(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

json parseLenient(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }
    // Models sometimes wrap the object in prose
    auto open = body.find('{');
    auto close = body.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return parsed;
    }
    return json::parse(body.substr(open, close - open + 1), nullptr, false);
}

} // namespace

std::string ResponseParser::stripCodeFences(std::string_view raw) {
    auto open = raw.find("```");
    if (open == std::string_view::npos) {
        return trimmed(raw);
    }
    auto bodyStart = raw.find('\n', open);
    if (bodyStart == std::string_view::npos) {
        return trimmed(raw.substr(open + 3));
    }
    ++bodyStart;
    auto close = raw.find("```", bodyStart);
    if (close == std::string_view::npos) {
        return trimmed(raw.substr(bodyStart));
    }
    return trimmed(raw.substr(bodyStart, close - bodyStart));
}

Result<std::vector<document::Extraction>> ResponseParser::parse(std::string_view raw) const {
    const auto body = stripCodeFences(raw);
    if (body.empty()) {
        return Error{ErrorCode::InvalidData, "model returned an empty response"};
    }

    const auto root = parseLenient(body);
    if (root.is_discarded()) {
        return Error{ErrorCode::InvalidData, "model response is not valid JSON"};
    }
    if (!root.is_object()) {
        return Error{ErrorCode::InvalidData,
                     format("expected JSON object, got {}", root.type_name())};
    }
    auto items = root.find("extractions");
    if (items == root.end()) {
        return Error{ErrorCode::InvalidData, "no 'extractions' field found in response"};
    }
    if (!items->is_array()) {
        return Error{ErrorCode::InvalidData, "'extractions' field is not an array"};
    }

    std::vector<document::Extraction> out;
    out.reserve(items->size());
    std::size_t skipped = 0;
    for (const auto& item : *items) {
        if (!item.is_object()) {
            ++skipped;
            continue;
        }
        auto cls = item.find("extraction_class");
        auto txt = item.find("extraction_text");
        if (cls == item.end() || !cls->is_string() || txt == item.end() || !txt->is_string() ||
            cls->get_ref<const std::string&>().empty() ||
            txt->get_ref<const std::string&>().empty()) {
            ++skipped;
            continue;
        }

        document::Extraction e(cls->get<std::string>(), txt->get<std::string>());
        e.index = static_cast<int>(out.size());
        for (auto it = item.begin(); it != item.end(); ++it) {
            const auto& key = it.key();
            const auto& value = it.value();
            if (key == "extraction_class" || key == "extraction_text") {
                continue;
            }
            if (key == "confidence" && value.is_number()) {
                e.confidence = value.get<double>();
            } else if (key == "description" && value.is_string()) {
                e.description = value.get<std::string>();
            } else if (key == "group_index" && value.is_number_integer()) {
                e.groupIndex = value.get<int>();
            } else if (key == "attributes" && value.is_object()) {
                for (auto a = value.begin(); a != value.end(); ++a) {
                    e.attributes[a.key()] = a.value();
                }
            } else {
                e.attributes[key] = value;
            }
        }
        out.push_back(std::move(e));
    }

    if (skipped > 0) {
        spdlog::debug("response parser skipped {} incomplete extraction item(s)", skipped);
    }
    return out;
}

} // namespace langextract::engine
