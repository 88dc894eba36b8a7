#include <langextract/core/format.h>
#include <langextract/document/schema.h>

#include <algorithm>

namespace langextract::document {

using json = nlohmann::json;

namespace {

void checkField(const FieldDefinition& field, const json& value,
                std::vector<ValidationIssue>& issues) {
    auto fail = [&](std::string constraint, std::string message) {
        issues.push_back(ValidationIssue{field.name, value.dump(), std::move(constraint),
                                         format("field {}: {}", field.name, message)});
    };

    switch (field.type) {
        case FieldType::String: {
            if (!value.is_string()) {
                fail("type", format("expected string, got {}", value.type_name()));
                return;
            }
            const auto& s = value.get_ref<const std::string&>();
            if (field.minLength && s.size() < *field.minLength) {
                fail("min_length", format("string too short: {} < {}", s.size(), *field.minLength));
            }
            if (field.maxLength && s.size() > *field.maxLength) {
                fail("max_length", format("string too long: {} > {}", s.size(), *field.maxLength));
            }
            if (!field.enumValues.empty() &&
                std::find(field.enumValues.begin(), field.enumValues.end(), s) ==
                    field.enumValues.end()) {
                fail("enum", format("value \"{}\" not in allowed values", s));
            }
            break;
        }
        case FieldType::Number: {
            if (!value.is_number()) {
                fail("type", format("expected number, got {}", value.type_name()));
                return;
            }
            double num = value.get<double>();
            if (field.minimum && num < *field.minimum) {
                fail("minimum", format("number too small: {} < {}", num, *field.minimum));
            }
            if (field.maximum && num > *field.maximum) {
                fail("maximum", format("number too large: {} > {}", num, *field.maximum));
            }
            break;
        }
        case FieldType::Boolean:
            if (!value.is_boolean()) {
                fail("type", format("expected boolean, got {}", value.type_name()));
            }
            break;
        case FieldType::Array:
            if (!value.is_array()) {
                fail("type", format("expected array, got {}", value.type_name()));
            }
            break;
    }
}

Result<FieldDefinition> fieldFromJson(const json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return Error{ErrorCode::InvalidData, "field definition requires a string 'name'"};
    }
    FieldDefinition field;
    field.name = j["name"].get<std::string>();
    auto typeName = j.value("type", std::string("string"));
    auto type = parseFieldType(typeName);
    if (!type) {
        return Error{ErrorCode::InvalidData,
                     format("field {}: unsupported type '{}'", field.name, typeName)};
    }
    field.type = *type;
    field.description = j.value("description", std::string());
    field.required = j.value("required", false);
    if (auto it = j.find("enum"); it != j.end()) {
        field.enumValues = it->get<std::vector<std::string>>();
    }
    if (auto it = j.find("minLength"); it != j.end()) {
        field.minLength = it->get<std::size_t>();
    }
    if (auto it = j.find("maxLength"); it != j.end()) {
        field.maxLength = it->get<std::size_t>();
    }
    if (auto it = j.find("minimum"); it != j.end()) {
        field.minimum = it->get<double>();
    }
    if (auto it = j.find("maximum"); it != j.end()) {
        field.maximum = it->get<double>();
    }
    return field;
}

json fieldToJson(const FieldDefinition& field) {
    json j{{"name", field.name}, {"type", toString(field.type)}};
    if (!field.description.empty()) {
        j["description"] = field.description;
    }
    if (field.required) {
        j["required"] = true;
    }
    if (!field.enumValues.empty()) {
        j["enum"] = field.enumValues;
    }
    if (field.minLength) {
        j["minLength"] = *field.minLength;
    }
    if (field.maxLength) {
        j["maxLength"] = *field.maxLength;
    }
    if (field.minimum) {
        j["minimum"] = *field.minimum;
    }
    if (field.maximum) {
        j["maximum"] = *field.maximum;
    }
    return j;
}

} // namespace

const char* toString(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Number: return "number";
        case FieldType::Boolean: return "boolean";
        case FieldType::Array: return "array";
    }
    return "string";
}

std::optional<FieldType> parseFieldType(const std::string& name) {
    if (name == "string")
        return FieldType::String;
    if (name == "number")
        return FieldType::Number;
    if (name == "boolean")
        return FieldType::Boolean;
    if (name == "array")
        return FieldType::Array;
    return std::nullopt;
}

Result<void> IExtractionSchema::validateExtraction(const Extraction& extraction) const {
    auto issues = validate(extraction);
    if (issues.empty()) {
        return {};
    }
    return Error{ErrorCode::ValidationError, issues.front().message};
}

BasicExtractionSchema::BasicExtractionSchema(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

std::vector<std::string> BasicExtractionSchema::classNames() const {
    std::vector<std::string> names;
    names.reserve(classes_.size());
    for (const auto& c : classes_) {
        names.push_back(c.name);
    }
    return names;
}

void BasicExtractionSchema::addClass(ClassDefinition definition) {
    classes_.push_back(std::move(definition));
}

void BasicExtractionSchema::addGlobalField(FieldDefinition field) {
    globalFields_.push_back(std::move(field));
}

const ClassDefinition* BasicExtractionSchema::findClass(const std::string& name) const {
    auto it = std::find_if(classes_.begin(), classes_.end(),
                           [&](const ClassDefinition& c) { return c.name == name; });
    return it == classes_.end() ? nullptr : &*it;
}

std::vector<ValidationIssue> BasicExtractionSchema::validate(const Extraction& extraction) const {
    std::vector<ValidationIssue> issues;

    const auto* classDef = findClass(extraction.extractionClass);
    if (!classDef) {
        issues.push_back({"extraction_class", extraction.extractionClass, "known_class",
                          format("unknown extraction class: {}", extraction.extractionClass)});
        return issues;
    }
    if (extraction.text.empty()) {
        issues.push_back(
            {"extraction_text", "", "non_empty", "extraction text cannot be empty"});
        return issues;
    }

    std::vector<const FieldDefinition*> fields;
    for (const auto& f : globalFields_) {
        fields.push_back(&f);
    }
    for (const auto& f : classDef->fields) {
        fields.push_back(&f);
    }

    const auto& attrs = extraction.attributes;
    for (const auto* field : fields) {
        if (field->required && (!attrs.is_object() || !attrs.contains(field->name))) {
            issues.push_back({field->name, "", "required",
                              format("required field {} is missing", field->name)});
        }
    }
    if (attrs.is_object()) {
        for (auto it = attrs.begin(); it != attrs.end(); ++it) {
            // Class fields are appended after globals, so the last match wins
            auto def = std::find_if(fields.rbegin(), fields.rend(),
                                    [&](const FieldDefinition* f) { return f->name == it.key(); });
            if (def != fields.rend()) {
                checkField(**def, it.value(), issues);
            }
        }
    }
    return issues;
}

Result<BasicExtractionSchema> BasicExtractionSchema::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "schema must be a JSON object"};
    }
    try {
        BasicExtractionSchema schema(j.value("name", std::string("schema")),
                                     j.value("description", std::string()));
        if (auto it = j.find("classes"); it != j.end()) {
            if (!it->is_array()) {
                return Error{ErrorCode::InvalidData, "schema 'classes' must be an array"};
            }
            for (const auto& c : *it) {
                if (!c.is_object() || !c.contains("name") || !c["name"].is_string()) {
                    return Error{ErrorCode::InvalidData, "class definition requires a 'name'"};
                }
                ClassDefinition def;
                def.name = c["name"].get<std::string>();
                def.description = c.value("description", std::string());
                if (auto fit = c.find("fields"); fit != c.end()) {
                    for (const auto& f : *fit) {
                        auto field = fieldFromJson(f);
                        if (!field) {
                            return field.error();
                        }
                        def.fields.push_back(std::move(field).value());
                    }
                }
                schema.addClass(std::move(def));
            }
        }
        if (auto it = j.find("globalFields"); it != j.end()) {
            for (const auto& f : *it) {
                auto field = fieldFromJson(f);
                if (!field) {
                    return field.error();
                }
                schema.addGlobalField(std::move(field).value());
            }
        }
        return schema;
    } catch (const json::exception& ex) {
        return Error{ErrorCode::InvalidData, format("malformed schema: {}", ex.what())};
    }
}

json BasicExtractionSchema::toJson() const {
    json classes = json::array();
    for (const auto& c : classes_) {
        json fields = json::array();
        for (const auto& f : c.fields) {
            fields.push_back(fieldToJson(f));
        }
        json cj{{"name", c.name}, {"fields", std::move(fields)}};
        if (!c.description.empty()) {
            cj["description"] = c.description;
        }
        classes.push_back(std::move(cj));
    }
    json j{{"name", name_}, {"description", description_}, {"classes", std::move(classes)}};
    if (!globalFields_.empty()) {
        json globals = json::array();
        for (const auto& f : globalFields_) {
            globals.push_back(fieldToJson(f));
        }
        j["globalFields"] = std::move(globals);
    }
    return j;
}

} // namespace langextract::document
