#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <langextract/core/types.h>
#include <langextract/document/extraction.h>

namespace langextract::document {

/**
 * @brief One schema violation found on an extraction.
 */
struct ValidationIssue {
    std::string field;      ///< Attribute name, or "extraction_class" / "extraction_text"
    std::string value;      ///< Offending value rendered as text
    std::string constraint; ///< Rule that failed, e.g. "required", "enum", "max_length"
    std::string message;
};

enum class FieldType { String, Number, Boolean, Array };

struct FieldDefinition {
    std::string name;
    FieldType type = FieldType::String;
    std::string description;
    bool required = false;
    std::vector<std::string> enumValues;
    std::optional<std::size_t> minLength;
    std::optional<std::size_t> maxLength;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

struct ClassDefinition {
    std::string name;
    std::string description;
    std::vector<FieldDefinition> fields;
};

/**
 * @brief Constraint set used to validate extractions after aggregation.
 */
class IExtractionSchema {
public:
    virtual ~IExtractionSchema() = default;

    virtual const std::string& name() const = 0;
    virtual std::vector<std::string> classNames() const = 0;

    /// Every violation on @p extraction; empty when valid
    virtual std::vector<ValidationIssue> validate(const Extraction& extraction) const = 0;

    /// First violation as a ValidationError, success when valid
    Result<void> validateExtraction(const Extraction& extraction) const;
};

class BasicExtractionSchema : public IExtractionSchema {
public:
    BasicExtractionSchema(std::string name, std::string description = {});

    const std::string& name() const override { return name_; }
    const std::string& description() const { return description_; }
    std::vector<std::string> classNames() const override;
    std::vector<ValidationIssue> validate(const Extraction& extraction) const override;

    void addClass(ClassDefinition definition);
    void addGlobalField(FieldDefinition field);
    const ClassDefinition* findClass(const std::string& name) const;

    /**
     * @brief Load a schema from its JSON form.
     *
     * Expected shape: {"name", "description", "classes": [{"name", "description",
     * "fields": [...]}], "globalFields": [...]} with field keys "name", "type", "required",
     * "enum", "minLength", "maxLength", "minimum", "maximum".
     */
    static Result<BasicExtractionSchema> fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

private:
    std::string name_;
    std::string description_;
    std::vector<ClassDefinition> classes_;
    std::vector<FieldDefinition> globalFields_;
};

const char* toString(FieldType type);
std::optional<FieldType> parseFieldType(const std::string& name);

} // namespace langextract::document
