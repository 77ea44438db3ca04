#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stackreg {

// ============================================================================
// Schema Kinds
// ============================================================================

enum class SchemaKind {
    String,
    Url,      // string with a scheme and a non-empty remainder
    Number,
    Boolean,
    Array,
    Object
};

inline const char* schema_kind_to_string(SchemaKind k) {
    switch (k) {
        case SchemaKind::String: return "string";
        case SchemaKind::Url: return "url";
        case SchemaKind::Number: return "number";
        case SchemaKind::Boolean: return "boolean";
        case SchemaKind::Array: return "array";
        case SchemaKind::Object: return "object";
    }
    return "string";
}

// ============================================================================
// Validation Report
// ============================================================================

struct ValidationIssue {
    std::string path;     // "$", "$.stack.field", "$.stack.list[2]"
    std::string message;
};

struct ValidationReport {
    bool ok = false;
    nlohmann::json value;                 // validated copy, undeclared keys removed
    std::vector<ValidationIssue> issues;

    // "path: message" lines joined with "; "
    std::string summary() const;
};

// ============================================================================
// Output Schema
// ============================================================================

struct SchemaField;

/**
 * @brief Shape of a stack's output document
 *
 * A schema is a tree of tagged nodes. Objects list their fields; arrays
 * carry an item schema. Fields are required unless built with
 * as_optional(). Validation never throws; it returns a report.
 *
 * @example
 * ```cpp
 * auto schema = OutputSchema::object({
 *     {"tableName", OutputSchema::string()},
 *     {"aliases", OutputSchema::array(OutputSchema::string())},
 * });
 * auto report = schema.validate(nlohmann::json::parse(text));
 * ```
 */
class OutputSchema {
public:
    static OutputSchema string();
    static OutputSchema url();
    static OutputSchema number();
    static OutputSchema boolean();
    static OutputSchema array(OutputSchema items);
    static OutputSchema object(std::vector<SchemaField> fields);

    // Copy of this schema that accepts an absent value
    OutputSchema as_optional() const;

    SchemaKind kind() const { return kind_; }
    bool is_optional() const { return optional_; }

    const std::vector<SchemaField>& fields() const;

    // Item schema for arrays, nullptr otherwise
    const OutputSchema* items() const { return items_.get(); }

    // Field schema by name for objects, nullptr when absent
    const OutputSchema* field(const std::string& name) const;

    ValidationReport validate(const nlohmann::json& value) const;

    // JSON rendering of the schema tree, used by `stackreg list --json`
    nlohmann::json describe() const;

private:
    explicit OutputSchema(SchemaKind kind);

    void validate_into(const nlohmann::json& value,
                       const std::string& path,
                       nlohmann::json& out,
                       std::vector<ValidationIssue>& issues) const;

    SchemaKind kind_;
    bool optional_ = false;
    std::shared_ptr<const OutputSchema> items_;
    std::vector<SchemaField> fields_;
};

struct SchemaField {
    std::string name;
    OutputSchema schema;
};

// Object schema with a single key, the stack name, wrapping the given fields
OutputSchema namespaced_schema(const std::string& stack_name, std::vector<SchemaField> fields);

} // namespace stackreg
