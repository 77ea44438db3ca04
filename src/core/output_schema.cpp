#include "stackreg/output_schema.hpp"

#include <cctype>

namespace stackreg {

namespace {

std::string type_name(const nlohmann::json& v) {
    if (v.is_null()) return "null";
    if (v.is_string()) return "string";
    if (v.is_boolean()) return "boolean";
    if (v.is_number()) return "number";
    if (v.is_array()) return "array";
    if (v.is_object()) return "object";
    return "unknown";
}

// scheme "://" rest, scheme per RFC 3986
bool looks_like_url(const std::string& s) {
    auto sep = s.find("://");
    if (sep == std::string::npos || sep == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (size_t i = 1; i < sep; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return sep + 3 < s.size();
}

std::string field_path(const std::string& parent, const std::string& name) {
    return parent + "." + name;
}

} // namespace

std::string ValidationReport::summary() const {
    std::string out;
    for (const auto& issue : issues) {
        if (!out.empty()) out += "; ";
        out += issue.path + ": " + issue.message;
    }
    return out;
}

OutputSchema::OutputSchema(SchemaKind kind) : kind_(kind) {}

OutputSchema OutputSchema::string() { return OutputSchema(SchemaKind::String); }
OutputSchema OutputSchema::url() { return OutputSchema(SchemaKind::Url); }
OutputSchema OutputSchema::number() { return OutputSchema(SchemaKind::Number); }
OutputSchema OutputSchema::boolean() { return OutputSchema(SchemaKind::Boolean); }

OutputSchema OutputSchema::array(OutputSchema items) {
    OutputSchema s(SchemaKind::Array);
    s.items_ = std::make_shared<const OutputSchema>(std::move(items));
    return s;
}

OutputSchema OutputSchema::object(std::vector<SchemaField> fields) {
    OutputSchema s(SchemaKind::Object);
    s.fields_ = std::move(fields);
    return s;
}

OutputSchema OutputSchema::as_optional() const {
    OutputSchema copy = *this;
    copy.optional_ = true;
    return copy;
}

const std::vector<SchemaField>& OutputSchema::fields() const {
    return fields_;
}

const OutputSchema* OutputSchema::field(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name == name) return &f.schema;
    }
    return nullptr;
}

ValidationReport OutputSchema::validate(const nlohmann::json& value) const {
    ValidationReport report;
    validate_into(value, "$", report.value, report.issues);
    report.ok = report.issues.empty();
    if (!report.ok) {
        report.value = nullptr;
    }
    return report;
}

void OutputSchema::validate_into(const nlohmann::json& value,
                                 const std::string& path,
                                 nlohmann::json& out,
                                 std::vector<ValidationIssue>& issues) const {
    switch (kind_) {
        case SchemaKind::String:
            if (!value.is_string()) {
                issues.push_back({path, "expected string, received " + type_name(value)});
                return;
            }
            out = value;
            return;

        case SchemaKind::Url:
            if (!value.is_string()) {
                issues.push_back({path, "expected url, received " + type_name(value)});
                return;
            }
            if (!looks_like_url(value.get<std::string>())) {
                issues.push_back({path, "invalid url"});
                return;
            }
            out = value;
            return;

        case SchemaKind::Number:
            if (!value.is_number()) {
                issues.push_back({path, "expected number, received " + type_name(value)});
                return;
            }
            out = value;
            return;

        case SchemaKind::Boolean:
            if (!value.is_boolean()) {
                issues.push_back({path, "expected boolean, received " + type_name(value)});
                return;
            }
            out = value;
            return;

        case SchemaKind::Array: {
            if (!value.is_array()) {
                issues.push_back({path, "expected array, received " + type_name(value)});
                return;
            }
            out = nlohmann::json::array();
            for (size_t i = 0; i < value.size(); ++i) {
                nlohmann::json item;
                items_->validate_into(value[i], path + "[" + std::to_string(i) + "]", item, issues);
                out.push_back(std::move(item));
            }
            return;
        }

        case SchemaKind::Object: {
            if (!value.is_object()) {
                issues.push_back({path, "expected object, received " + type_name(value)});
                return;
            }
            out = nlohmann::json::object();
            for (const auto& f : fields_) {
                auto it = value.find(f.name);
                if (it == value.end()) {
                    if (!f.schema.is_optional()) {
                        issues.push_back({field_path(path, f.name), "required"});
                    }
                    continue;
                }
                nlohmann::json child;
                f.schema.validate_into(*it, field_path(path, f.name), child, issues);
                out[f.name] = std::move(child);
            }
            return;
        }
    }
}

nlohmann::json OutputSchema::describe() const {
    nlohmann::json j;
    j["type"] = schema_kind_to_string(kind_);
    if (optional_) {
        j["optional"] = true;
    }
    if (kind_ == SchemaKind::Array && items_) {
        j["items"] = items_->describe();
    }
    if (kind_ == SchemaKind::Object) {
        nlohmann::json props = nlohmann::json::object();
        for (const auto& f : fields_) {
            props[f.name] = f.schema.describe();
        }
        j["fields"] = props;
    }
    return j;
}

OutputSchema namespaced_schema(const std::string& stack_name, std::vector<SchemaField> fields) {
    return OutputSchema::object({{stack_name, OutputSchema::object(std::move(fields))}});
}

} // namespace stackreg
