#pragma once

#include "core/error.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

class ContentValidator;
class SecurityLog;

/**
 * @brief Typed persona front-matter, every value already validated
 */
struct PersonaMetadata {
    std::string name;
    std::string description;
    std::string author;
    std::string version;
    std::string category;
    std::string age_rating;
    std::string license;
    std::string unique_id;
    std::string created_date;
    std::string price;
    std::string generation_method;
    std::optional<bool> ai_generated;
    std::vector<std::string> triggers;
    std::vector<std::string> content_flags;
    std::map<std::string, std::string> extra;
    std::map<std::string, std::vector<std::string>> extra_lists;
};

struct ParsedDocument {
    PersonaMetadata metadata;
    std::string body;
};

/**
 * @brief Restricted-schema YAML front-matter parser
 *
 * Fails closed on: oversize input, any explicit tag outside the YAML core
 * schema, merge keys, alias expansion beyond max_alias_ratio x anchors,
 * excessive depth/node count, non-mapping root, field constraint
 * violations, and any scalar the ContentValidator rejects. A failed parse
 * never returns partial metadata.
 */
class SecureStructuredParser {
public:
    struct Config {
        size_t max_yaml_size = 64 * 1024;
        size_t max_document_size = 1024 * 1024;
        size_t max_anchors = 10;
        size_t max_aliases = 40;
        size_t max_alias_ratio = 4;
        size_t max_depth = 32;
        size_t max_nodes = 10'000;
        size_t max_list_entries = 20;
        bool require_name = true;
    };

    /// Lexical anchor/alias/tag census of raw YAML (outside quotes and comments)
    struct YamlCensus {
        size_t anchors = 0;
        size_t aliases = 0;
        std::vector<std::string> tags;
    };

    SecureStructuredParser(const ContentValidator& validator, SecurityLog& log)
        : SecureStructuredParser(validator, log, Config{}) {}
    SecureStructuredParser(const ContentValidator& validator, SecurityLog& log, Config config);

    /// Front-matter document: "---\n<yaml>\n---\n<body>"
    [[nodiscard]] Result<ParsedDocument> parse(std::string_view document) const;

    /// Bare YAML mapping
    [[nodiscard]] Result<PersonaMetadata> parse_metadata(std::string_view yaml) const;

    /// Re-validates, then emits a front-matter document
    [[nodiscard]] Result<std::string> serialize(const PersonaMetadata& metadata,
                                                std::string_view body) const;

    /// Sanitizes every field in place and checks field constraints
    [[nodiscard]] Result<void> validate_metadata(PersonaMetadata& metadata) const;

    [[nodiscard]] static YamlCensus census(std::string_view yaml);

    [[nodiscard]] static bool is_core_schema_tag(std::string_view tag);

private:
    Result<void> check_expansion(std::string_view yaml) const;
    Result<void> sanitize_field(std::string& value, std::string_view field,
                                size_t max_length) const;
    Result<void> reject(std::string reason) const;

    const ContentValidator& validator_;
    SecurityLog& log_;
    Config config_;
};

} // namespace personaguard
