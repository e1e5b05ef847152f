#include "security/secure_structured_parser.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"
#include "security/content_validator.hpp"

#include <re2/re2.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <format>

namespace personaguard {

namespace {

constexpr std::string_view kDelimiter = "---";
constexpr std::string_view kFieldContext = "metadata-field";
constexpr std::string_view kBodyContext = "persona-body";

constexpr size_t kMaxNameLength = 100;
constexpr size_t kMaxDescriptionLength = 500;
constexpr size_t kMaxAuthorLength = 100;
constexpr size_t kMaxCategoryLength = 50;
constexpr size_t kMaxShortFieldLength = 200;
constexpr size_t kMaxListItemLength = 50;
constexpr size_t kMaxExtraKeyLength = 64;

const re2::RE2& version_re() {
    static const re2::RE2 re(R"(^[0-9]+(?:\.[0-9]+)?(?:\.[0-9]+)?(?:-[A-Za-z0-9.]+)?$)");
    return re;
}

const re2::RE2& trigger_re() {
    static const re2::RE2 re(R"(^[A-Za-z0-9_-]+$)");
    return re;
}

const re2::RE2& key_re() {
    static const re2::RE2 re(R"(^[A-Za-z0-9_-]+$)");
    return re;
}

bool full_match(std::string_view s, const re2::RE2& re) {
    return re2::RE2::FullMatch(re2::StringPiece(s.data(), s.size()), re);
}

struct FrontMatter {
    std::string_view yaml;
    std::string_view body;
};

bool is_delimiter_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line == kDelimiter;
}

std::optional<FrontMatter> split_front_matter(std::string_view doc) {
    if (doc.starts_with("\xEF\xBB\xBF")) doc.remove_prefix(3);

    const auto first_nl = doc.find('\n');
    if (first_nl == std::string_view::npos || !is_delimiter_line(doc.substr(0, first_nl))) {
        return std::nullopt;
    }

    size_t line_start = first_nl + 1;
    while (line_start <= doc.size()) {
        auto line_end = doc.find('\n', line_start);
        const bool last = line_end == std::string_view::npos;
        if (last) line_end = doc.size();

        if (is_delimiter_line(doc.substr(line_start, line_end - line_start))) {
            FrontMatter fm;
            fm.yaml = doc.substr(first_nl + 1, line_start - first_nl - 1);
            fm.body = last ? std::string_view{} : doc.substr(line_end + 1);
            return fm;
        }
        if (last) break;
        line_start = line_end + 1;
    }
    return std::nullopt;
}

class NodeWalker {
public:
    NodeWalker(size_t max_depth, size_t max_nodes)
        : max_depth_(max_depth), max_nodes_(max_nodes) {}

    Result<void> walk(const YAML::Node& node, size_t depth) {
        if (depth > max_depth_) {
            return Result<void>::error(ErrorCategory::PARSE_ERROR, "YAML nesting too deep");
        }
        if (++visited_ > max_nodes_) {
            return Result<void>::error(ErrorCategory::PARSE_ERROR, "YAML node limit exceeded");
        }
        if (!SecureStructuredParser::is_core_schema_tag(node.Tag())) {
            return Result<void>::error(ErrorCategory::PARSE_ERROR, "Forbidden YAML tag");
        }

        if (node.IsMap()) {
            for (const auto& kv : node) {
                if (kv.first.IsScalar() && kv.first.Scalar() == "<<") {
                    return Result<void>::error(ErrorCategory::PARSE_ERROR, "YAML merge keys are not allowed");
                }
                if (auto r = walk(kv.first, depth + 1); r.is_error()) return r;
                if (auto r = walk(kv.second, depth + 1); r.is_error()) return r;
            }
        } else if (node.IsSequence()) {
            for (const auto& child : node) {
                if (auto r = walk(child, depth + 1); r.is_error()) return r;
            }
        }
        return Result<void>::ok();
    }

private:
    size_t max_depth_;
    size_t max_nodes_;
    size_t visited_ = 0;
};

std::string scalar_or_empty(const YAML::Node& node) {
    return node.IsScalar() ? node.Scalar() : std::string{};
}

} // namespace

SecureStructuredParser::SecureStructuredParser(const ContentValidator& validator,
                                               SecurityLog& log, Config config)
    : validator_(validator),
      log_(log),
      config_(config) {}

bool SecureStructuredParser::is_core_schema_tag(std::string_view tag) {
    static constexpr std::array<std::string_view, 10> kAllowed = {
        "", "?", "!",
        "tag:yaml.org,2002:str", "tag:yaml.org,2002:int", "tag:yaml.org,2002:float",
        "tag:yaml.org,2002:bool", "tag:yaml.org,2002:null", "tag:yaml.org,2002:seq",
        "tag:yaml.org,2002:map",
    };
    static constexpr std::array<std::string_view, 7> kShorthand = {
        "!!str", "!!int", "!!float", "!!bool", "!!null", "!!seq", "!!map",
    };
    return std::ranges::find(kAllowed, tag) != kAllowed.end() ||
           std::ranges::find(kShorthand, tag) != kShorthand.end();
}

SecureStructuredParser::YamlCensus SecureStructuredParser::census(std::string_view y) {
    YamlCensus census;

    enum class Quote { NONE, SINGLE, DOUBLE };
    Quote quote = Quote::NONE;
    bool line_start = true;
    bool node_start = true;
    size_t line_indent = 0;
    size_t block_parent = std::string_view::npos;   // Indent owning an active block scalar
    int flow_depth = 0;

    auto skip_token = [&y](size_t i) {
        while (i < y.size() && y[i] != ' ' && y[i] != '\t' && y[i] != '\n' &&
               y[i] != ',' && y[i] != ']' && y[i] != '}') {
            ++i;
        }
        return i;
    };

    size_t i = 0;
    while (i < y.size()) {
        if (line_start && quote == Quote::NONE) {
            size_t indent = 0;
            while (i + indent < y.size() && y[i + indent] == ' ') ++indent;
            const size_t eol = std::min(y.find('\n', i), y.size());
            const bool blank = i + indent >= eol;

            if (block_parent != std::string_view::npos) {
                if (blank || indent > block_parent) {
                    i = eol + 1;
                    continue;
                }
                block_parent = std::string_view::npos;
            }
            line_indent = indent;
            i += indent;
            line_start = false;
            node_start = true;
            continue;
        }

        const char ch = y[i];

        if (quote == Quote::SINGLE) {
            if (ch == '\'') {
                if (i + 1 < y.size() && y[i + 1] == '\'') { i += 2; continue; }
                quote = Quote::NONE;
            }
            ++i;
            continue;
        }
        if (quote == Quote::DOUBLE) {
            if (ch == '\\') { i += 2; continue; }
            if (ch == '"') quote = Quote::NONE;
            ++i;
            continue;
        }

        if (ch == '\n') {
            line_start = true;
            ++i;
            continue;
        }
        if (ch == ' ' || ch == '\t') {
            ++i;
            continue;
        }
        if (ch == '#' && (i == 0 || y[i - 1] == ' ' || y[i - 1] == '\t' || y[i - 1] == '\n')) {
            i = std::min(y.find('\n', i), y.size());
            continue;
        }

        const char next = i + 1 < y.size() ? y[i + 1] : '\n';
        const bool next_is_space = next == ' ' || next == '\t' || next == '\n' || next == '\r';

        if (node_start) {
            switch (ch) {
                case '&':
                    ++census.anchors;
                    i = skip_token(i);
                    continue;
                case '*':
                    ++census.aliases;
                    i = skip_token(i);
                    node_start = false;
                    continue;
                case '!': {
                    const size_t end = skip_token(i);
                    census.tags.emplace_back(y.substr(i, end - i));
                    i = end;
                    continue;
                }
                case '\'':
                    quote = Quote::SINGLE;
                    node_start = false;
                    ++i;
                    continue;
                case '"':
                    quote = Quote::DOUBLE;
                    node_start = false;
                    ++i;
                    continue;
                case '|':
                case '>':
                    if (flow_depth == 0) {
                        block_parent = line_indent;
                        i = std::min(y.find('\n', i), y.size());
                        node_start = false;
                        continue;
                    }
                    break;
                case '[':
                case '{':
                    ++flow_depth;
                    ++i;
                    continue;
                case '-':
                case '?':
                    if (next_is_space) {
                        ++i;
                        continue;
                    }
                    break;
                default:
                    break;
            }
            node_start = false;
        }

        if (ch == ':' && next_is_space) {
            node_start = true;
        } else if (flow_depth > 0 && (ch == ',' || ch == '[' || ch == '{')) {
            if (ch != ',') ++flow_depth;
            node_start = true;
        } else if (flow_depth > 0 && (ch == ']' || ch == '}')) {
            --flow_depth;
        }
        ++i;
    }
    return census;
}

Result<void> SecureStructuredParser::reject(std::string reason) const {
    log_.record(SecurityEventType::YAML_REJECTED, Severity::HIGH,
                "SecureStructuredParser", reason);
    return Result<void>::error(ErrorCategory::PARSE_ERROR, std::move(reason));
}

Result<void> SecureStructuredParser::check_expansion(std::string_view yaml) const {
    const auto c = census(yaml);

    for (const auto& tag : c.tags) {
        if (!is_core_schema_tag(tag)) {
            return reject("Forbidden YAML tag");
        }
    }
    if (c.aliases > 0 && c.anchors == 0) {
        return reject("YAML alias without anchor");
    }
    if (c.anchors > config_.max_anchors || c.aliases > config_.max_aliases) {
        return reject(std::format("YAML anchor/alias limit exceeded ({} anchors, {} aliases)",
                                  c.anchors, c.aliases));
    }
    if (c.aliases > c.anchors * config_.max_alias_ratio) {
        return reject(std::format("YAML alias expansion ratio exceeded ({} aliases for {} anchors)",
                                  c.aliases, c.anchors));
    }
    return Result<void>::ok();
}

Result<void> SecureStructuredParser::sanitize_field(std::string& value, std::string_view field,
                                                    size_t max_length) const {
    auto safe = validator_.require_safe(value, kFieldContext);
    if (safe.is_error()) {
        log_.record(SecurityEventType::YAML_REJECTED, Severity::HIGH, "SecureStructuredParser",
                    std::format("Field '{}' rejected by content validation", field));
        return Result<void>::error(ErrorCategory::VALIDATION_REJECTED,
                                   std::format("Field '{}' contains disallowed content", field));
    }
    value = utils::trim(safe.value());
    if (value.size() > max_length) {
        return reject(std::format("Field '{}' exceeds {} characters", field, max_length));
    }
    return Result<void>::ok();
}

Result<void> SecureStructuredParser::validate_metadata(PersonaMetadata& m) const {
    struct Field {
        std::string* value;
        std::string_view name;
        size_t max_length;
    };
    const std::array<Field, 11> fields = {{
        {&m.name, "name", kMaxNameLength},
        {&m.description, "description", kMaxDescriptionLength},
        {&m.author, "author", kMaxAuthorLength},
        {&m.version, "version", kMaxShortFieldLength},
        {&m.category, "category", kMaxCategoryLength},
        {&m.age_rating, "age_rating", kMaxShortFieldLength},
        {&m.license, "license", kMaxShortFieldLength},
        {&m.unique_id, "unique_id", kMaxShortFieldLength},
        {&m.created_date, "created_date", kMaxShortFieldLength},
        {&m.price, "price", kMaxShortFieldLength},
        {&m.generation_method, "generation_method", kMaxShortFieldLength},
    }};

    for (const auto& field : fields) {
        if (field.value->empty()) continue;
        if (auto r = sanitize_field(*field.value, field.name, field.max_length); r.is_error()) {
            return r;
        }
    }

    if (config_.require_name && m.name.empty()) {
        return reject("Missing required field 'name'");
    }
    if (!m.version.empty() && !full_match(m.version, version_re())) {
        return reject("Field 'version' is not a valid version string");
    }
    if (!m.age_rating.empty() &&
        m.age_rating != "all" && m.age_rating != "13+" && m.age_rating != "18+") {
        return reject("Field 'age_rating' must be one of: all, 13+, 18+");
    }

    auto check_list = [this](std::vector<std::string>& items, std::string_view field,
                             bool identifier_only) -> Result<void> {
        if (items.size() > config_.max_list_entries) {
            return reject(std::format("Field '{}' has more than {} entries",
                                      field, config_.max_list_entries));
        }
        for (auto& item : items) {
            if (auto r = sanitize_field(item, field, kMaxListItemLength); r.is_error()) return r;
            if (identifier_only && !full_match(item, trigger_re())) {
                return reject(std::format("Field '{}' entries must be alphanumeric", field));
            }
        }
        std::erase_if(items, [](const std::string& s) { return s.empty(); });
        return Result<void>::ok();
    };

    if (auto r = check_list(m.triggers, "triggers", true); r.is_error()) return r;
    if (auto r = check_list(m.content_flags, "content_flags", false); r.is_error()) return r;

    for (auto& [key, value] : m.extra) {
        if (key.size() > kMaxExtraKeyLength || !full_match(key, key_re())) {
            return reject("Unsupported metadata key");
        }
        if (auto r = sanitize_field(value, key, kMaxDescriptionLength); r.is_error()) return r;
    }
    for (auto& [key, items] : m.extra_lists) {
        if (key.size() > kMaxExtraKeyLength || !full_match(key, key_re())) {
            return reject("Unsupported metadata key");
        }
        if (auto r = check_list(items, key, false); r.is_error()) return r;
    }
    return Result<void>::ok();
}

Result<PersonaMetadata> SecureStructuredParser::parse_metadata(std::string_view yaml) const {
    using R = Result<PersonaMetadata>;

    if (yaml.size() > config_.max_yaml_size) {
        auto r = reject(std::format("YAML exceeds {} bytes", config_.max_yaml_size));
        return R::error(r.error_category(), r.error_message());
    }
    if (auto r = check_expansion(yaml); r.is_error()) {
        return R::error(r.error_category(), r.error_message());
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        log_.record(SecurityEventType::YAML_REJECTED, Severity::MEDIUM,
                    "SecureStructuredParser", "Malformed YAML");
        return R::error(ErrorCategory::PARSE_ERROR,
                        std::format("Malformed YAML at line {}", e.mark.line + 1));
    }

    if (!root.IsMap()) {
        auto r = reject("YAML root must be a mapping");
        return R::error(r.error_category(), r.error_message());
    }

    NodeWalker walker(config_.max_depth, config_.max_nodes);
    if (auto r = walker.walk(root, 0); r.is_error()) {
        auto rejected = reject(r.error_message());
        return R::error(rejected.error_category(), rejected.error_message());
    }

    PersonaMetadata m;
    try {
        for (const auto& kv : root) {
            if (!kv.first.IsScalar()) {
                auto r = reject("Metadata keys must be scalars");
                return R::error(r.error_category(), r.error_message());
            }
            const std::string key = kv.first.Scalar();
            const YAML::Node& value = kv.second;

            auto to_list = [&value]() {
                std::vector<std::string> items;
                if (value.IsSequence()) {
                    for (const auto& item : value) {
                        items.push_back(scalar_or_empty(item));
                    }
                } else if (value.IsScalar()) {
                    items.push_back(value.Scalar());
                }
                return items;
            };

            bool nested = value.IsMap();
            if (value.IsSequence()) {
                for (const auto& item : value) {
                    if (!item.IsScalar()) nested = true;
                }
            }
            if (nested) {
                auto r = reject(std::format("Field '{}' has an unsupported nested structure",
                                            key.size() <= kMaxExtraKeyLength ? key : "?"));
                return R::error(r.error_category(), r.error_message());
            }

            if (key == "name") m.name = scalar_or_empty(value);
            else if (key == "description") m.description = scalar_or_empty(value);
            else if (key == "author") m.author = scalar_or_empty(value);
            else if (key == "version") m.version = scalar_or_empty(value);
            else if (key == "category") m.category = scalar_or_empty(value);
            else if (key == "age_rating") m.age_rating = scalar_or_empty(value);
            else if (key == "license") m.license = scalar_or_empty(value);
            else if (key == "unique_id") m.unique_id = scalar_or_empty(value);
            else if (key == "created_date") m.created_date = scalar_or_empty(value);
            else if (key == "price") m.price = scalar_or_empty(value);
            else if (key == "generation_method") m.generation_method = scalar_or_empty(value);
            else if (key == "ai_generated") m.ai_generated = value.as<bool>();
            else if (key == "triggers") m.triggers = to_list();
            else if (key == "content_flags") m.content_flags = to_list();
            else if (value.IsSequence()) m.extra_lists[key] = to_list();
            else m.extra[key] = scalar_or_empty(value);
        }
    } catch (const YAML::Exception& e) {
        log_.record(SecurityEventType::YAML_REJECTED, Severity::MEDIUM,
                    "SecureStructuredParser", "Metadata type mismatch");
        return R::error(ErrorCategory::PARSE_ERROR,
                        std::format("Metadata type mismatch at line {}", e.mark.line + 1));
    }

    if (auto r = validate_metadata(m); r.is_error()) {
        return R::error(r.error_category(), r.error_message());
    }
    return R::ok(std::move(m));
}

Result<ParsedDocument> SecureStructuredParser::parse(std::string_view document) const {
    using R = Result<ParsedDocument>;

    if (document.size() > config_.max_document_size) {
        auto r = reject(std::format("Document exceeds {} bytes", config_.max_document_size));
        return R::error(r.error_category(), r.error_message());
    }

    const auto fm = split_front_matter(document);
    if (!fm) {
        auto r = reject("Missing front-matter block");
        return R::error(r.error_category(), r.error_message());
    }

    auto metadata = parse_metadata(fm->yaml);
    if (metadata.is_error()) {
        return R::error(metadata.error_category(), metadata.error_message());
    }

    auto body = validator_.require_safe(fm->body, kBodyContext);
    if (body.is_error()) {
        return R::error(body.error_category(), body.error_message());
    }

    ParsedDocument doc;
    doc.metadata = std::move(metadata.value());
    doc.body = std::move(body.value());
    return R::ok(std::move(doc));
}

Result<std::string> SecureStructuredParser::serialize(const PersonaMetadata& metadata,
                                                      std::string_view body) const {
    using R = Result<std::string>;

    PersonaMetadata m = metadata;
    if (auto r = validate_metadata(m); r.is_error()) {
        return R::error(r.error_category(), r.error_message());
    }
    auto safe_body = validator_.require_safe(body, kBodyContext);
    if (safe_body.is_error()) {
        return R::error(safe_body.error_category(), safe_body.error_message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    auto emit = [&out](std::string_view key, const std::string& value) {
        if (!value.empty()) {
            out << YAML::Key << std::string(key) << YAML::Value << YAML::DoubleQuoted << value;
        }
    };
    emit("name", m.name);
    emit("description", m.description);
    emit("author", m.author);
    emit("version", m.version);
    emit("category", m.category);
    emit("age_rating", m.age_rating);
    emit("license", m.license);
    emit("unique_id", m.unique_id);
    emit("created_date", m.created_date);
    emit("price", m.price);
    emit("generation_method", m.generation_method);
    if (m.ai_generated) {
        out << YAML::Key << "ai_generated" << YAML::Value << *m.ai_generated;
    }
    auto emit_list = [&out](std::string_view key, const std::vector<std::string>& items) {
        if (items.empty()) return;
        out << YAML::Key << std::string(key) << YAML::Value << YAML::BeginSeq;
        for (const auto& item : items) out << YAML::DoubleQuoted << item;
        out << YAML::EndSeq;
    };
    emit_list("triggers", m.triggers);
    emit_list("content_flags", m.content_flags);
    for (const auto& [key, value] : m.extra) emit(key, value);
    for (const auto& [key, items] : m.extra_lists) emit_list(key, items);
    out << YAML::EndMap;

    if (!out.good()) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
                        "YAML emit failed: " + out.GetLastError());
    }

    std::string doc;
    doc.reserve(out.size() + safe_body.value().size() + 16);
    doc += kDelimiter;
    doc += '\n';
    doc += out.c_str();
    doc += '\n';
    doc += kDelimiter;
    doc += '\n';
    doc += safe_body.value();
    return R::ok(std::move(doc));
}

} // namespace personaguard
