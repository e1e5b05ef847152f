#pragma once

#include "auditor/finding.hpp"
#include "auditor/rule_engine.hpp"
#include <string>
#include <vector>

namespace personaguard {

/**
 * @brief One audit scanner
 *
 * The auditor reads each candidate file once and hands it to every scanner
 * whose wants() accepts it. scan() runs on worker threads and must only
 * read shared state.
 */
class IScanner {
public:
    virtual ~IScanner() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    [[nodiscard]] virtual bool wants(const std::string& relative_path) const = 0;

    [[nodiscard]] virtual std::vector<Finding> scan(const SourceFile& file) const = 0;

    /// Rules the scanner can report, for report metadata
    [[nodiscard]] virtual std::vector<const SecurityRule*> rules() const = 0;
};

/// Source files against the OWASP, CWE and platform rule sets
class CodeScanner : public IScanner {
public:
    CodeScanner();
    explicit CodeScanner(std::vector<SecurityRule> rules);

    [[nodiscard]] const char* name() const override { return "code"; }
    [[nodiscard]] bool wants(const std::string& relative_path) const override;
    [[nodiscard]] std::vector<Finding> scan(const SourceFile& file) const override;
    [[nodiscard]] std::vector<const SecurityRule*> rules() const override { return engine_.rules(); }

private:
    RuleEngine engine_;
};

/// YAML, JSON, TOML, INI and dotenv files
class ConfigScanner : public IScanner {
public:
    ConfigScanner();

    [[nodiscard]] const char* name() const override { return "configuration"; }
    [[nodiscard]] bool wants(const std::string& relative_path) const override;
    [[nodiscard]] std::vector<Finding> scan(const SourceFile& file) const override;
    [[nodiscard]] std::vector<const SecurityRule*> rules() const override { return engine_.rules(); }

private:
    RuleEngine engine_;
};

/**
 * @brief Dependency manifests
 *
 * package.json, vcpkg.json, conanfile.txt and CMake FetchContent /
 * ExternalProject declarations: floating versions, mutable git refs,
 * plain-http downloads and downloads without a hash.
 */
class DependencyScanner : public IScanner {
public:
    DependencyScanner();

    [[nodiscard]] const char* name() const override { return "dependency"; }
    [[nodiscard]] bool wants(const std::string& relative_path) const override;
    [[nodiscard]] std::vector<Finding> scan(const SourceFile& file) const override;
    [[nodiscard]] std::vector<const SecurityRule*> rules() const override;

    [[nodiscard]] static const std::vector<SecurityRule>& dependency_rules();

private:
    std::vector<Finding> scan_package_json(const SourceFile& file) const;
    std::vector<Finding> scan_vcpkg_json(const SourceFile& file) const;
    std::vector<Finding> scan_conanfile(const SourceFile& file) const;
    std::vector<Finding> scan_cmake(const SourceFile& file) const;

    Finding make(std::string_view rule_id, const SourceFile& file, uint32_t line,
                 std::string message) const;
};

} // namespace personaguard
