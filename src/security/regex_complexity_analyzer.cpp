#include "security/regex_complexity_analyzer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace personaguard {

namespace {

struct Quantifier {
    size_t length = 0;
    bool repeating = false;     // Max repetitions > 1
};

// Parses *, +, ?, {n}, {n,}, {n,m} plus a trailing lazy/possessive modifier
std::optional<Quantifier> read_quantifier(std::string_view p, size_t i) {
    if (i >= p.size()) return std::nullopt;

    Quantifier q;
    const char c = p[i];
    if (c == '*' || c == '+') {
        q = {1, true};
    } else if (c == '?') {
        q = {1, false};
    } else if (c == '{') {
        size_t j = i + 1;
        size_t min_start = j;
        while (j < p.size() && std::isdigit(static_cast<unsigned char>(p[j]))) ++j;
        if (j == min_start) return std::nullopt;  // Literal brace
        // Overflowing counts are treated as unbounded
        const auto min_val = utils::try_parse_int<size_t>(p.substr(min_start, j - min_start))
            .value_or(SIZE_MAX);

        if (j < p.size() && p[j] == '}') {
            q = {j - i + 1, min_val > 1};
        } else if (j < p.size() && p[j] == ',') {
            ++j;
            const size_t max_start = j;
            while (j < p.size() && std::isdigit(static_cast<unsigned char>(p[j]))) ++j;
            if (j >= p.size() || p[j] != '}') return std::nullopt;
            if (j == max_start) {
                q = {j - i + 1, true};
            } else {
                const auto max_val = utils::try_parse_int<size_t>(p.substr(max_start, j - max_start))
                    .value_or(SIZE_MAX);
                q = {j - i + 1, max_val > 1};
            }
        } else {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    const size_t next = i + q.length;
    if (next < p.size() && (p[next] == '?' || p[next] == '+')) {
        ++q.length;
    }
    return q;
}

struct GroupFrame {
    size_t branch_start = 0;
    bool lookaround = false;
    bool has_alternation = false;
    bool contains_repeat = false;
    std::vector<std::string_view> branches;
};

bool branches_overlap(const std::vector<std::string_view>& branches) {
    for (size_t a = 0; a < branches.size(); ++a) {
        for (size_t b = a + 1; b < branches.size(); ++b) {
            const auto& x = branches[a];
            const auto& y = branches[b];
            if (x.empty() || y.empty()) return true;
            if (x.starts_with(y) || y.starts_with(x)) return true;
        }
    }
    return false;
}

class Scanner {
public:
    explicit Scanner(std::string_view pattern) : p_(pattern) {}

    ComplexityProfile run() {
        frames_.push_back(GroupFrame{});

        size_t i = 0;
        while (i < p_.size()) {
            const char c = p_[i];
            if (c == '\\') {
                i = skip_escape(i);
            } else if (c == '[') {
                i = skip_class(i);
            } else if (c == '(') {
                i = open_group(i);
            } else if (c == ')') {
                i = close_group(i);
            } else if (c == '|') {
                auto& top = frames_.back();
                top.has_alternation = true;
                top.branches.push_back(p_.substr(top.branch_start, i - top.branch_start));
                top.branch_start = i + 1;
                ++i;
            } else if (const auto q = read_quantifier(p_, i)) {
                ++quantifiers_;
                if (q->repeating) frames_.back().contains_repeat = true;
                i += q->length;
            } else {
                ++i;
            }
        }

        ComplexityProfile profile;
        profile.quantifier_count = quantifiers_;
        profile.hazard = hazard_;
        if (!hazard_.empty()) {
            profile.risk = RiskLevel::HIGH;
        } else if (quantifiers_ > RegexComplexityAnalyzer::kQuantifierThreshold) {
            profile.risk = RiskLevel::MEDIUM;
        } else {
            profile.risk = RiskLevel::LOW;
        }
        profile.max_content_length = RegexComplexityAnalyzer::max_length_for(profile.risk);
        return profile;
    }

private:
    size_t skip_escape(size_t i) const {
        if (i + 1 >= p_.size()) return p_.size();
        const char n = p_[i + 1];
        if ((n == 'p' || n == 'P' || n == 'x') && i + 2 < p_.size() && p_[i + 2] == '{') {
            const auto close = p_.find('}', i + 3);
            return close == std::string_view::npos ? p_.size() : close + 1;
        }
        return i + 2;
    }

    size_t skip_class(size_t i) const {
        size_t j = i + 1;
        if (j < p_.size() && p_[j] == '^') ++j;
        if (j < p_.size() && p_[j] == ']') ++j;
        while (j < p_.size() && p_[j] != ']') {
            if (p_[j] == '\\') ++j;
            ++j;
        }
        return j + 1;
    }

    size_t open_group(size_t i) {
        GroupFrame frame;
        size_t j = i + 1;
        if (j < p_.size() && p_[j] == '?') {
            ++j;
            if (j < p_.size() && (p_[j] == '=' || p_[j] == '!')) {
                frame.lookaround = true;
                ++j;
            } else if (j + 1 < p_.size() && p_[j] == '<' && (p_[j + 1] == '=' || p_[j + 1] == '!')) {
                frame.lookaround = true;
                j += 2;
            } else if (j < p_.size() && (p_[j] == '<' || p_[j] == 'P')) {
                const auto close = p_.find('>', j);
                j = close == std::string_view::npos ? p_.size() : close + 1;
            } else {
                // Inline flags: (?i) is not a group, (?i:...) is
                while (j < p_.size() && p_[j] != ':' && p_[j] != ')') ++j;
                if (j < p_.size() && p_[j] == ')') return j + 1;
                ++j;
            }
        }
        frame.branch_start = j;
        frames_.push_back(std::move(frame));
        return j;
    }

    size_t close_group(size_t i) {
        if (frames_.size() == 1) return i + 1;  // Unbalanced, treat as literal

        GroupFrame frame = std::move(frames_.back());
        frames_.pop_back();
        frame.branches.push_back(p_.substr(frame.branch_start, i - frame.branch_start));

        size_t next = i + 1;
        bool repeated = false;
        if (const auto q = read_quantifier(p_, next)) {
            ++quantifiers_;
            next += q->length;
            repeated = q->repeating;
        }

        if (repeated) {
            if (frame.contains_repeat) {
                flag("nested_quantifier");
            }
            if (frame.has_alternation) {
                flag(branches_overlap(frame.branches)
                    ? "overlapping_alternation" : "quantified_alternation");
            }
        }
        if (frame.lookaround && (repeated || frame.contains_repeat)) {
            flag("quantified_lookaround");
        }

        frames_.back().contains_repeat =
            frames_.back().contains_repeat || frame.contains_repeat || repeated;
        return next;
    }

    void flag(const char* hazard) {
        if (hazard_.empty()) hazard_ = hazard;
    }

    std::string_view p_;
    std::vector<GroupFrame> frames_;
    size_t quantifiers_ = 0;
    std::string hazard_;
};

} // namespace

ComplexityProfile RegexComplexityAnalyzer::analyze(std::string_view pattern) {
    return Scanner(pattern).run();
}

} // namespace personaguard
