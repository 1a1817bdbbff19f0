#ifndef PODFETCH_CORE_SUBSTITUTION_RULE_HPP
#define PODFETCH_CORE_SUBSTITUTION_RULE_HPP

#include "core/Errors.hpp"
#include <regex>
#include <string>
#include <vector>

namespace podfetch {
namespace core {

// One piece of a replacement template: literal text or a capture group reference
struct TemplateToken {
    enum class Kind { Literal, Group };

    Kind kind;
    std::string text;
    size_t group;

    static TemplateToken literal(const std::string& text) { return {Kind::Literal, text, 0}; }
    static TemplateToken groupRef(size_t index) { return {Kind::Group, "", index}; }
};

// A sed-style s<D>pattern<D>replacement<D>flags rule, compiled once and applied
// to many candidate strings.
class SubstitutionRule {
public:
    // Throws MalformedRuleError
    static SubstitutionRule parse(const std::string& ruleText);

    // Returns the candidate unchanged when the pattern does not match
    std::string apply(const std::string& candidate) const;
    bool matches(const std::string& candidate) const;

    const std::string& text() const { return text_; }
    char delimiter() const { return delimiter_; }
    const std::string& pattern() const { return pattern_; }
    const std::vector<TemplateToken>& replacement() const { return tokens_; }
    bool isGlobal() const { return global_; }
    bool isCaseInsensitive() const { return icase_; }

private:
    SubstitutionRule() = default;

    std::string expand(const std::smatch& match) const;

    std::string text_;
    char delimiter_ = '/';
    std::string pattern_;
    std::regex regex_;
    std::vector<TemplateToken> tokens_;
    bool global_ = true;
    bool icase_ = false;
};

} // namespace core
} // namespace podfetch

#endif // PODFETCH_CORE_SUBSTITUTION_RULE_HPP
