#include "core/SubstitutionRule.hpp"
#include <cctype>
#include <cstring>
#include <sstream>

namespace podfetch {
namespace core {

namespace {

bool isRegexSpecial(char c) {
    return std::strchr("^$.|?*+()[]{}", c) != nullptr;
}

std::string describeChar(char c) {
    if (std::isspace(static_cast<unsigned char>(c))) {
        return "whitespace";
    }
    return std::string("'") + c + "'";
}

} // namespace

SubstitutionRule SubstitutionRule::parse(const std::string& ruleText) {
    if (ruleText.size() < 2 || ruleText[0] != 's') {
        throw MalformedRuleError(ruleText, "expected 's' followed by a delimiter");
    }

    const char delim = ruleText[1];
    const unsigned char udelim = static_cast<unsigned char>(delim);
    if (std::isspace(udelim) || std::isalnum(udelim) || delim == '\\') {
        throw MalformedRuleError(ruleText, describeChar(delim) + " cannot be used as a delimiter");
    }

    // Split on unescaped delimiters. An escaped delimiter becomes the plain
    // character, except inside the pattern where it must stay a literal.
    std::vector<std::string> parts(1);
    for (size_t i = 2; i < ruleText.size(); ++i) {
        char c = ruleText[i];
        if (c == '\\' && i + 1 < ruleText.size()) {
            char next = ruleText[++i];
            if (next == delim) {
                if (parts.size() == 1 && isRegexSpecial(delim)) {
                    parts.back() += '\\';
                }
                parts.back() += delim;
            } else {
                parts.back() += c;
                parts.back() += next;
            }
            continue;
        }
        if (c == delim) {
            parts.emplace_back();
            continue;
        }
        parts.back() += c;
    }

    if (parts.size() != 3) {
        std::stringstream err;
        err << "expected 3 unescaped '" << delim << "' delimiters, found " << parts.size();
        throw MalformedRuleError(ruleText, err.str());
    }

    SubstitutionRule rule;
    rule.text_ = ruleText;
    rule.delimiter_ = delim;
    rule.pattern_ = parts[0];

    if (rule.pattern_.empty()) {
        throw MalformedRuleError(ruleText, "empty pattern");
    }

    for (char flag : parts[2]) {
        switch (flag) {
            case 'g': rule.global_ = true; break;
            case '1': rule.global_ = false; break;
            case 'i': rule.icase_ = true; break;
            default:
                throw MalformedRuleError(ruleText, std::string("unknown flag '") + flag + "'");
        }
    }

    auto syntax = std::regex::ECMAScript;
    if (rule.icase_) {
        syntax |= std::regex::icase;
    }
    try {
        rule.regex_ = std::regex(rule.pattern_, syntax);
    } catch (const std::regex_error& e) {
        throw MalformedRuleError(ruleText, "invalid pattern '" + rule.pattern_ + "': " + e.what());
    }

    const std::string& replacement = parts[1];
    const size_t groups = rule.regex_.mark_count();
    std::string literal;
    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];
        if (c != '\\' || i + 1 == replacement.size()) {
            literal += c;
            continue;
        }

        char next = replacement[++i];
        if (!std::isdigit(static_cast<unsigned char>(next))) {
            literal += next;
            continue;
        }

        size_t index = static_cast<size_t>(next - '0');
        if (index > groups) {
            std::stringstream err;
            err << "replacement refers to \\" << index << " but the pattern has "
                << groups << " group" << (groups == 1 ? "" : "s");
            throw MalformedRuleError(ruleText, err.str());
        }
        if (!literal.empty()) {
            rule.tokens_.push_back(TemplateToken::literal(literal));
            literal.clear();
        }
        rule.tokens_.push_back(TemplateToken::groupRef(index));
    }
    if (!literal.empty()) {
        rule.tokens_.push_back(TemplateToken::literal(literal));
    }

    return rule;
}

std::string SubstitutionRule::expand(const std::smatch& match) const {
    std::string out;
    for (const auto& token : tokens_) {
        if (token.kind == TemplateToken::Kind::Literal) {
            out += token.text;
        } else if (token.group < match.size() && match[token.group].matched) {
            out += match[token.group].str();
        }
    }
    return out;
}

bool SubstitutionRule::matches(const std::string& candidate) const {
    return std::regex_search(candidate, regex_);
}

std::string SubstitutionRule::apply(const std::string& candidate) const {
    if (!global_) {
        std::smatch match;
        if (!std::regex_search(candidate, match, regex_)) {
            return candidate;
        }
        return match.prefix().str() + expand(match) + match.suffix().str();
    }

    std::sregex_iterator it(candidate.begin(), candidate.end(), regex_);
    std::sregex_iterator end;
    if (it == end) {
        return candidate;
    }

    std::string out;
    size_t pos = 0;
    for (; it != end; ++it) {
        const std::smatch& match = *it;
        size_t start = static_cast<size_t>(match.position(0));
        out.append(candidate, pos, start - pos);
        out += expand(match);
        pos = start + static_cast<size_t>(match.length(0));
    }
    out.append(candidate, pos, std::string::npos);
    return out;
}

} // namespace core
} // namespace podfetch
