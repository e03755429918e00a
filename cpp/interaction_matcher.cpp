#include "interaction_matcher.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <plog/Log.h>
#include <sstream>

namespace pharmiq {
namespace {

const std::set<std::string>& dosage_form_words() {
    static const std::set<std::string> words = {
        "tablet", "tablets", "tab", "capsule", "capsules", "cap", "injection", "inhaler",
        "syrup", "suspension", "cream", "ointment", "drops", "solution",
    };
    return words;
}

const std::set<std::string>& dosage_units() {
    static const std::set<std::string> units = {"", "mg", "mcg", "g", "ml", "iu", "%"};
    return units;
}

// "50", "2.5", "100mg" or "0.5%"; "6-mercaptopurine" and "d3" are not.
bool is_dosage_token(const std::string& word) {
    std::size_t i = 0;
    while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) ++i;
    if (i == 0) return false;
    if (i < word.size() && word[i] == '.') {
        const std::size_t fraction = ++i;
        while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) ++i;
        if (i == fraction) return false;
    }
    return dosage_units().count(word.substr(i)) > 0;
}

std::string to_lower_copy(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

int levenshtein(const std::string& left, const std::string& right) {
    const std::size_t n = left.size();
    const std::size_t m = right.size();
    if (n == 0) return static_cast<int>(m);
    if (m == 0) return static_cast<int>(n);

    std::vector<int> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) {
        prev[j] = static_cast<int>(j);
    }

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = static_cast<int>(i);
        for (std::size_t j = 1; j <= m; ++j) {
            const int cost = left[i - 1] == right[j - 1] ? 0 : 1;
            cur[j] = std::min({
                prev[j] + 1,
                cur[j - 1] + 1,
                prev[j - 1] + cost,
            });
        }
        prev.swap(cur);
    }
    return prev[m];
}

}

std::string normalize_drug_name(const std::string& name) {
    std::istringstream words(to_lower_copy(name));
    std::string word;
    std::string out;
    while (words >> word) {
        if (!out.empty() && (is_dosage_token(word) || dosage_form_words().count(word) > 0)) break;
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

double name_similarity(const std::string& a, const std::string& b) {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(a, b)) / static_cast<double>(longest);
}

Severity parse_severity(const std::string& text) {
    const std::string s = normalize_drug_name(text);
    if (s == "none") return Severity::NONE;
    if (s == "minor" || s == "mild") return Severity::MINOR;
    if (s == "moderate") return Severity::MODERATE;
    if (s == "severe") return Severity::SEVERE;
    throw ConfigurationError(fmt::format("unknown interaction severity '{}'", text));
}

InteractionRuleBase::PairKey InteractionRuleBase::key(const std::string& a, const std::string& b) {
    return a < b ? PairKey{a, b} : PairKey{b, a};
}

void InteractionRuleBase::addRule(InteractionRule rule) {
    rule.drug_a = normalize_drug_name(rule.drug_a);
    rule.drug_b = normalize_drug_name(rule.drug_b);
    if (rule.drug_a.empty() || rule.drug_b.empty()) {
        throw ConfigurationError("interaction rule needs two drug names");
    }
    vocabulary_.insert(rule.drug_a);
    vocabulary_.insert(rule.drug_b);
    auto k = key(rule.drug_a, rule.drug_b);
    rules_[std::move(k)] = std::move(rule);
}

void InteractionRuleBase::addCategoryMember(const std::string& category, const std::string& drug) {
    const std::string name = normalize_drug_name(drug);
    const std::string cat = to_lower_copy(category);
    if (name.empty() || cat.empty()) {
        throw ConfigurationError("category membership needs a category and a drug name");
    }
    categories_[name].insert(cat);
    vocabulary_.insert(name);
}

void InteractionRuleBase::addCategoryRule(CategoryRule rule) {
    rule.category_a = to_lower_copy(rule.category_a);
    rule.category_b = to_lower_copy(rule.category_b);
    if (rule.category_a.empty() || rule.category_b.empty()) {
        throw ConfigurationError("category rule needs two categories");
    }
    auto k = key(rule.category_a, rule.category_b);
    category_rules_[std::move(k)] = std::move(rule);
}

void InteractionRuleBase::clear() {
    rules_.clear();
    category_rules_.clear();
    categories_.clear();
    vocabulary_.clear();
}

const InteractionRule* InteractionRuleBase::findRule(const std::string& a, const std::string& b) const {
    const auto it = rules_.find(key(a, b));
    return it == rules_.end() ? nullptr : &it->second;
}

const CategoryRule* InteractionRuleBase::findCategoryRule(const std::string& a, const std::string& b) const {
    const CategoryRule* worst = nullptr;
    for (const auto& cat_a : categoriesOf(a)) {
        for (const auto& cat_b : categoriesOf(b)) {
            const auto it = category_rules_.find(key(cat_a, cat_b));
            if (it == category_rules_.end()) continue;
            if (worst == nullptr || it->second.severity > worst->severity) worst = &it->second;
        }
    }
    return worst;
}

std::set<std::string> InteractionRuleBase::categoriesOf(const std::string& drug) const {
    const auto it = categories_.find(drug);
    return it == categories_.end() ? std::set<std::string>{} : it->second;
}

InteractionQueryResult check_interactions(const std::vector<std::string>& drug_names,
                                          const InteractionRuleBase& rules,
                                          const EngineConfig& config) {
    InteractionQueryResult result;
    std::set<std::string> canonical;

    for (const auto& input : drug_names) {
        const std::string name = normalize_drug_name(input);
        if (name.empty()) {
            result.unmatched_inputs.push_back(input);
            continue;
        }
        if (rules.vocabulary().count(name) > 0) {
            result.resolved_inputs.push_back({input, name, 1.0, true});
            canonical.insert(name);
            continue;
        }

        const std::string* best = nullptr;
        double best_score = 0.0;
        for (const auto& known : rules.vocabulary()) {
            const double score = name_similarity(name, known);
            if (score > best_score) {
                best_score = score;
                best = &known;
            }
        }

        if (best != nullptr && best_score >= config.fuzzy_threshold) {
            PLOGD << fmt::format("Resolved '{}' to '{}' (similarity {:.3f})", input, *best, best_score);
            result.resolved_inputs.push_back({input, *best, best_score, false});
            canonical.insert(*best);
        } else {
            PLOG_WARNING << fmt::format("Could not resolve drug name '{}'", input);
            result.unmatched_inputs.push_back(input);
        }
    }

    const std::vector<std::string> names(canonical.begin(), canonical.end());
    for (std::size_t i = 0; i < names.size(); ++i) {
        for (std::size_t j = i + 1; j < names.size(); ++j) {
            if (const auto* rule = rules.findRule(names[i], names[j])) {
                MatchedPair pair{names[i], names[j], rule->severity, rule->description, rule->management,
                                 MatchSource::RULE, {}};
                if (rule->severity >= Severity::MODERATE) pair.substitute_suggestions = rule->substitute_suggestions;
                result.matched_pairs.push_back(std::move(pair));
            } else if (const auto* category_rule = rules.findCategoryRule(names[i], names[j])) {
                result.matched_pairs.push_back({names[i], names[j], category_rule->severity, category_rule->description,
                                                category_rule->management, MatchSource::CATEGORY, {}});
            }
        }
    }

    for (const auto& pair : result.matched_pairs) {
        result.overall_risk = std::max(result.overall_risk, pair.severity);
    }
    return result;
}

PrescriptionReview review_prescription(const std::vector<std::string>& drug_names,
                                       const InteractionRuleBase& rules,
                                       const EngineConfig& config) {
    PrescriptionReview review;
    review.result = check_interactions(drug_names, rules, config);

    for (const auto& pair : review.result.matched_pairs) {
        if (pair.severity == Severity::SEVERE) {
            review.safe = false;
            review.critical.push_back(pair);
        } else if (pair.severity != Severity::NONE) {
            review.warnings.push_back(pair);
        }
    }

    if (!review.safe) {
        review.recommendations.push_back("Review prescription due to severe drug interactions");
    }
    if (!review.warnings.empty()) {
        review.recommendations.push_back("Monitor patient closely due to potential drug interactions");
    }
    if (!review.result.unmatched_inputs.empty()) {
        review.recommendations.push_back(
            fmt::format("{} drug name(s) could not be checked", review.result.unmatched_inputs.size()));
    }
    if (review.safe && review.warnings.empty() && review.result.unmatched_inputs.empty()) {
        review.recommendations.push_back("Prescription appears safe with no significant interactions detected");
    }
    return review;
}

}
