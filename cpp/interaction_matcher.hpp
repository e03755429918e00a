#pragma once

#include "config.hpp"
#include "types.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pharmiq {

// Lower-cases, collapses whitespace and drops dosage/form suffixes: "Aspirin  100mg Tablet"
// becomes "aspirin". The first word is always kept, so "6-Mercaptopurine 50mg" becomes
// "6-mercaptopurine".
std::string normalize_drug_name(const std::string& name);

// 1 - levenshtein(a, b) / max(|a|, |b|); 1.0 for two empty strings.
double name_similarity(const std::string& a, const std::string& b);

// Accepts none, minor (or mild), moderate and severe in any case.
Severity parse_severity(const std::string& text);

// Read-only knowledge base for a query. Callers rebuild or replace it between runs to reload.
class InteractionRuleBase {
public:
    void addRule(InteractionRule rule);
    void addCategoryMember(const std::string& category, const std::string& drug);
    void addCategoryRule(CategoryRule rule);
    void clear();

    const InteractionRule* findRule(const std::string& a, const std::string& b) const;
    const CategoryRule* findCategoryRule(const std::string& a, const std::string& b) const;
    std::set<std::string> categoriesOf(const std::string& drug) const;

    const std::set<std::string>& vocabulary() const { return vocabulary_; }
    std::size_t ruleCount() const { return rules_.size(); }
    std::size_t categoryRuleCount() const { return category_rules_.size(); }

private:
    using PairKey = std::pair<std::string, std::string>;
    static PairKey key(const std::string& a, const std::string& b);

    std::map<PairKey, InteractionRule> rules_;
    std::map<PairKey, CategoryRule> category_rules_;
    std::map<std::string, std::set<std::string>> categories_;
    std::set<std::string> vocabulary_;
};

InteractionQueryResult check_interactions(const std::vector<std::string>& drug_names,
                                          const InteractionRuleBase& rules,
                                          const EngineConfig& config);

PrescriptionReview review_prescription(const std::vector<std::string>& drug_names,
                                       const InteractionRuleBase& rules,
                                       const EngineConfig& config);

}
