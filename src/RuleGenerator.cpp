#include "RuleGenerator.h"
#include "BasketryExceptions.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace {
constexpr size_t kMaxSplitItems = 62;

void splitItemset(const Itemset& itemset, uint64_t mask, Itemset& antecedent, Itemset& consequent) {
    std::vector<std::string> lhs;
    std::vector<std::string> rhs;
    const auto& items = itemset.items();
    for (size_t i = 0; i < items.size(); ++i) {
        if (mask & (uint64_t{1} << i)) {
            lhs.push_back(items[i]);
        } else {
            rhs.push_back(items[i]);
        }
    }
    antecedent = Itemset(std::move(lhs));
    consequent = Itemset(std::move(rhs));
}
} // namespace

bool RuleGenerator::ranksBefore(const AssociationRule& a, const AssociationRule& b) {
    if (a.lift != b.lift) return a.lift > b.lift;
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.support != b.support) return a.support > b.support;
    if (a.antecedent != b.antecedent) return a.antecedent < b.antecedent;
    return a.consequent < b.consequent;
}

std::vector<AssociationRule> RuleGenerator::generate(const FrequentItemsets& frequent, double minLift) {
    if (!(minLift >= 0.0)) {
        throw Basketry::ConfigurationException("min_lift must be >= 0");
    }

    std::vector<AssociationRule> rules;
    for (const auto& [length, sets] : frequent.levels) {
        if (length < 2) continue;
        if (length > kMaxSplitItems) {
            throw Basketry::AnalysisException("Itemset too long to enumerate rules: " + std::to_string(length));
        }
        const uint64_t full = (uint64_t{1} << length) - 1;

        for (const auto& [itemset, support] : sets) {
            for (uint64_t mask = 1; mask < full; ++mask) {
                AssociationRule rule;
                splitItemset(itemset, mask, rule.antecedent, rule.consequent);

                const auto antecedentSupport = frequent.supportOf(rule.antecedent);
                if (!antecedentSupport || *antecedentSupport <= 0.0) continue;

                rule.support = support;
                rule.confidence = support / *antecedentSupport;

                const auto consequentSupport = frequent.supportOf(rule.consequent);
                if (consequentSupport && *consequentSupport > 0.0) {
                    rule.lift = rule.confidence / *consequentSupport;
                } else {
                    rule.lift = std::numeric_limits<double>::infinity();
                }

                if (rule.lift >= minLift) rules.push_back(std::move(rule));
            }
        }
    }

    std::sort(rules.begin(), rules.end(), ranksBefore);
    return rules;
}
