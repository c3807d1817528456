#pragma once

#include "AprioriMiner.h"
#include "Itemset.h"

#include <vector>

struct AssociationRule {
    Itemset antecedent;
    Itemset consequent;
    double support = 0.0;
    double confidence = 0.0;
    double lift = 0.0; // +inf when the consequent support is unknown or zero
};

class RuleGenerator {
public:
    /**
     * @brief Derives antecedent => consequent rules from every frequent itemset of length >= 2.
     * @details Each proper non-empty subset is tried as antecedent with its complement as
     * consequent. Splits whose antecedent support is unknown or zero are skipped. Rules with
     * lift >= minLift are kept and returned in ranking order.
     * @throws Basketry::ConfigurationException when minLift is negative.
     */
    static std::vector<AssociationRule> generate(const FrequentItemsets& frequent, double minLift);

    // Lift, confidence, support descending; then antecedent and consequent labels ascending.
    static bool ranksBefore(const AssociationRule& a, const AssociationRule& b);

    static bool isSingleItemRule(const AssociationRule& rule) noexcept {
        return rule.antecedent.size() == 1 && rule.consequent.size() == 1;
    }
};
