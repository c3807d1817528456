#pragma once

#include "Itemset.h"
#include "TransactionBuilder.h"

#include <map>
#include <optional>
#include <vector>

struct FrequentItemset {
    Itemset items;
    double support = 0.0;
};

struct FrequentItemsets {
    size_t transactionCount = 0;
    // Keyed by itemset length.
    std::map<size_t, std::map<Itemset, double>> levels;

    std::optional<double> supportOf(const Itemset& itemset) const;
    size_t total() const noexcept;
    bool empty() const noexcept { return total() == 0; }

    // Length ascending, then support descending, then label.
    std::vector<FrequentItemset> flatten() const;
};

class AprioriMiner {
public:
    /**
     * @brief Level-wise frequent itemset mining.
     * @details support = count / transactions.size(); an itemset is kept when its support is
     * >= minSupport and it occurs at least once. Candidates of length k come from joining
     * frequent (k-1)-itemsets sharing a (k-2)-prefix, pruned when any (k-1)-subset is not
     * frequent. maxItemsetSize == 0 leaves the depth unbounded.
     * @throws Basketry::ConfigurationException when minSupport is outside [0, 1].
     */
    static FrequentItemsets mine(const std::vector<Transaction>& transactions,
                                 double minSupport,
                                 size_t maxItemsetSize = 0);
};
