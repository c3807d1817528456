#include "AprioriMiner.h"
#include "BasketryExceptions.h"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using ItemId = uint32_t;
using IdSet = std::vector<ItemId>;

struct EncodedTransactions {
    std::vector<std::string> labels;
    std::vector<IdSet> rows;
};

// Ids follow lexicographic label order, so sorted id sets map to sorted label sets.
EncodedTransactions encode(const std::vector<Transaction>& transactions) {
    std::set<std::string> vocabulary;
    for (const auto& t : transactions) vocabulary.insert(t.items.begin(), t.items.end());

    EncodedTransactions out;
    out.labels.assign(vocabulary.begin(), vocabulary.end());
    std::unordered_map<std::string, ItemId> idOf;
    idOf.reserve(out.labels.size());
    for (size_t i = 0; i < out.labels.size(); ++i) idOf.emplace(out.labels[i], static_cast<ItemId>(i));

    out.rows.reserve(transactions.size());
    for (const auto& t : transactions) {
        IdSet row;
        row.reserve(t.items.size());
        for (const auto& item : t.items) row.push_back(idOf.at(item));
        std::sort(row.begin(), row.end());
        out.rows.push_back(std::move(row));
    }
    return out;
}

Itemset decode(const IdSet& ids, const std::vector<std::string>& labels) {
    std::vector<std::string> items;
    items.reserve(ids.size());
    for (ItemId id : ids) items.push_back(labels[id]);
    return Itemset(std::move(items));
}

bool sharesPrefix(const IdSet& a, const IdSet& b) {
    return std::equal(a.begin(), a.end() - 1, b.begin());
}

bool allSubsetsFrequent(const IdSet& candidate, const std::set<IdSet>& previous) {
    // Dropping either of the last two elements yields the join parents.
    IdSet subset;
    subset.reserve(candidate.size() - 1);
    for (size_t skip = 0; skip + 2 < candidate.size(); ++skip) {
        subset.clear();
        for (size_t i = 0; i < candidate.size(); ++i) {
            if (i != skip) subset.push_back(candidate[i]);
        }
        if (previous.find(subset) == previous.end()) return false;
    }
    return true;
}

std::vector<IdSet> generateCandidates(const std::vector<IdSet>& previous) {
    const std::set<IdSet> lookup(previous.begin(), previous.end());
    std::vector<IdSet> candidates;
    for (size_t i = 0; i < previous.size(); ++i) {
        for (size_t j = i + 1; j < previous.size(); ++j) {
            if (!sharesPrefix(previous[i], previous[j])) break;
            IdSet candidate = previous[i];
            candidate.push_back(previous[j].back());
            if (allSubsetsFrequent(candidate, lookup)) candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

std::vector<size_t> countSupport(const std::vector<IdSet>& candidates, const std::vector<IdSet>& rows) {
    std::vector<size_t> counts(candidates.size(), 0);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < candidates.size(); ++c) {
        const IdSet& cand = candidates[c];
        size_t hits = 0;
        for (const auto& row : rows) {
            if (row.size() < cand.size()) continue;
            if (std::includes(row.begin(), row.end(), cand.begin(), cand.end())) ++hits;
        }
        counts[c] = hits;
    }
    return counts;
}
} // namespace

std::optional<double> FrequentItemsets::supportOf(const Itemset& itemset) const {
    auto level = levels.find(itemset.size());
    if (level == levels.end()) return std::nullopt;
    auto it = level->second.find(itemset);
    if (it == level->second.end()) return std::nullopt;
    return it->second;
}

size_t FrequentItemsets::total() const noexcept {
    size_t n = 0;
    for (const auto& [k, sets] : levels) n += sets.size();
    return n;
}

std::vector<FrequentItemset> FrequentItemsets::flatten() const {
    std::vector<FrequentItemset> out;
    out.reserve(total());
    for (const auto& [k, sets] : levels) {
        for (const auto& [itemset, support] : sets) out.push_back({itemset, support});
    }
    std::stable_sort(out.begin(), out.end(), [](const FrequentItemset& a, const FrequentItemset& b) {
        if (a.items.size() != b.items.size()) return a.items.size() < b.items.size();
        if (a.support != b.support) return a.support > b.support;
        return a.items < b.items;
    });
    return out;
}

FrequentItemsets AprioriMiner::mine(const std::vector<Transaction>& transactions,
                                    double minSupport,
                                    size_t maxItemsetSize) {
    if (!(minSupport >= 0.0 && minSupport <= 1.0)) {
        throw Basketry::ConfigurationException("min_support must be within [0, 1]");
    }

    FrequentItemsets result;
    result.transactionCount = transactions.size();
    if (transactions.empty()) return result;

    const EncodedTransactions encoded = encode(transactions);
    const double n = static_cast<double>(transactions.size());

    std::vector<size_t> singleCounts(encoded.labels.size(), 0);
    for (const auto& row : encoded.rows) {
        for (ItemId id : row) ++singleCounts[id];
    }

    std::vector<IdSet> frequent;
    for (size_t id = 0; id < singleCounts.size(); ++id) {
        if (singleCounts[id] == 0) continue;
        const double support = static_cast<double>(singleCounts[id]) / n;
        if (support < minSupport) continue;
        frequent.push_back({static_cast<ItemId>(id)});
        result.levels[1].emplace(Itemset{encoded.labels[id]}, support);
    }

    size_t k = 2;
    while (!frequent.empty() && (maxItemsetSize == 0 || k <= maxItemsetSize)) {
        const std::vector<IdSet> candidates = generateCandidates(frequent);
        if (candidates.empty()) break;

        const std::vector<size_t> counts = countSupport(candidates, encoded.rows);
        std::vector<IdSet> survivors;
        for (size_t c = 0; c < candidates.size(); ++c) {
            if (counts[c] == 0) continue;
            const double support = static_cast<double>(counts[c]) / n;
            if (support < minSupport) continue;
            result.levels[k].emplace(decode(candidates[c], encoded.labels), support);
            survivors.push_back(candidates[c]);
        }
        frequent = std::move(survivors);
        ++k;
    }
    return result;
}
