#include "Itemset.h"
#include "CommonUtils.h"

#include <algorithm>
#include <utility>

Itemset::Itemset(std::vector<std::string> items) : items_(std::move(items)) {
    std::sort(items_.begin(), items_.end());
    items_.erase(std::unique(items_.begin(), items_.end()), items_.end());
}

Itemset::Itemset(std::initializer_list<std::string> items)
    : Itemset(std::vector<std::string>(items)) {}

bool Itemset::contains(const std::string& item) const {
    return std::binary_search(items_.begin(), items_.end(), item);
}

std::string Itemset::label(std::string_view separator) const {
    return CommonUtils::join(items_, separator);
}
