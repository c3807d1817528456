#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Unordered set of item labels stored sorted and unique.
 * @details Two itemsets built from the same labels in any order compare equal and
 * render the same label.
 */
class Itemset {
public:
    Itemset() = default;
    explicit Itemset(std::vector<std::string> items);
    Itemset(std::initializer_list<std::string> items);

    const std::vector<std::string>& items() const noexcept { return items_; }
    size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }
    bool contains(const std::string& item) const;

    std::string label(std::string_view separator = ", ") const;

    bool operator==(const Itemset& other) const noexcept { return items_ == other.items_; }
    bool operator!=(const Itemset& other) const noexcept { return items_ != other.items_; }
    bool operator<(const Itemset& other) const noexcept { return items_ < other.items_; }

private:
    std::vector<std::string> items_;
};
