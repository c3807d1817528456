#pragma once
#include "BasketAnalyzer.h"

#include <string>
#include <vector>

class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addParagraph(const std::string& text);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    const std::string& body() const noexcept { return body_; }
    void save(const std::string& filePath) const;

private:
    std::string body_;
};

/**
 * @brief Markdown summary of an analysis: Summary, Association Rules, Single Item Rules
 * and Frequent Itemsets sections.
 */
ReportEngine buildAnalysisReport(const AnalysisResult& result, const std::string& sourceLabel);
