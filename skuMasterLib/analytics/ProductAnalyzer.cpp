#include <skumaster/analytics/ProductAnalyzer.hpp>
#include <skumaster/util/numberFormatUtil.hpp>

#include <unordered_map>

namespace SkuMaster {

std::optional<double> ProductSummary::averageSrp() const {
    if (totalProducts == 0)
        return std::nullopt;
    return srpSum / static_cast<double>(totalProducts);
}

std::optional<std::pair<std::string, std::size_t>> ProductSummary::topProductLine() const {
    const std::pair<std::string, std::size_t>* best = nullptr;
    // strict '>' keeps the first line reaching the maximum
    for (const auto& entry : productLineCounts) {
        if (!best || entry.second > best->second)
            best = &entry;
    }
    if (!best)
        return std::nullopt;
    return *best;
}

std::size_t ProductSummary::countFor(const std::string& line) const {
    for (const auto& entry : productLineCounts) {
        if (entry.first == line)
            return entry.second;
    }
    return 0;
}

ProductSummary analyzeProducts(const std::vector<ProductRecord>& products) {
    ProductSummary s;
    std::unordered_map<std::string, std::size_t> lineIndex;

    for (const auto& p : products) {
        ++s.totalProducts;

        switch (classifyStatus(p.status)) {
        case ProductStatus::Active:
            ++s.activeProducts;
            break;
        case ProductStatus::Discontinued:
            ++s.discontinuedProducts;
            break;
        default:
            break;
        }

        s.srpSum += p.srp;

        const std::string& line = p.productLine.empty() ? kUnassignedProductLine : p.productLine;
        auto it = lineIndex.find(line);
        if (it == lineIndex.end()) {
            lineIndex.emplace(line, s.productLineCounts.size());
            s.productLineCounts.emplace_back(line, 1);
        } else {
            ++s.productLineCounts[it->second].second;
        }
    }
    return s;
}

FieldList toDisplayMetrics(const ProductSummary& summary) {
    FieldList out;
    out.emplace_back("Total Products", std::to_string(summary.totalProducts));
    out.emplace_back("Active Products", std::to_string(summary.activeProducts));
    out.emplace_back("Discontinued", std::to_string(summary.discontinuedProducts));

    auto avg = summary.averageSrp();
    out.emplace_back("Avg SRP", avg ? util::formatCurrency(*avg) : kNotAvailable);

    auto top = summary.topProductLine();
    out.emplace_back("Top Product Line",
                     top ? top->first + " (" + std::to_string(top->second) + ")"
                         : std::string(kNotAvailable));
    return out;
}

} // namespace SkuMaster
