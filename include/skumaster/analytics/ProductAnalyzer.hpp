#pragma once
/// @file ProductAnalyzer.hpp
/// @brief Dashboard statistics over a product list

#include "../record/ProductRecord.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SkuMaster {

/// @brief Product Line key used for records whose Product Line is empty
constexpr const char* kUnassignedProductLine = "Unassigned";

/// @brief Rendering of a metric that has no value (empty list)
constexpr const char* kNotAvailable = "N/A";

/// @brief Raw metrics computed in one pass over a product list
struct ProductSummary {
    std::size_t totalProducts = 0;
    std::size_t activeProducts = 0;
    std::size_t discontinuedProducts = 0;
    double srpSum = 0.0;
    /// Product Line -> count, in order of first appearance
    std::vector<std::pair<std::string, std::size_t>> productLineCounts;

    /// @brief srpSum / totalProducts, or nullopt for an empty list
    std::optional<double> averageSrp() const;

    /// @brief Line with the highest count; the earliest seen line wins a tie
    std::optional<std::pair<std::string, std::size_t>> topProductLine() const;

    /// @brief Count for @p line (0 if never seen)
    std::size_t countFor(const std::string& line) const;
};

ProductSummary analyzeProducts(const std::vector<ProductRecord>& products);

/// @brief The five dashboard strings, in order:
///        "Total Products", "Active Products", "Discontinued", "Avg SRP", "Top Product Line"
/// @details An empty summary renders as "0", "0", "0", "N/A", "N/A".
///          Avg SRP uses the currency rendering; the top line reads "<line> (<count>)".
FieldList toDisplayMetrics(const ProductSummary& summary);

} // namespace SkuMaster
