#pragma once

/**
 * @file skumaster.hpp
 * @brief Main convenience header for SkuMaster
 *
 * @code
 * #include <skumaster/skumaster.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     SkuMaster::CsvFileRepositoryImpl repo("product_master_data.csv");
 *     SkuMaster::ProductCatalog catalog;
 *     if (!catalog.load(repo, ec))
 *         return 1;
 *     auto metrics = SkuMaster::toDisplayMetrics(SkuMaster::analyzeProducts(catalog.records()));
 * }
 * @endcode
 */

// =============================================================================
// Record Model
// =============================================================================
#include "record/ProductField.hpp"
#include "record/ProductRecord.hpp"

// =============================================================================
// Collection, Analytics, Persistence
// =============================================================================
#include "analytics/ProductAnalyzer.hpp"
#include "catalog/ProductCatalog.hpp"
#include "repository/CsvFileRepositoryImpl.hpp"
#include "repository/RecordRepository.hpp"

/**
 * @namespace SkuMaster
 * @brief Root namespace for the product master-data library
 */
namespace SkuMaster {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace SkuMaster
