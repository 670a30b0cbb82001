#pragma once
/// @file ProductRecord.hpp
/// @brief Product master-data record (one SKU)

#include "ProductField.hpp"

#include <array>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SkuMaster {

/// @brief Raw input: header name -> text. Missing names read as "".
using FieldMap = std::unordered_map<std::string, std::string>;

/// @brief Ordered (header order) name -> text pairs
using FieldList = std::vector<std::pair<std::string, std::string>>;

/// @brief Case-insensitive interpretation of the Status text
enum class ProductStatus { Active, Discontinued, Pending, Other };

/// @brief "active" / "ACTIVE" -> Active, and so on. Unknown or empty text -> Other.
ProductStatus classifyStatus(const std::string& status);

/// @brief Number of cells produced by ProductRecord::toDisplayRow()
constexpr std::size_t kDisplayColumnCount = 8;

/// @brief Headings matching toDisplayRow() cell order
extern const std::array<const char*, kDisplayColumnCount> kDisplayHeadings;

/// @brief One product SKU
/// @details Plain value type with one typed member per column. Built once through
///          fromFields() and not modified afterwards by the catalog.
struct ProductRecord {
    std::string status;
    std::string skuCode;
    std::string skuName;
    std::string productLine;
    std::string category;
    std::string subCategory;
    std::string mfupc;
    double srp = 0.0;
    long pcsPerInnerBox = 0;
    long pcsPerMasterBox = 0;
    long shelflifeMonths = 0;
    long periodAfterOpeningMonths = 0;
    double cbm = 0.0;
    double heightCm = 0.0;
    double widthCm = 0.0;
    double lengthCm = 0.0;
    double weightG = 0.0;
    std::string expiryItem;
    std::string sellingBan;
    std::string storageType;
    std::string testerProduct;
    std::string imageUrl;

    /// @brief Build a record from raw text
    /// @details Never fails. Numeric columns that are empty or do not parse become 0;
    ///          text columns are copied as given; unknown names are ignored.
    static ProductRecord fromFields(const FieldMap& raw);

    /// @brief Storage key (SKU Code)
    const std::string& id() const { return skuCode; }

    /// @brief SKU Code, SKU Name, Status, Product Line, Category, SRP (currency),
    ///        "<N> months", Storage Type
    std::vector<std::string> toDisplayRow() const;

    /// @brief Every column in header order, numbers in plain (non-currency) form
    FieldList toStorageMap() const;

    /// @brief Text of a single column as toStorageMap() would render it
    std::string valueOf(ProductField field) const;

    bool operator==(const ProductRecord& o) const;
    bool operator!=(const ProductRecord& o) const { return !(*this == o); }
};

} // namespace SkuMaster
