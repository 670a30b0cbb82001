#pragma once
/// @file ProductField.hpp
/// @brief Closed, ordered set of product master-data fields

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace SkuMaster {

/// @brief Value kind of a field, driving coercion and rendering
enum class FieldKind {
    Text,    ///< Stored verbatim
    Decimal, ///< double, invalid text coerces to 0.0
    Integer, ///< long, invalid text coerces to 0
    YesNo    ///< "Yes"/"No" text, stored verbatim
};

/// @brief One enumerator per column, in storage order
enum class ProductField : std::size_t {
    Status,
    SkuCode,
    SkuName,
    ProductLine,
    Category,
    SubCategory,
    Mfupc,
    Srp,
    PcsPerInnerBox,
    PcsPerMasterBox,
    ShelflifeMonths,
    PeriodAfterOpeningMonths,
    Cbm,
    HeightCm,
    WidthCm,
    LengthCm,
    WeightG,
    ExpiryItem,
    SellingBan,
    StorageType,
    TesterProduct,
    ImageUrl,
};

constexpr std::size_t kProductFieldCount = 22;

/// @brief Field metadata: enumerator, header name, value kind
struct FieldDef {
    ProductField field;
    const char* name;
    FieldKind kind;
};

/// @brief Storage header order. Names are written to and matched in files verbatim.
constexpr std::array<FieldDef, kProductFieldCount> kProductFields = {{
    {ProductField::Status, "Status", FieldKind::Text},
    {ProductField::SkuCode, "SKU Code", FieldKind::Text},
    {ProductField::SkuName, "SKU Name", FieldKind::Text},
    {ProductField::ProductLine, "Product Line", FieldKind::Text},
    {ProductField::Category, "Category", FieldKind::Text},
    {ProductField::SubCategory, "Sub-Category", FieldKind::Text},
    {ProductField::Mfupc, "MFUPC", FieldKind::Text},
    {ProductField::Srp, "SRP", FieldKind::Decimal},
    {ProductField::PcsPerInnerBox, "PCS per Inner Box", FieldKind::Integer},
    {ProductField::PcsPerMasterBox, "PCS per Master Box", FieldKind::Integer},
    {ProductField::ShelflifeMonths, "Shelflife (Months)", FieldKind::Integer},
    {ProductField::PeriodAfterOpeningMonths, "Period After Opening (Months)", FieldKind::Integer},
    {ProductField::Cbm, "CBM", FieldKind::Decimal},
    {ProductField::HeightCm, "Height(cm)", FieldKind::Decimal},
    {ProductField::WidthCm, "Width(cm)", FieldKind::Decimal},
    {ProductField::LengthCm, "Length(cm)", FieldKind::Decimal},
    {ProductField::WeightG, "Weight(g)", FieldKind::Decimal},
    {ProductField::ExpiryItem, "Expiry Item", FieldKind::YesNo},
    {ProductField::SellingBan, "Selling Ban", FieldKind::YesNo},
    {ProductField::StorageType, "Storage Type", FieldKind::Text},
    {ProductField::TesterProduct, "Tester product", FieldKind::YesNo},
    {ProductField::ImageUrl, "Image URL", FieldKind::Text},
}};

/// @brief Header name of @p f
constexpr const char* fieldName(ProductField f) {
    return kProductFields[static_cast<std::size_t>(f)].name;
}

constexpr FieldKind fieldKind(ProductField f) {
    return kProductFields[static_cast<std::size_t>(f)].kind;
}

/// @brief Reverse lookup by exact (case-sensitive) header name
std::optional<ProductField> findField(const std::string& name);

const char* fieldKindName(FieldKind kind);

} // namespace SkuMaster
