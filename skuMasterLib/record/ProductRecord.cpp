#include <skumaster/record/ProductRecord.hpp>
#include <skumaster/util/numberFormatUtil.hpp>

namespace SkuMaster {

const std::array<const char*, kDisplayColumnCount> kDisplayHeadings = {
    "SKU Code", "SKU Name", "Status", "Product Line",
    "Category", "SRP (₱)",  "Shelf-life", "Storage Type",
};

namespace {

const std::string& lookup(const FieldMap& raw, ProductField f) {
    static const std::string empty;
    auto it = raw.find(fieldName(f));
    return it == raw.end() ? empty : it->second;
}

// 숫자 변환 실패는 오류로 올리지 않고 0으로 대체한다 (입력 관대 정책).
double coerceDecimal(const std::string& text) {
    double v = 0.0;
    std::error_code ec;
    if (!util::parseDoubleStrict(text, v, ec))
        return 0.0;
    return v;
}

long coerceInteger(const std::string& text) {
    long v = 0;
    std::error_code ec;
    if (!util::parseLongStrict(text, v, ec))
        return 0;
    return v;
}

} // namespace

ProductStatus classifyStatus(const std::string& status) {
    const std::string s = util::toLowerCopy(status);
    if (s == "active")
        return ProductStatus::Active;
    if (s == "discontinued")
        return ProductStatus::Discontinued;
    if (s == "pending")
        return ProductStatus::Pending;
    return ProductStatus::Other;
}

ProductRecord ProductRecord::fromFields(const FieldMap& raw) {
    ProductRecord r;
    r.status = lookup(raw, ProductField::Status);
    r.skuCode = lookup(raw, ProductField::SkuCode);
    r.skuName = lookup(raw, ProductField::SkuName);
    r.productLine = lookup(raw, ProductField::ProductLine);
    r.category = lookup(raw, ProductField::Category);
    r.subCategory = lookup(raw, ProductField::SubCategory);
    r.mfupc = lookup(raw, ProductField::Mfupc);
    r.srp = coerceDecimal(lookup(raw, ProductField::Srp));
    r.pcsPerInnerBox = coerceInteger(lookup(raw, ProductField::PcsPerInnerBox));
    r.pcsPerMasterBox = coerceInteger(lookup(raw, ProductField::PcsPerMasterBox));
    r.shelflifeMonths = coerceInteger(lookup(raw, ProductField::ShelflifeMonths));
    r.periodAfterOpeningMonths =
        coerceInteger(lookup(raw, ProductField::PeriodAfterOpeningMonths));
    r.cbm = coerceDecimal(lookup(raw, ProductField::Cbm));
    r.heightCm = coerceDecimal(lookup(raw, ProductField::HeightCm));
    r.widthCm = coerceDecimal(lookup(raw, ProductField::WidthCm));
    r.lengthCm = coerceDecimal(lookup(raw, ProductField::LengthCm));
    r.weightG = coerceDecimal(lookup(raw, ProductField::WeightG));
    r.expiryItem = lookup(raw, ProductField::ExpiryItem);
    r.sellingBan = lookup(raw, ProductField::SellingBan);
    r.storageType = lookup(raw, ProductField::StorageType);
    r.testerProduct = lookup(raw, ProductField::TesterProduct);
    r.imageUrl = lookup(raw, ProductField::ImageUrl);
    return r;
}

std::vector<std::string> ProductRecord::toDisplayRow() const {
    return {
        skuCode,
        skuName,
        status,
        productLine,
        category,
        util::formatCurrency(srp),
        std::to_string(shelflifeMonths) + " months",
        storageType,
    };
}

std::string ProductRecord::valueOf(ProductField field) const {
    switch (field) {
    case ProductField::Status:
        return status;
    case ProductField::SkuCode:
        return skuCode;
    case ProductField::SkuName:
        return skuName;
    case ProductField::ProductLine:
        return productLine;
    case ProductField::Category:
        return category;
    case ProductField::SubCategory:
        return subCategory;
    case ProductField::Mfupc:
        return mfupc;
    case ProductField::Srp:
        return util::formatDecimal(srp);
    case ProductField::PcsPerInnerBox:
        return std::to_string(pcsPerInnerBox);
    case ProductField::PcsPerMasterBox:
        return std::to_string(pcsPerMasterBox);
    case ProductField::ShelflifeMonths:
        return std::to_string(shelflifeMonths);
    case ProductField::PeriodAfterOpeningMonths:
        return std::to_string(periodAfterOpeningMonths);
    case ProductField::Cbm:
        return util::formatDecimal(cbm);
    case ProductField::HeightCm:
        return util::formatDecimal(heightCm);
    case ProductField::WidthCm:
        return util::formatDecimal(widthCm);
    case ProductField::LengthCm:
        return util::formatDecimal(lengthCm);
    case ProductField::WeightG:
        return util::formatDecimal(weightG);
    case ProductField::ExpiryItem:
        return expiryItem;
    case ProductField::SellingBan:
        return sellingBan;
    case ProductField::StorageType:
        return storageType;
    case ProductField::TesterProduct:
        return testerProduct;
    case ProductField::ImageUrl:
        return imageUrl;
    }
    return std::string();
}

FieldList ProductRecord::toStorageMap() const {
    FieldList out;
    out.reserve(kProductFieldCount);
    for (const auto& def : kProductFields)
        out.emplace_back(def.name, valueOf(def.field));
    return out;
}

bool ProductRecord::operator==(const ProductRecord& o) const {
    return status == o.status && skuCode == o.skuCode && skuName == o.skuName &&
           productLine == o.productLine && category == o.category &&
           subCategory == o.subCategory && mfupc == o.mfupc && srp == o.srp &&
           pcsPerInnerBox == o.pcsPerInnerBox && pcsPerMasterBox == o.pcsPerMasterBox &&
           shelflifeMonths == o.shelflifeMonths &&
           periodAfterOpeningMonths == o.periodAfterOpeningMonths && cbm == o.cbm &&
           heightCm == o.heightCm && widthCm == o.widthCm && lengthCm == o.lengthCm &&
           weightG == o.weightG && expiryItem == o.expiryItem && sellingBan == o.sellingBan &&
           storageType == o.storageType && testerProduct == o.testerProduct &&
           imageUrl == o.imageUrl;
}

} // namespace SkuMaster
