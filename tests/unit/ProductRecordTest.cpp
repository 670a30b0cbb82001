/**
 * @file ProductRecordTest.cpp
 * @brief Unit tests for the product field table and ProductRecord conversions
 */

#include <cmath>
#include <gtest/gtest.h>
#include <string>

#include <skumaster/record/ProductRecord.hpp>

using namespace SkuMaster;

namespace {

FieldMap sampleInput() {
    FieldMap raw;
    raw["Status"] = "Active";
    raw["SKU Code"] = "SKU-001";
    raw["SKU Name"] = "Hydrating Toner";
    raw["Product Line"] = "Skincare";
    raw["Category"] = "Toner";
    raw["Sub-Category"] = "Hydrating";
    raw["MFUPC"] = "4800000000012";
    raw["SRP"] = "1299.5";
    raw["PCS per Inner Box"] = "12";
    raw["PCS per Master Box"] = "48";
    raw["Shelflife (Months)"] = "36";
    raw["Period After Opening (Months)"] = "12";
    raw["CBM"] = "0.002";
    raw["Height(cm)"] = "15.5";
    raw["Width(cm)"] = "5";
    raw["Length(cm)"] = "5";
    raw["Weight(g)"] = "220";
    raw["Expiry Item"] = "Yes";
    raw["Selling Ban"] = "No";
    raw["Storage Type"] = "Room Temp";
    raw["Tester product"] = "No";
    raw["Image URL"] = "https://example.com/toner.png";
    return raw;
}

} // namespace

// =============================================================================
// ProductField Tests
// =============================================================================

TEST(ProductFieldTest, TableOrderMatchesEnum) {
    ASSERT_EQ(kProductFields.size(), kProductFieldCount);
    for (std::size_t i = 0; i < kProductFields.size(); ++i)
        EXPECT_EQ(static_cast<std::size_t>(kProductFields[i].field), i);

    EXPECT_STREQ(kProductFields.front().name, "Status");
    EXPECT_STREQ(kProductFields.back().name, "Image URL");
}

TEST(ProductFieldTest, FindFieldIsExactMatch) {
    auto f = findField("Shelflife (Months)");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(*f, ProductField::ShelflifeMonths);
    EXPECT_EQ(fieldKind(*f), FieldKind::Integer);

    EXPECT_FALSE(findField("sku code").has_value());
    EXPECT_FALSE(findField("Weight").has_value());
    EXPECT_FALSE(findField("").has_value());
}

TEST(ProductFieldTest, KindNames) {
    EXPECT_STREQ(fieldKindName(FieldKind::Text), "text");
    EXPECT_STREQ(fieldKindName(FieldKind::Decimal), "decimal");
    EXPECT_STREQ(fieldKindName(FieldKind::Integer), "integer");
    EXPECT_STREQ(fieldKindName(FieldKind::YesNo), "yes/no");
}

// =============================================================================
// fromFields Tests
// =============================================================================

TEST(ProductRecordTest, FromFieldsCopiesAndConverts) {
    ProductRecord r = ProductRecord::fromFields(sampleInput());

    EXPECT_EQ(r.id(), "SKU-001");
    EXPECT_EQ(r.skuName, "Hydrating Toner");
    EXPECT_EQ(r.subCategory, "Hydrating");
    EXPECT_DOUBLE_EQ(r.srp, 1299.5);
    EXPECT_EQ(r.pcsPerInnerBox, 12);
    EXPECT_EQ(r.pcsPerMasterBox, 48);
    EXPECT_EQ(r.shelflifeMonths, 36);
    EXPECT_EQ(r.periodAfterOpeningMonths, 12);
    EXPECT_DOUBLE_EQ(r.cbm, 0.002);
    EXPECT_DOUBLE_EQ(r.heightCm, 15.5);
    EXPECT_DOUBLE_EQ(r.weightG, 220.0);
    EXPECT_EQ(r.expiryItem, "Yes");
    EXPECT_EQ(r.testerProduct, "No");
    EXPECT_EQ(r.imageUrl, "https://example.com/toner.png");
}

TEST(ProductRecordTest, EmptyInputGivesDefaults) {
    ProductRecord r = ProductRecord::fromFields(FieldMap{});

    EXPECT_EQ(r.status, "");
    EXPECT_EQ(r.skuCode, "");
    EXPECT_DOUBLE_EQ(r.srp, 0.0);
    EXPECT_EQ(r.shelflifeMonths, 0);
    EXPECT_DOUBLE_EQ(r.cbm, 0.0);
    EXPECT_EQ(r.imageUrl, "");
}

TEST(ProductRecordTest, InvalidNumbersBecomeZero) {
    FieldMap raw = sampleInput();
    raw["SRP"] = "abc";
    raw["PCS per Inner Box"] = "12.5";
    raw["PCS per Master Box"] = "";
    raw["Shelflife (Months)"] = "3 years";
    raw["Weight(g)"] = "heavy";

    ProductRecord r = ProductRecord::fromFields(raw);
    EXPECT_DOUBLE_EQ(r.srp, 0.0);
    EXPECT_EQ(r.pcsPerInnerBox, 0);
    EXPECT_EQ(r.pcsPerMasterBox, 0);
    EXPECT_EQ(r.shelflifeMonths, 0);
    EXPECT_DOUBLE_EQ(r.weightG, 0.0);
    // 숫자가 아닌 열은 영향을 받지 않는다
    EXPECT_EQ(r.skuCode, "SKU-001");
}

TEST(ProductRecordTest, UnknownNamesIgnored) {
    FieldMap raw = sampleInput();
    raw["Colour"] = "Blue";
    EXPECT_EQ(ProductRecord::fromFields(raw), ProductRecord::fromFields(sampleInput()));
}

TEST(ProductRecordTest, StatusClassificationIgnoresCase) {
    EXPECT_EQ(classifyStatus("Active"), ProductStatus::Active);
    EXPECT_EQ(classifyStatus("ACTIVE"), ProductStatus::Active);
    EXPECT_EQ(classifyStatus("discontinued"), ProductStatus::Discontinued);
    EXPECT_EQ(classifyStatus("Pending"), ProductStatus::Pending);
    EXPECT_EQ(classifyStatus("Archived"), ProductStatus::Other);
    EXPECT_EQ(classifyStatus(""), ProductStatus::Other);
}

// =============================================================================
// Rendering Tests
// =============================================================================

TEST(ProductRecordTest, DisplayRow) {
    ProductRecord r = ProductRecord::fromFields(sampleInput());
    auto row = r.toDisplayRow();

    ASSERT_EQ(row.size(), kDisplayColumnCount);
    EXPECT_EQ(row[0], "SKU-001");
    EXPECT_EQ(row[1], "Hydrating Toner");
    EXPECT_EQ(row[2], "Active");
    EXPECT_EQ(row[3], "Skincare");
    EXPECT_EQ(row[4], "Toner");
    EXPECT_EQ(row[5], "₱1,299.50");
    EXPECT_EQ(row[6], "36 months");
    EXPECT_EQ(row[7], "Room Temp");
}

TEST(ProductRecordTest, DisplayRowOfEmptyRecord) {
    auto row = ProductRecord{}.toDisplayRow();
    ASSERT_EQ(row.size(), kDisplayColumnCount);
    EXPECT_EQ(row[5], "₱0.00");
    EXPECT_EQ(row[6], "0 months");
}

TEST(ProductRecordTest, StorageMapInHeaderOrder) {
    ProductRecord r = ProductRecord::fromFields(sampleInput());
    FieldList stored = r.toStorageMap();

    ASSERT_EQ(stored.size(), kProductFieldCount);
    for (std::size_t i = 0; i < kProductFieldCount; ++i)
        EXPECT_EQ(stored[i].first, kProductFields[i].name);

    EXPECT_EQ(stored[0].second, "Active");
    EXPECT_EQ(stored[7].second, "1299.5");
    EXPECT_EQ(stored[8].second, "12");
    EXPECT_EQ(stored[13].second, "15.5");
    EXPECT_EQ(stored[14].second, "5.0");
    EXPECT_EQ(stored[16].second, "220.0");
}

TEST(ProductRecordTest, StorageMapFeedsBackToSameRecord) {
    ProductRecord built = ProductRecord::fromFields(sampleInput());

    FieldMap back;
    for (const auto& kv : built.toStorageMap())
        back[kv.first] = kv.second;

    EXPECT_EQ(ProductRecord::fromFields(back), built);
}

TEST(ProductRecordTest, ExtremeDecimalsSurviveStorage) {
    FieldMap raw = sampleInput();
    raw["SRP"] = "1e400";
    raw["CBM"] = "1e-310";

    ProductRecord r = ProductRecord::fromFields(raw);
    EXPECT_TRUE(std::isinf(r.srp));
    EXPECT_EQ(r.cbm, 1e-310);

    ProductRecord tiny = r;
    tiny.srp = 5e-324;

    FieldMap back;
    for (const auto& kv : tiny.toStorageMap())
        back[kv.first] = kv.second;
    ProductRecord reread = ProductRecord::fromFields(back);
    EXPECT_EQ(reread.srp, 5e-324);
    EXPECT_EQ(reread, tiny);
}
