#include <skumaster/catalog/ProductCatalog.hpp>

#include <exception>
#include <new>

namespace SkuMaster {

namespace {

bool hasValue(const FieldMap& raw, ProductField f) {
    auto it = raw.find(fieldName(f));
    return it != raw.end() && !it->second.empty();
}

} // namespace

const ProductRecord* ProductCatalog::addFromInput(const FieldMap& raw, std::error_code& ec) {
    ec.clear();
    if (!hasValue(raw, ProductField::SkuCode) || !hasValue(raw, ProductField::SkuName)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return nullptr;
    }

    // 레코드 생성 중 예외가 나더라도 목록에는 아무것도 추가하지 않고 ec로만 알린다.
    try {
        records_.push_back(ProductRecord::fromFields(raw));
    } catch (const std::bad_alloc&) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return nullptr;
    } catch (const std::exception&) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return nullptr;
    }
    return &records_.back();
}

void ProductCatalog::add(ProductRecord record) { records_.push_back(std::move(record)); }

bool ProductCatalog::load(RecordRepository<ProductRecord>& repo, std::error_code& ec) {
    auto loaded = repo.findAll(ec);
    if (ec)
        return false;
    records_.swap(loaded);
    return true;
}

bool ProductCatalog::save(RecordRepository<ProductRecord>& repo, std::error_code& ec) const {
    return repo.replaceAll(records_, ec);
}

} // namespace SkuMaster
