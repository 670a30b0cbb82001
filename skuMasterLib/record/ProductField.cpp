#include <skumaster/record/ProductField.hpp>

namespace SkuMaster {

std::optional<ProductField> findField(const std::string& name) {
    for (const auto& def : kProductFields) {
        if (name == def.name)
            return def.field;
    }
    return std::nullopt;
}

const char* fieldKindName(FieldKind kind) {
    switch (kind) {
    case FieldKind::Text:
        return "text";
    case FieldKind::Decimal:
        return "decimal";
    case FieldKind::Integer:
        return "integer";
    case FieldKind::YesNo:
        return "yes/no";
    }
    return "text";
}

} // namespace SkuMaster
