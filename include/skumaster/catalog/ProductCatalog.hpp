#pragma once
/// @file ProductCatalog.hpp
/// @brief In-memory product list owned by one session

#include "../record/ProductRecord.hpp"
#include "../repository/RecordRepository.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace SkuMaster {

/// @brief Ordered list of products for one session
/// @details Insertion order is preserved. Not synchronized: a single owner drives it.
///          Loading and saving go through a RecordRepository supplied by the caller.
class ProductCatalog {
  public:
    ProductCatalog() = default;

    /// @brief Validate operator input and append the resulting record
    /// @details SKU Code and SKU Name must be non-empty, otherwise ec is
    ///          invalid_argument and nothing is added. Numeric text is coerced, never
    ///          rejected.
    /// @return Pointer to the stored record, or nullptr on failure
    const ProductRecord* addFromInput(const FieldMap& raw, std::error_code& ec);

    /// @brief Append an already built record without validation
    void add(ProductRecord record);

    /// @brief Replace the whole list with the repository contents
    /// @details On failure the current list is left exactly as it was.
    bool load(RecordRepository<ProductRecord>& repo, std::error_code& ec);

    /// @brief Write the whole list, in order, to the repository
    /// @details On failure the in-memory list is untouched.
    bool save(RecordRepository<ProductRecord>& repo, std::error_code& ec) const;

    const std::vector<ProductRecord>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

  private:
    std::vector<ProductRecord> records_;
};

} // namespace SkuMaster
