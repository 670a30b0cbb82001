#pragma once
/// @file RecordRepository.hpp
/// @brief Repository template interface

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace SkuMaster {

/// @brief Storage of an ordered list of records
/// @tparam T Record type (Duck Typing: requires id())
/// @details Every operation reports failure through @p ec and a falsy return value.
template <typename T> class RecordRepository {
  public:
    virtual ~RecordRepository() = default;

    /// @brief Read every record in storage order
    /// @param ec Error code set on failure
    /// @return All records (empty on failure)
    virtual std::vector<T> findAll(std::error_code& ec) = 0;

    /// @brief Find the first record whose id() equals @p id
    /// @param ec Error code set on failure
    /// @return Found record or nullptr
    virtual std::unique_ptr<T> findById(const std::string& id, std::error_code& ec) = 0;

    /// @brief Check if record exists by ID
    /// @param ec Error code set on failure
    virtual bool existsById(const std::string& id, std::error_code& ec) = 0;

    /// @brief Replace the stored contents with exactly @p records, in order
    /// @param ec Error code set on failure
    /// @return true on success
    virtual bool replaceAll(const std::vector<T>& records, std::error_code& ec) = 0;
};

} // namespace SkuMaster
