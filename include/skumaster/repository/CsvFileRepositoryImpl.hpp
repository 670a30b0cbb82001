#pragma once
/// @file CsvFileRepositoryImpl.hpp
/// @brief CSV file repository for product records

#include "../record/ProductRecord.hpp"
#include "../util/UniqueFd.hpp"

#include "RecordRepository.hpp"

#include <sys/stat.h>
#include <sys/types.h>

namespace SkuMaster {

/// @brief Product records stored as a CSV table (header row + one row per record)
/// @details The file is opened lazily: a missing file reads as an empty table and is
///          created, together with its parent directories, on the first write.
///          Reads are served from a cache that is dropped whenever the file's mtime
///          or size changes, so edits made by other programs are picked up.
///          Reads hold a shared fcntl lock, writes an exclusive one.
/// @note Not thread-safe for a shared instance.
class CsvFileRepositoryImpl : public RecordRepository<ProductRecord> {
  public:
    /// @param path File path for the repository
    explicit CsvFileRepositoryImpl(std::string path);
    ~CsvFileRepositoryImpl() override = default;

    std::vector<ProductRecord> findAll(std::error_code& ec) override;
    std::unique_ptr<ProductRecord> findById(const std::string& id,
                                            std::error_code& ec) override;
    bool existsById(const std::string& id, std::error_code& ec) override;
    bool replaceAll(const std::vector<ProductRecord>& records, std::error_code& ec) override;

    const std::string& path() const { return path_; }

    /// @brief Header row text written at the top of every file
    static std::string headerLine();

  private:
    /// @brief Open the file if it is not open yet
    /// @param create Create the file (and parent directories) when missing
    /// @return false with ec clear when the file is missing and @p create is false
    bool ensureOpen(bool create, std::error_code& ec);
    /// @brief Detect file mtime/size changes and refresh cache
    bool checkAndRefreshCache(std::error_code& ec);
    /// @brief Load all records to cache
    bool loadAllToCache(std::error_code& ec);
    void invalidateCache();
    void updateFileStats();
    bool sameStats(const struct stat& st) const;
    /// @brief True while path_ still names the inode behind fd_
    bool pathMatchesFd() const;
    bool sync(std::error_code& ec);

    std::string path_;
    detail::UniqueFd fd_;
    bool writable_ = false;

    std::vector<ProductRecord> cache_;
    bool cacheValid_ = false;
    struct timespec lastMtime_{};
    off_t lastSize_ = -1;
};

} // namespace SkuMaster
