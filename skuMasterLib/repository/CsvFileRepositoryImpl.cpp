#include <skumaster/repository/CsvFileRepositoryImpl.hpp>
#include <skumaster/util/FileLockGuard.hpp>
#include <skumaster/util/csvFormatUtil.hpp>

#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace SkuMaster {

namespace fs = std::filesystem;

namespace {

std::error_code lastError() { return std::error_code(errno, std::generic_category()); }

bool writeAll(int fd, const std::string& data, std::error_code& ec) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

CsvFileRepositoryImpl::CsvFileRepositoryImpl(std::string path) : path_(std::move(path)) {}

std::string CsvFileRepositoryImpl::headerLine() {
    std::vector<std::string> names;
    names.reserve(kProductFieldCount);
    for (const auto& def : kProductFields)
        names.emplace_back(def.name);
    return util::formatRow(names);
}

std::vector<ProductRecord> CsvFileRepositoryImpl::findAll(std::error_code& ec) {
    ec.clear();
    if (!checkAndRefreshCache(ec))
        return {};
    return cache_;
}

std::unique_ptr<ProductRecord> CsvFileRepositoryImpl::findById(const std::string& id,
                                                               std::error_code& ec) {
    ec.clear();
    if (!checkAndRefreshCache(ec))
        return nullptr;

    for (const auto& r : cache_) {
        if (r.id() == id)
            return std::make_unique<ProductRecord>(r);
    }
    return nullptr;
}

bool CsvFileRepositoryImpl::existsById(const std::string& id, std::error_code& ec) {
    ec.clear();
    if (!checkAndRefreshCache(ec))
        return false;

    for (const auto& r : cache_) {
        if (r.id() == id)
            return true;
    }
    return false;
}

bool CsvFileRepositoryImpl::replaceAll(const std::vector<ProductRecord>& records,
                                       std::error_code& ec) {
    ec.clear();
    // 다른 프로그램이 파일을 지우거나 rename으로 교체했다면 열려 있는 fd는 더 이상
    // path_가 가리키는 파일이 아니다. 경로로 다시 열어야 한다.
    if (fd_ && !pathMatchesFd()) {
        fd_.reset();
        invalidateCache();
    }
    if (!ensureOpen(true, ec))
        return false;

    // 파일 내용을 먼저 메모리에서 완성한 뒤 잠금 구간 안에서 한 번에 기록한다.
    std::string content = headerLine();
    std::vector<std::string> cells;
    for (const auto& r : records) {
        cells.clear();
        for (auto& kv : r.toStorageMap())
            cells.push_back(std::move(kv.second));
        content += util::formatRow(cells);
    }

    detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Exclusive, ec);
    if (ec)
        return false;

    if (::ftruncate(fd_.get(), 0) < 0) {
        ec = lastError();
        return false;
    }
    if (::lseek(fd_.get(), 0, SEEK_SET) < 0) {
        ec = lastError();
        return false;
    }

    // 쓰기 도중 실패하면 파일이 부분적으로만 기록될 수 있으므로 캐시는 항상 버린다.
    invalidateCache();
    if (!writeAll(fd_.get(), content, ec))
        return false;
    return sync(ec);
}

bool CsvFileRepositoryImpl::ensureOpen(bool create, std::error_code& ec) {
    ec.clear();
    if (fd_) {
        if (!create || writable_)
            return true;
        // 읽기 전용으로 열려 있던 fd는 쓰기 모드로 다시 연다.
        fd_.reset();
    }

    if (create) {
        fs::path dir = fs::path(path_).parent_path();
        if (!dir.empty()) {
            std::error_code fec;
            if (!fs::exists(dir, fec)) {
                fs::create_directories(dir, fec);
                if (fec) {
                    ec = fec;
                    return false;
                }
            }
        }

        fd_.reset(::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644));
        if (!fd_) {
            ec = lastError();
            return false;
        }
        writable_ = true;
        return true;
    }

    fd_.reset(::open(path_.c_str(), O_RDWR | O_CLOEXEC));
    if (fd_) {
        writable_ = true;
        return true;
    }
    if (errno == ENOENT)
        return false;
    if (errno != EACCES && errno != EROFS) {
        ec = lastError();
        return false;
    }

    fd_.reset(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd_) {
        if (errno == ENOENT)
            return false;
        ec = lastError();
        return false;
    }
    writable_ = false;
    return true;
}

bool CsvFileRepositoryImpl::checkAndRefreshCache(std::error_code& ec) {
    struct stat st{};
    // path로 stat 호출 - rename으로 교체된 파일도 감지하기 위함
    if (::stat(path_.c_str(), &st) < 0) {
        if (errno != ENOENT) {
            ec = lastError();
            return false;
        }
        // 파일이 없으면 빈 테이블로 취급한다.
        fd_.reset();
        cache_.clear();
        cacheValid_ = true;
        lastMtime_ = {};
        lastSize_ = -1;
        return true;
    }

    if (!sameStats(st)) {
        invalidateCache();
        fd_.reset();
    }

    if (!cacheValid_)
        return loadAllToCache(ec);
    return true;
}

bool CsvFileRepositoryImpl::pathMatchesFd() const {
    struct stat byPath{};
    struct stat byFd{};
    if (::stat(path_.c_str(), &byPath) < 0 || ::fstat(fd_.get(), &byFd) < 0)
        return false;
    return byPath.st_dev == byFd.st_dev && byPath.st_ino == byFd.st_ino;
}

bool CsvFileRepositoryImpl::sameStats(const struct stat& st) const {
    return st.st_size == lastSize_ && st.st_mtim.tv_sec == lastMtime_.tv_sec &&
           st.st_mtim.tv_nsec == lastMtime_.tv_nsec;
}

void CsvFileRepositoryImpl::updateFileStats() {
    struct stat st{};
    int rc = fd_ ? ::fstat(fd_.get(), &st) : ::stat(path_.c_str(), &st);
    if (rc == 0) {
        lastMtime_ = st.st_mtim;
        lastSize_ = st.st_size;
    }
}

bool CsvFileRepositoryImpl::loadAllToCache(std::error_code& ec) {
    cache_.clear();
    cacheValid_ = false;

    if (!ensureOpen(false, ec)) {
        if (ec)
            return false;
        // stat 이후 파일이 삭제된 경우
        cacheValid_ = true;
        return true;
    }

    detail::FileLockGuard lock(fd_.get(), detail::FileLockGuard::Mode::Shared, ec);
    if (ec)
        return false;

    if (::lseek(fd_.get(), 0, SEEK_SET) < 0) {
        ec = lastError();
        return false;
    }

    std::string text;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd_.get(), buf, sizeof(buf));
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        text.append(buf, static_cast<size_t>(n));
    }
    // 읽은 내용과 같은 시점의 stat을 기록해야 다음 비교에서 오탐이 없다.
    updateFileStats();

    std::vector<std::vector<std::string>> rows;
    if (!util::parseDocument(text, rows, ec))
        return false;

    // 첫 행은 헤더다. 셀은 위치가 아니라 헤더 이름으로 필드에 대응시킨다.
    // 알 수 없는 열은 무시되고, 짧은 행의 빠진 셀은 빈 문자열이 된다.
    if (!rows.empty()) {
        const std::vector<std::string>& header = rows.front();
        cache_.reserve(rows.size() - 1);
        for (size_t i = 1; i < rows.size(); ++i) {
            const auto& row = rows[i];
            FieldMap raw;
            for (size_t c = 0; c < header.size(); ++c)
                raw[header[c]] = c < row.size() ? row[c] : std::string();
            cache_.push_back(ProductRecord::fromFields(raw));
        }
    }

    cacheValid_ = true;
    return true;
}

void CsvFileRepositoryImpl::invalidateCache() {
    cache_.clear();
    cacheValid_ = false;
}

bool CsvFileRepositoryImpl::sync(std::error_code& ec) {
    // fsync 성공 후 stat을 갱신해 다음 checkAndRefreshCache에서 false positive가 나지 않게 한다.
    if (::fsync(fd_.get()) < 0) {
        ec = lastError();
        return false;
    }
    updateFileStats();
    return true;
}

} // namespace SkuMaster
