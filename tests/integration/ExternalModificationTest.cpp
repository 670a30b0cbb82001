/**
 * @file ExternalModificationTest.cpp
 * @brief Integration tests for picking up edits made to the data file by other programs
 */

#include <cstdio>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unistd.h>

#include <skumaster/repository/CsvFileRepositoryImpl.hpp>

using namespace SkuMaster;

namespace {

ProductRecord makeProduct(const std::string& sku, const std::string& name) {
    ProductRecord p;
    p.status = "Active";
    p.skuCode = sku;
    p.skuName = name;
    return p;
}

std::string csvRow(const ProductRecord& p) {
    std::string row;
    bool first = true;
    for (const auto& kv : p.toStorageMap()) {
        if (!first)
            row += ",";
        row += kv.second;
        first = false;
    }
    return row + "\r\n";
}

} // namespace

class ExternalModificationTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_external_mod.csv";
        ::remove(testFile_.c_str());
        repo_ = std::make_unique<CsvFileRepositoryImpl>(testFile_);
    }

    void TearDown() override {
        repo_.reset();
        ::remove(testFile_.c_str());
        ::remove((testFile_ + ".tmp").c_str());
    }

    std::string testFile_;
    std::error_code ec_;
    std::unique_ptr<CsvFileRepositoryImpl> repo_;
};

TEST_F(ExternalModificationTest, DetectsExternalAppend) {
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));
    ASSERT_EQ(repo_->findAll(ec_).size(), 1u);

    {
        int fd = ::open(testFile_.c_str(), O_WRONLY | O_APPEND);
        ASSERT_GE(fd, 0);
        const std::string row = csvRow(makeProduct("SKU-002", "Serum"));
        ASSERT_EQ(::write(fd, row.data(), row.size()), static_cast<ssize_t>(row.size()));
        ::fsync(fd);
        ::close(fd);
    }
    usleep(10000);

    auto found = repo_->findById("SKU-002", ec_);
    ASSERT_FALSE(ec_);
    ASSERT_NE(found, nullptr) << "External append should be detected";
    EXPECT_EQ(found->skuName, "Serum");
    EXPECT_EQ(repo_->findAll(ec_).size(), 2u);
}

TEST_F(ExternalModificationTest, DetectsReplacementByRename) {
    ASSERT_TRUE(repo_->replaceAll(
        {makeProduct("SKU-001", "Toner"), makeProduct("SKU-002", "Serum")}, ec_));
    ASSERT_TRUE(repo_->existsById("SKU-002", ec_));

    // 다른 프로그램이 임시 파일을 쓰고 rename으로 교체하는 경우
    {
        CsvFileRepositoryImpl writer(testFile_ + ".tmp");
        ASSERT_TRUE(writer.replaceAll({makeProduct("SKU-900", "Replacement")}, ec_));
    }
    ASSERT_EQ(::rename((testFile_ + ".tmp").c_str(), testFile_.c_str()), 0);

    auto all = repo_->findAll(ec_);
    ASSERT_FALSE(ec_);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].skuCode, "SKU-900");
    EXPECT_FALSE(repo_->existsById("SKU-002", ec_));
}

TEST_F(ExternalModificationTest, ExternalDeleteReadsAsEmpty) {
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));
    ASSERT_EQ(repo_->findAll(ec_).size(), 1u);

    ASSERT_EQ(::remove(testFile_.c_str()), 0);

    auto all = repo_->findAll(ec_);
    EXPECT_FALSE(ec_);
    EXPECT_TRUE(all.empty());

    // 다시 저장하면 파일이 새로 만들어진다
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-002", "Serum")}, ec_)) << ec_.message();
    EXPECT_TRUE(repo_->existsById("SKU-002", ec_));
}

TEST_F(ExternalModificationTest, CorruptionAfterLoadReportsError) {
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));
    ASSERT_EQ(repo_->findAll(ec_).size(), 1u);

    {
        std::FILE* f = std::fopen(testFile_.c_str(), "ab");
        ASSERT_NE(f, nullptr);
        std::fputs("\"unterminated,row\r\n", f);
        std::fclose(f);
    }
    usleep(10000);

    auto all = repo_->findAll(ec_);
    EXPECT_TRUE(ec_);
    EXPECT_TRUE(all.empty());
}

TEST_F(ExternalModificationTest, SecondInstanceSeesWrites) {
    CsvFileRepositoryImpl other(testFile_);
    EXPECT_TRUE(other.findAll(ec_).empty());

    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));
    EXPECT_TRUE(other.existsById("SKU-001", ec_));

    ASSERT_TRUE(other.replaceAll({makeProduct("SKU-001", "Toner"),
                                  makeProduct("SKU-002", "Serum"),
                                  makeProduct("SKU-003", "Cleanser")},
                                 ec_));
    EXPECT_EQ(repo_->findAll(ec_).size(), 3u);
}

TEST_F(ExternalModificationTest, SaveAfterExternalDeleteRecreatesFile) {
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));

    ASSERT_EQ(::remove(testFile_.c_str()), 0);

    // 삭제 뒤 읽기 없이 곧바로 저장한다
    ASSERT_TRUE(repo_->replaceAll(
        {makeProduct("SKU-001", "Toner"), makeProduct("SKU-002", "Serum")}, ec_))
        << ec_.message();
    ASSERT_EQ(::access(testFile_.c_str(), F_OK), 0) << "Save should recreate the file";

    CsvFileRepositoryImpl fresh(testFile_);
    auto all = fresh.findAll(ec_);
    ASSERT_FALSE(ec_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].skuCode, "SKU-002");
}

TEST_F(ExternalModificationTest, SaveAfterRenameReplaceWritesToPath) {
    ASSERT_TRUE(repo_->replaceAll({makeProduct("SKU-001", "Toner")}, ec_));

    {
        CsvFileRepositoryImpl writer(testFile_ + ".tmp");
        ASSERT_TRUE(writer.replaceAll({makeProduct("SKU-900", "Replacement")}, ec_));
    }
    ASSERT_EQ(::rename((testFile_ + ".tmp").c_str(), testFile_.c_str()), 0);

    ASSERT_TRUE(repo_->replaceAll(
        {makeProduct("SKU-001", "Toner"), makeProduct("SKU-002", "Serum")}, ec_))
        << ec_.message();

    CsvFileRepositoryImpl fresh(testFile_);
    auto all = fresh.findAll(ec_);
    ASSERT_FALSE(ec_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].skuCode, "SKU-001");
    EXPECT_EQ(all[1].skuCode, "SKU-002");
    EXPECT_EQ(repo_->findAll(ec_).size(), 2u);
}
