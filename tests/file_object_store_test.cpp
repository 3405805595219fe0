#include <gtest/gtest.h>
#include <unistd.h>

#include "dataset.hpp"
#include "errors.hpp"
#include "file_object_store.hpp"
#include "test_support.hpp"

using namespace cog_converter;
using cog_converter::testing::read_file_bytes;
using cog_converter::testing::TempDir;
using cog_converter::testing::TestImage;
using cog_converter::testing::write_test_geotiff;
using cog_converter::testing::write_file_bytes;

namespace fs = std::filesystem;

class FileObjectStoreTest : public ::testing::Test {
   protected:
    void SetUp() override {
        fs::create_directories(dir_ / "store" / "source");
        fs::create_directories(dir_ / "store" / "target");
        write_file_bytes(dir_ / "store" / "source" / "a" / "b.tif", "0123456789");
    }

    TempDir dir_;
    FilesystemObjectStore store_{dir_ / "store"};
};

TEST_F(FileObjectStoreTest, ExistsReportsPresence) {
    std::error_code ec;
    EXPECT_TRUE(store_.exists("source", "a/b.tif", ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(store_.exists("source", "a/missing.tif", ec));
    EXPECT_FALSE(ec);
}

TEST_F(FileObjectStoreTest, ExistsOnMissingBucketIsError) {
    std::error_code ec;
    EXPECT_FALSE(store_.exists("nobucket", "a/b.tif", ec));
    EXPECT_EQ(ec, CogErrc::not_found);
}

TEST_F(FileObjectStoreTest, RejectsEscapingKeys) {
    std::error_code ec;
    EXPECT_FALSE(store_.exists("source", "../target/x.tif", ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);

    ec.clear();
    EXPECT_FALSE(store_.exists("source", "/etc/passwd", ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);

    ec.clear();
    EXPECT_FALSE(store_.exists("a/b", "c.tif", ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
}

TEST_F(FileObjectStoreTest, CopyIsVisibleAtDestination) {
    std::error_code ec;
    ASSERT_TRUE(store_.copy("source", "a/b.tif", "target", "a/b.tif", ec)) << ec.message();
    EXPECT_TRUE(store_.exists("target", "a/b.tif", ec));
    EXPECT_EQ(read_file_bytes(dir_ / "store" / "target" / "a" / "b.tif"),
              read_file_bytes(dir_ / "store" / "source" / "a" / "b.tif"));

    // 一時ファイルが残っていない
    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir_ / "store" / "target" / "a")) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileObjectStoreTest, CopyOfMissingObjectIsNotFound) {
    std::error_code ec;
    EXPECT_FALSE(store_.copy("source", "none.tif", "target", "none.tif", ec));
    EXPECT_EQ(ec, CogErrc::not_found);
}

TEST_F(FileObjectStoreTest, DownloadAndUpload) {
    std::error_code ec;
    const auto local = dir_ / "local.tif";
    ASSERT_TRUE(store_.download("source", "a/b.tif", local, ec)) << ec.message();
    EXPECT_EQ(read_file_bytes(local).size(), 10u);

    ASSERT_TRUE(store_.upload("target", "out/c.tif", local, ec)) << ec.message();
    EXPECT_TRUE(store_.exists("target", "out/c.tif", ec));
}

TEST_F(FileObjectStoreTest, DownloadOfMissingObjectIsNotFound) {
    std::error_code ec;
    EXPECT_FALSE(store_.download("source", "missing.tif", dir_ / "x.tif", ec));
    EXPECT_EQ(ec, CogErrc::not_found);
}

TEST_F(FileObjectStoreTest, UploadToMissingBucketFails) {
    std::error_code ec;
    write_file_bytes(dir_ / "local.tif", "x");
    EXPECT_FALSE(store_.upload("nobucket", "c.tif", dir_ / "local.tif", ec));
    EXPECT_TRUE(ec);
}

TEST_F(FileObjectStoreTest, RemoteStreamOpensRasterInPlace) {
    TestImage image;
    image.width = 40;
    image.height = 24;
    ASSERT_TRUE(write_test_geotiff(dir_ / "store" / "source" / "scene.tif", image));

    std::error_code ec;
    const auto url = store_.object_url("source", "scene.tif");
    EXPECT_EQ(url.rfind("file://", 0), 0u);

    auto dataset = store_.open_remote_stream(url, ec);
    ASSERT_TRUE(dataset) << ec.message();
    EXPECT_EQ(dataset->width(), 40u);
    EXPECT_EQ(dataset->height(), 24u);
    EXPECT_EQ(dataset->georeference().epsg, 2056);
}

TEST_F(FileObjectStoreTest, RemoteStreamOfNonRasterIsInvalidInput) {
    std::error_code ec;
    EXPECT_EQ(store_.open_remote_stream(store_.object_url("source", "a/b.tif"), ec), nullptr);
    EXPECT_EQ(ec, CogErrc::invalid_input);
}

TEST_F(FileObjectStoreTest, RemoteStreamOfMissingObjectIsNotFound) {
    std::error_code ec;
    EXPECT_EQ(store_.open_remote_stream(store_.object_url("source", "none.tif"), ec), nullptr);
    EXPECT_EQ(ec, CogErrc::not_found);

    ec.clear();
    EXPECT_EQ(store_.open_remote_stream("s3://bucket/key", ec), nullptr);
    EXPECT_EQ(ec, CogErrc::invalid_input);
}

TEST_F(FileObjectStoreTest, UnreadableObjectIsAccessDenied) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "rootではパーミッションを確認できない";
    }
    const auto path = dir_ / "store" / "source" / "a" / "b.tif";
    fs::permissions(path, fs::perms::none);

    std::error_code ec;
    EXPECT_EQ(store_.open_remote_stream(store_.object_url("source", "a/b.tif"), ec), nullptr);
    EXPECT_EQ(ec, CogErrc::access_denied);

    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(FileObjectStoreTest, EnsureBucketAndPublicPolicy) {
    std::error_code ec;
    ASSERT_TRUE(store_.ensure_bucket("fresh", ec)) << ec.message();
    EXPECT_TRUE(fs::is_directory(dir_ / "store" / "fresh"));

    write_file_bytes(dir_ / "store" / "fresh" / "x" / "y.tif", "y");
    fs::permissions(dir_ / "store" / "fresh" / "x" / "y.tif",
                    fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_TRUE(store_.set_public_read_policy("fresh", ec)) << ec.message();
    const auto perms = fs::status(dir_ / "store" / "fresh" / "x" / "y.tif").permissions();
    EXPECT_NE(perms & fs::perms::others_read, fs::perms::none);
    EXPECT_NE(perms & fs::perms::group_read, fs::perms::none);
}

TEST_F(FileObjectStoreTest, PublicPolicyOnMissingBucketFails) {
    std::error_code ec;
    EXPECT_FALSE(store_.set_public_read_policy("nobucket", ec));
    EXPECT_EQ(ec, CogErrc::not_found);
}

TEST_F(FileObjectStoreTest, CorsAllowAllIsWrittenPerBucket) {
    std::error_code ec;
    ASSERT_TRUE(store_.set_cors_allow_all("target", ec)) << ec.message();

    const auto bytes = read_file_bytes(dir_ / "store" / ".cors" / "target.xml");
    const std::string xml(bytes.begin(), bytes.end());
    EXPECT_NE(xml.find("<AllowedOrigin>*</AllowedOrigin>"), std::string::npos);
    EXPECT_NE(xml.find("<AllowedMethod>GET</AllowedMethod>"), std::string::npos);

    // 再実行しても同じ設定になる
    ASSERT_TRUE(store_.set_cors_allow_all("target", ec)) << ec.message();
    EXPECT_EQ(read_file_bytes(dir_ / "store" / ".cors" / "target.xml"), bytes);
}

TEST_F(FileObjectStoreTest, CorsOnMissingBucketFails) {
    std::error_code ec;
    EXPECT_FALSE(store_.set_cors_allow_all("nobucket", ec));
    EXPECT_EQ(ec, CogErrc::not_found);

    ec.clear();
    EXPECT_FALSE(store_.set_cors_allow_all(".cors", ec));
    EXPECT_EQ(ec, CogErrc::invalid_input);
}
