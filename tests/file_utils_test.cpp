#include <gtest/gtest.h>
#include <string>

#include <utils/file_utils.hpp>
#include <utils/path_validation.hpp>
#include <utils/request_log.hpp>
#include "test_support.hpp"

using namespace static_server;

TEST(FileUtilsTest, ReadsBinaryContentExactly)
{
    // Embedded NULs and high bytes survive the read unchanged.
    TempDir dir;
    std::string payload("a\0b\xff\r\n", 6);
    auto file = dir.write("blob.bin", payload);
    auto content = file_utils::read_file(file.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, payload);
}

TEST(FileUtilsTest, MissingFilesAndDirectoriesAreAbsent)
{
    // Neither a missing path nor a directory yields content.
    TempDir dir;
    EXPECT_FALSE(file_utils::read_file((dir.path() / "nope.txt").string()).has_value());
    EXPECT_FALSE(file_utils::read_file(dir.path().string()).has_value());
}

TEST(FileUtilsTest, ContentTypesByExtension)
{
    // Known extensions map to their MIME type, everything else is octet-stream.
    EXPECT_STREQ(file_utils::content_type_for("public_html/index.html"), "text/html");
    EXPECT_STREQ(file_utils::content_type_for("a/style.css"), "text/css");
    EXPECT_STREQ(file_utils::content_type_for("a/app.js"), "application/javascript");
    EXPECT_STREQ(file_utils::content_type_for("a/logo.png"), "image/png");
    EXPECT_STREQ(file_utils::content_type_for("a/photo.jpg"), "image/jpeg");
    EXPECT_STREQ(file_utils::content_type_for("a/photo.jpeg"), "image/jpeg");
    EXPECT_STREQ(file_utils::content_type_for("a/anim.gif"), "image/gif");
    EXPECT_STREQ(file_utils::content_type_for("a/icon.svg"), "image/svg+xml");
    EXPECT_STREQ(file_utils::content_type_for("favicon.ico"), "image/x-icon");
    EXPECT_STREQ(file_utils::content_type_for("archive.tar.gz"), "application/octet-stream");
    EXPECT_STREQ(file_utils::content_type_for("README"), "application/octet-stream");
}

TEST(PathValidationTest, RootMapsToIndexDocument)
{
    // "/" resolves to the index page, other paths are appended to the root.
    EXPECT_EQ(path_validation::resolve_request_path("public_html", "/"), "public_html/index.html");
    EXPECT_EQ(path_validation::resolve_request_path("public_html", "/css/site.css"), "public_html/css/site.css");
}

TEST(PathValidationTest, DetectsParentComponentsAnywhere)
{
    // ".." is caught at the start, middle or end, but not inside a name.
    EXPECT_TRUE(path_validation::has_parent_reference("public_html/../secret"));
    EXPECT_TRUE(path_validation::has_parent_reference("public_html/a/b/.."));
    EXPECT_TRUE(path_validation::has_parent_reference("../etc/passwd"));
    EXPECT_TRUE(path_validation::has_parent_reference("public_html/a/../../b"));
    EXPECT_FALSE(path_validation::has_parent_reference("public_html/..hidden"));
    EXPECT_FALSE(path_validation::has_parent_reference("public_html/file..txt"));
    EXPECT_FALSE(path_validation::has_parent_reference("public_html/./index.html"));
}

TEST(RequestLogTest, AppendsOneLinePerRequest)
{
    // Entries accumulate in order with the client and summary.
    TempDir dir;
    auto path = dir.path() / "server.log";
    request_log::RequestLog log(path.string());
    log.log_request("127.0.0.1", "GET /index.html 200");
    log.log_request("10.0.0.2", "GET /style.css 200");

    auto content = file_utils::read_file(path.string());
    ASSERT_TRUE(content.has_value());
    auto first = content->find("127.0.0.1 - GET /index.html 200\n");
    auto second = content->find("10.0.0.2 - GET /style.css 200\n");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_EQ(content->front(), '[');
}

TEST(RequestLogTest, UnwritableLogDoesNotThrow)
{
    // A log path in a missing directory is reported, not raised.
    TempDir dir;
    request_log::RequestLog log((dir.path() / "missing" / "server.log").string());
    EXPECT_NO_THROW(log.log_request("127.0.0.1", "GET / 200"));
}

TEST(RequestLogTest, TimestampHasNanosecondFraction)
{
    // Timestamps read as seconds, a dot, then nine digits.
    auto stamp = request_log::format_timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(12)));
    EXPECT_EQ(stamp, "12.000000000");
}
