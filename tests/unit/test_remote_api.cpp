#include <gtest/gtest.h>
#include "splatlink/crypto/random.hpp"
#include "splatlink/network/http_client.hpp"
#include "splatlink/network/multipart.hpp"
#include "splatlink/network/remote_api.hpp"
#include "splatlink/transfer/chunk_transfer_info.hpp"

using namespace splatlink::network;
using splatlink::core::ErrorCode;
using splatlink::transfer::ChunkTransferInfo;

class RemoteApiTest : public ::testing::Test {};

TEST_F(RemoteApiTest, EndpointUrls) {
    EXPECT_EQ(api::predict_url("http://gpu:8000"), "http://gpu:8000/api/predict");
    EXPECT_EQ(api::predict_url("http://gpu:8000//"), "http://gpu:8000/api/predict");
    EXPECT_EQ(api::download_info_url("http://gpu:8000/base/", "abc"), "http://gpu:8000/base/api/download_info/abc");
    EXPECT_EQ(api::download_chunk_url("http://gpu:8000", "abc", 17), "http://gpu:8000/api/download_chunk/abc/17");
    EXPECT_EQ(api::download_chunk_url("http://gpu:8000", "a/b c", 0), "http://gpu:8000/api/download_chunk/a%2Fb%20c/0");
}

TEST_F(RemoteApiTest, ParseJobId) {
    std::string job_id;

    ASSERT_TRUE(api::parse_job_id(R"({"job_id": "5e1f", "queued": true})", job_id).success());
    EXPECT_EQ(job_id, "5e1f");
}

TEST_F(RemoteApiTest, ParseJobIdRejectsBadBodies) {
    for (const std::string body : {"", "{", R"({"id":"x"})", R"({"job_id":42})", R"({"job_id":""})", R"("job")"}) {
        std::string job_id = "unchanged";
        auto result = api::parse_job_id(body, job_id);
        EXPECT_EQ(result.error, ErrorCode::PROTOCOL_ERROR) << body;
    }
}

TEST_F(RemoteApiTest, ChunkTransferInfoFromJson) {
    ChunkTransferInfo info;
    auto result = ChunkTransferInfo::from_json(
        R"({"file_size": 10485760, "chunk_size": 1048576, "num_chunks": 10, "filename": "gaussians.ply"})", info);

    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(info.total_size, 10485760u);
    EXPECT_EQ(info.chunk_size, 1048576u);
    EXPECT_EQ(info.chunk_count, 10u);
    EXPECT_EQ(info.filename, "gaussians.ply");
}

TEST_F(RemoteApiTest, ChunkTransferInfoTrustsReportedCount) {
    ChunkTransferInfo info;
    auto result = ChunkTransferInfo::from_json(
        R"({"file_size": 100, "chunk_size": 10, "num_chunks": 3, "filename": "odd.ply"})", info);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(info.chunk_count, 3u);
}

TEST_F(RemoteApiTest, ChunkTransferInfoRejectsOversizedCount) {
    ChunkTransferInfo info;
    auto result = ChunkTransferInfo::from_json(
        R"({"file_size": 1, "chunk_size": 1, "num_chunks": 4294967296, "filename": "x.ply"})", info);

    EXPECT_EQ(result.error, ErrorCode::PROTOCOL_ERROR);
}

TEST_F(RemoteApiTest, ChunkTransferInfoRejectsMoreChunksThanBytes) {
    ChunkTransferInfo info;
    EXPECT_EQ(ChunkTransferInfo::from_json(
        R"({"file_size": 3, "chunk_size": 1, "num_chunks": 4, "filename": "x.ply"})", info).error,
        ErrorCode::PROTOCOL_ERROR);

    // One empty chunk for an empty file is accepted
    EXPECT_TRUE(ChunkTransferInfo::from_json(
        R"({"file_size": 0, "chunk_size": 1024, "num_chunks": 1, "filename": "x.ply"})", info).success());
    EXPECT_EQ(info.chunk_count, 1u);
}

TEST_F(RemoteApiTest, ChunkTransferInfoRejectsFloats) {
    ChunkTransferInfo info;
    auto result = ChunkTransferInfo::from_json(
        R"({"file_size": 1.5, "chunk_size": 1, "num_chunks": 1, "filename": "x.ply"})", info);

    EXPECT_EQ(result.error, ErrorCode::PROTOCOL_ERROR);
}

class UrlTest : public ::testing::Test {};

TEST_F(UrlTest, ParsesHostPortAndTarget) {
    auto url = Url::parse("http://192.168.1.20:8000/api/predict");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "192.168.1.20");
    EXPECT_EQ(url->port, "8000");
    EXPECT_EQ(url->target, "/api/predict");
}

TEST_F(UrlTest, DefaultsPortAndTarget) {
    auto url = Url::parse("HTTP://example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/");
}

TEST_F(UrlTest, BracketedIpv6) {
    auto url = Url::parse("http://[::1]:9000/x");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "9000");

    auto no_port = Url::parse("http://[::1]/x");
    ASSERT_TRUE(no_port.has_value());
    EXPECT_EQ(no_port->host, "::1");
    EXPECT_EQ(no_port->port, "80");
}

TEST_F(UrlTest, RejectsUnsupportedUrls) {
    EXPECT_FALSE(Url::parse("https://example.com").has_value());
    EXPECT_FALSE(Url::parse("example.com:8000").has_value());
    EXPECT_FALSE(Url::parse("http://").has_value());
    EXPECT_FALSE(Url::parse("http://host:/x").has_value());
    EXPECT_FALSE(Url::parse("http://host:80a/x").has_value());
}

class MultipartFormTest : public ::testing::Test {};

TEST_F(MultipartFormTest, EncodesSingleFilePart) {
    MultipartForm form("XyZ");
    form.add_file("image", "photo.png", "image/png", {0x89, 'P', 'N', 'G'});

    EXPECT_EQ(form.content_type(), "multipart/form-data; boundary=XyZ");

    std::string expected =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"image\"; filename=\"photo.png\"\r\n"
        "Content-Type: image/png\r\n"
        "\r\n"
        "\x89PNG\r\n"
        "--XyZ--\r\n";
    EXPECT_EQ(form.encode(), expected);
}

TEST_F(MultipartFormTest, KeepsBinaryPayloadIntact) {
    std::vector<std::uint8_t> payload = {0x00, 0x0D, 0x0A, 0xFF, 0x00};
    MultipartForm form("b");
    form.add_file("image", "x.bmp", "image/bmp", payload);

    auto body = form.encode();
    auto start = body.find("\r\n\r\n") + 4;
    EXPECT_EQ(body.substr(start, payload.size()), std::string(payload.begin(), payload.end()));
}

TEST_F(MultipartFormTest, EscapesQuotesAndLineBreaksInFilename) {
    MultipartForm form("b");
    form.add_file("image", "a\"b\r\nX-Injected: 1.jpg", "image/jpeg", {1});

    auto body = form.encode();
    EXPECT_NE(body.find("filename=\"a%22b%0D%0AX-Injected: 1.jpg\"\r\n"), std::string::npos);
    EXPECT_EQ(body.find("\r\nX-Injected"), std::string::npos);
}

TEST_F(MultipartFormTest, RandomBoundaries) {
    ASSERT_TRUE(splatlink::crypto::SecureRandom::initialize());

    MultipartForm first;
    MultipartForm second;

    EXPECT_EQ(first.boundary().rfind("----splatlink", 0), 0u);
    EXPECT_EQ(first.boundary().size(), std::string("----splatlink").size() + 32);
    EXPECT_NE(first.boundary(), second.boundary());
}

TEST_F(MultipartFormTest, ContentTypeFromExtension) {
    EXPECT_EQ(MultipartForm::content_type_for("a.jpg"), "image/jpeg");
    EXPECT_EQ(MultipartForm::content_type_for("a.JPEG"), "image/jpeg");
    EXPECT_EQ(MultipartForm::content_type_for("dir/a.png"), "image/png");
    EXPECT_EQ(MultipartForm::content_type_for("a.bmp"), "image/bmp");
    EXPECT_EQ(MultipartForm::content_type_for("a.webp"), "application/octet-stream");
    EXPECT_EQ(MultipartForm::content_type_for("noext"), "application/octet-stream");
}

TEST_F(MultipartFormTest, HttpResponseHelpers) {
    HttpResponse response;
    response.status = 204;
    EXPECT_TRUE(response.ok());
    response.status = 302;
    EXPECT_FALSE(response.ok());

    response.body = {'o', 'k'};
    EXPECT_EQ(response.body_text(), "ok");
}
