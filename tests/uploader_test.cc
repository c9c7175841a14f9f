#include "support/test_http_server.h"
#include "support/test_util.h"
#include <core/model/transfer_error.h>
#include <core/transfer/uploader.h>
#include <gtest/gtest.h>

using namespace streamfetch::core;
using namespace streamfetch::test;

namespace {

std::string BoundaryOf(const RecordedRequest& request) {
    auto content_type = request.header("content-type");
    auto pos = content_type.find("boundary=");
    return pos == std::string::npos ? std::string() : content_type.substr(pos + 9);
}

// Content of the part carrying a filename
std::string FilePart(const RecordedRequest& request) {
    const auto& body = request.body;
    auto header = body.find("filename=");
    if (header == std::string::npos) {
        return {};
    }
    auto start = body.find("\r\n\r\n", header) + 4;
    auto end = body.rfind("\r\n--" + BoundaryOf(request) + "--\r\n");
    return body.substr(start, end - start);
}

} // namespace

class UploaderTest : public ::testing::Test {
protected:
    UploaderTest()
        : server_(ioc_) {}

    void SetUp() override {
        server_.Start();
        server_.AddRoute("/upload", http::verb::post, [](const StringRequest& req) {
            return TestHttpServer::Status(req, http::status::created, "created");
        });
    }

    UploadResult Upload(const std::filesystem::path& file,
                        const FormFields& fields = {},
                        const std::string& path = "/upload",
                        ProgressSink* sink = nullptr,
                        CancellationToken cancel = {}) {
        Uploader uploader(client_);
        return RunAwaitable(ioc_,
                            uploader.Upload(server_.Url(path),
                                            file,
                                            "file",
                                            fields,
                                            options_,
                                            sink ? sink : &sink_,
                                            cancel));
    }

    net::io_context ioc_;
    TestHttpServer server_;
    HttpClient client_;
    TempDir dir_;
    RecordingSink sink_;
    TransferOptions options_;
};

TEST_F(UploaderTest, SendsFieldsAndStreamsFile) {
    auto content = MakePayload(300 * 1024, 5);
    auto file = dir_ / "report.pdf";
    WriteFile(file, content);
    options_.buffer_size = 32 * 1024;

    auto result = Upload(file, {{"kind", "report"}, {"note", "two words"}});

    EXPECT_EQ(result.status_code, 201u);
    EXPECT_EQ(result.body, "created");

    ASSERT_EQ(server_.requests().size(), 1u);
    const auto& request = server_.requests()[0];
    EXPECT_EQ(request.method, http::verb::post);
    EXPECT_EQ(request.header("content-length"), std::to_string(request.body.size()));
    EXPECT_EQ(request.header("user-agent"), transfer::kDefaultUserAgent);

    auto boundary = BoundaryOf(request);
    ASSERT_FALSE(boundary.empty());
    EXPECT_EQ(request.body.rfind("--" + boundary + "\r\n", 0), 0u);
    EXPECT_NE(request.body.find("Content-Disposition: form-data; name=\"kind\"\r\n\r\nreport\r\n"),
              std::string::npos);
    EXPECT_NE(request.body.find("name=\"note\"\r\n\r\ntwo words\r\n"), std::string::npos);
    EXPECT_NE(request.body.find("Content-Disposition: form-data; name=\"file\"; "
                                "filename=\"report.pdf\"\r\n"),
              std::string::npos);
    EXPECT_NE(request.body.find("Content-Type: application/octet-stream\r\n"), std::string::npos);
    EXPECT_EQ(FilePart(request), content);

    ASSERT_GE(sink_.snapshots.size(), 2u);
    EXPECT_EQ(sink_.snapshots.front().bytes_transferred, 0u);
    EXPECT_EQ(sink_.snapshots.back().state, TransferState::kCompleted);
    EXPECT_EQ(sink_.snapshots.back().bytes_transferred, content.size());
    EXPECT_EQ(*sink_.snapshots.back().total_bytes, content.size());
    for (std::size_t i = 1; i < sink_.snapshots.size(); ++i) {
        EXPECT_GE(sink_.snapshots[i].bytes_transferred, sink_.snapshots[i - 1].bytes_transferred);
        EXPECT_EQ(*sink_.snapshots[i].total_bytes, content.size());
    }
}

TEST_F(UploaderTest, FilePartLengthEqualsFileSize) {
    auto content = MakePayload(12345, 9);
    auto file = dir_ / "data.bin";
    WriteFile(file, content);

    Upload(file);

    ASSERT_EQ(server_.requests().size(), 1u);
    EXPECT_EQ(FilePart(server_.requests()[0]).size(), content.size());
    EXPECT_EQ(sink_.snapshots.back().bytes_transferred, content.size());
    EXPECT_EQ(*sink_.snapshots.back().total_bytes, content.size());
}

TEST_F(UploaderTest, EmptyFileUploads) {
    auto file = dir_ / "empty.bin";
    WriteFile(file, "");

    auto result = Upload(file);

    EXPECT_EQ(result.status_code, 201u);
    EXPECT_TRUE(FilePart(server_.requests()[0]).empty());
    ASSERT_EQ(sink_.snapshots.size(), 2u);
    EXPECT_EQ(sink_.snapshots.back().state, TransferState::kCompleted);
}

TEST_F(UploaderTest, FilenameIsEscaped) {
    auto file = dir_ / "we\"ird.txt";
    WriteFile(file, "x");

    Upload(file);

    EXPECT_NE(server_.requests()[0].body.find("filename=\"we%22ird.txt\""), std::string::npos);
}

TEST_F(UploaderTest, ErrorStatusCarriesBody) {
    server_.AddRoute("/reject", http::verb::post, [](const StringRequest& req) {
        return TestHttpServer::Status(req, http::status::payload_too_large, "too large");
    });
    auto file = dir_ / "big.bin";
    WriteFile(file, MakePayload(4096));

    try {
        Upload(file, {}, "/reject");
        FAIL() << "Upload did not fail";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::kHttpStatus);
        EXPECT_EQ(e.http_status(), 413u);
        EXPECT_EQ(e.body(), "too large");
    }
    ASSERT_FALSE(sink_.snapshots.empty());
    EXPECT_EQ(sink_.snapshots.back().state, TransferState::kFailed);
    EXPECT_EQ(sink_.snapshots.back().bytes_transferred, 4096u);
}

TEST_F(UploaderTest, MissingSourceIsNotFound) {
    try {
        Upload(dir_ / "nope.bin");
        FAIL() << "Upload did not fail";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::kNotFound);
    }
    EXPECT_TRUE(server_.requests().empty());
    EXPECT_TRUE(sink_.snapshots.empty());
}

TEST_F(UploaderTest, DirectorySourceIsNotFound) {
    try {
        Upload(dir_.path());
        FAIL() << "Upload did not fail";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::kNotFound);
    }
    EXPECT_TRUE(server_.requests().empty());
}

TEST_F(UploaderTest, CancellationStopsBetweenChunks) {
    auto content = MakePayload(1024 * 1024, 2);
    auto file = dir_ / "big.bin";
    WriteFile(file, content);
    options_.buffer_size = 16 * 1024;

    CancellationSource cancel_source;
    std::vector<ProgressSnapshot> snapshots;
    CallbackProgressSink sink([&](const ProgressSnapshot& snapshot) {
        snapshots.push_back(snapshot);
        if (snapshot.bytes_transferred > 0) {
            cancel_source.Cancel();
        }
    });

    try {
        Upload(file, {}, "/upload", &sink, cancel_source.token());
        FAIL() << "Upload was not cancelled";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::kCancelled);
    }

    ASSERT_EQ(snapshots.size(), 3u);
    EXPECT_EQ(snapshots[1].bytes_transferred, 16u * 1024);
    EXPECT_EQ(snapshots.back().state, TransferState::kCancelled);
    EXPECT_EQ(snapshots.back().bytes_transferred, 16u * 1024);
}

TEST_F(UploaderTest, InvalidArgumentsAreRejected) {
    auto file = dir_ / "x.bin";
    WriteFile(file, "x");
    Uploader uploader(client_);

    EXPECT_THROW(RunAwaitable(ioc_, uploader.Upload("", file, "file", {}, options_)),
                 std::invalid_argument);
    EXPECT_THROW(RunAwaitable(ioc_, uploader.Upload(server_.Url("/upload"), file, "", {}, options_)),
                 std::invalid_argument);
    EXPECT_TRUE(server_.requests().empty());
}
