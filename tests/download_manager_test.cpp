#include "parafetch/download_manager.hpp"

#include "parafetch/errors.hpp"
#include "support/temp_dir.hpp"
#include "support/test_http_server.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace parafetch {
namespace {

using namespace std::chrono_literals;
using testing::readFile;
using testing::TempDir;
using testing::TestHttpServer;
using testing::TestRequest;
using testing::TestResponse;

class StatusRecorder : public TransferObserver {
public:
    void onProgress(const std::string&, std::uint64_t, std::optional<std::uint64_t>) override {}

    void onStatus(const std::string& filename, TransferStatus status, const std::string& info) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls[filename];
        statuses[filename] = status;
        infos[filename] = info;
    }

    std::mutex mutex;
    std::map<std::string, int> calls;
    std::map<std::string, TransferStatus> statuses;
    std::map<std::string, std::string> infos;
};

class CountingTransport final : public HttpTransport {
public:
    HttpResponse perform(const HttpRequest& request, ResponseHandler& handler) override {
        ++calls;
        return inner.perform(request, handler);
    }

    CurlTransport inner;
    std::atomic<int> calls{0};
};

TestResponse staticFiles(const TestRequest& request) {
    static const std::map<std::string, std::string> files = {
        {"/hello.txt", "hello world"},
        {"/a.txt", "A"},
        {"/b.txt", "BB"},
        {"/a/file.txt", "first"},
        {"/b/file.txt", "second"},
    };

    TestResponse response;
    const auto it = files.find(request.target);
    if (it == files.end()) {
        response.status = 404;
        response.body = "not found";
        return response;
    }
    response.headers.emplace_back("Content-Type", "text/plain");
    response.body = it->second;
    return response;
}

class DownloadManagerTest : public ::testing::Test {
protected:
    FetchConfig config(std::size_t max_concurrent = 2) const {
        FetchConfig result;
        result.max_concurrent = max_concurrent;
        result.chunk_size = 1024;
        result.download_dir = dir_.path() / "downloads";
        result.max_retries = 0;
        result.backoff_base = std::chrono::duration<double>(0.0);
        result.request_timeout = 5s;
        return result;
    }

    TempDir dir_;
};

TEST_F(DownloadManagerTest, DownloadsSingleFile) {
    TestHttpServer server(&staticFiles);
    DownloadManager manager(config(1));

    const auto summary = manager.run(std::vector<std::string>{server.url("/hello.txt")});

    EXPECT_EQ(summary.successful, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(readFile(dir_.path() / "downloads" / "hello.txt"), "hello world");
}

TEST_F(DownloadManagerTest, MixedBatchCountsEveryResource) {
    TestHttpServer server(&staticFiles);
    StatusRecorder recorder;
    DownloadManager manager(config(2));

    const std::vector<std::string> urls = {
        server.url("/a.txt"),
        server.url("/notfound.txt"),
        server.url("/b.txt"),
        "http://127.0.0.1:1/unreachable.bin",
    };
    const auto summary = manager.run(urls, &recorder);

    EXPECT_EQ(summary.successful + summary.failed, urls.size());
    EXPECT_EQ(summary.successful, 2u);
    EXPECT_EQ(summary.failed, 2u);

    ASSERT_EQ(summary.outcomes.size(), urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i) {
        const auto& outcome = summary.outcomes[i];
        EXPECT_EQ(outcome.url, urls[i]);
        EXPECT_EQ(std::filesystem::exists(dir_.path() / "downloads" / outcome.filename), outcome.succeeded())
            << outcome.filename;
    }

    for (const auto& name : {"a.txt", "notfound.txt", "b.txt", "unreachable.bin"}) {
        EXPECT_EQ(recorder.calls[name], 1) << name;
    }
    EXPECT_EQ(recorder.statuses["a.txt"], TransferStatus::Completed);
    EXPECT_EQ(recorder.infos["a.txt"], (dir_.path() / "downloads" / "a.txt").string());
    EXPECT_EQ(recorder.statuses["notfound.txt"], TransferStatus::Failed);
    EXPECT_NE(recorder.infos["notfound.txt"].find("404"), std::string::npos);
    EXPECT_EQ(recorder.statuses["unreachable.bin"], TransferStatus::Failed);
}

TEST_F(DownloadManagerTest, NeverExceedsConcurrencyLimit) {
    constexpr std::size_t kLimit = 2;
    TestHttpServer server([](const TestRequest& request) {
        TestResponse response;
        response.body = request.target;
        response.delay = 150ms;
        return response;
    });

    std::vector<std::string> urls;
    for (int i = 0; i < 6; ++i) {
        urls.push_back(server.url("/slow" + std::to_string(i)));
    }

    DownloadManager manager(config(kLimit));
    const auto summary = manager.run(urls);

    EXPECT_EQ(summary.successful, urls.size());
    EXPECT_EQ(server.requestCount(), urls.size());
    EXPECT_LE(server.maxInFlight(), kLimit);
    EXPECT_GE(server.maxInFlight(), 1u);
}

TEST_F(DownloadManagerTest, SharesOneTransportAcrossTheRun) {
    TestHttpServer server(&staticFiles);
    auto transport = std::make_shared<CountingTransport>();
    DownloadManager manager(config(3), transport);

    const auto summary = manager.run(std::vector<std::string>{
        server.url("/a.txt"), server.url("/b.txt"), server.url("/hello.txt")});

    EXPECT_EQ(summary.successful, 3u);
    EXPECT_EQ(transport->calls, 3);
}

TEST_F(DownloadManagerTest, UsesExplicitFilenames) {
    TestHttpServer server(&staticFiles);
    DownloadManager manager(config(1));

    const auto summary = manager.run(std::vector<ResourceRequest>{{server.url("/a.txt"), std::string("renamed.txt")}});

    ASSERT_EQ(summary.successful, 1u);
    EXPECT_EQ(readFile(dir_.path() / "downloads" / "renamed.txt"), "A");
}

TEST_F(DownloadManagerTest, CreatesMissingDownloadDirectory) {
    TestHttpServer server(&staticFiles);
    auto cfg = config(1);
    cfg.download_dir = dir_.path() / "nested" / "deeper";
    DownloadManager manager(cfg);

    const auto summary = manager.run(std::vector<std::string>{server.url("/a.txt")});

    EXPECT_EQ(summary.successful, 1u);
    EXPECT_TRUE(std::filesystem::is_directory(cfg.download_dir));
}

TEST_F(DownloadManagerTest, UnusableDirectoryFailsBeforeAnyRequest) {
    TestHttpServer server(&staticFiles);
    auto cfg = config(1);
    cfg.download_dir = dir_.path() / "occupied";
    testing::writeFile(cfg.download_dir, "a regular file");
    DownloadManager manager(cfg);

    EXPECT_THROW(manager.run(std::vector<std::string>{server.url("/a.txt")}), ConfigError);
    EXPECT_EQ(server.requestCount(), 0u);
}

TEST_F(DownloadManagerTest, InvalidConfigurationFailsFast) {
    auto cfg = config(1);
    cfg.max_concurrent = 0;
    DownloadManager manager(cfg);
    EXPECT_EQ(manager.config().max_concurrent, 0u);
    EXPECT_EQ(manager.config().download_dir.string(), cfg.download_dir.string());

    EXPECT_THROW(manager.run(std::vector<std::string>{"http://127.0.0.1:1/x"}), ConfigError);
}

TEST_F(DownloadManagerTest, TraversalInUrlStaysInsideDirectory) {
    TestHttpServer server([](const TestRequest&) {
        TestResponse response;
        response.body = "data";
        return response;
    });
    DownloadManager manager(config(1));

    const auto summary = manager.run(std::vector<std::string>{server.url("/..%2F..%2Fetc%2Fpasswd")});

    ASSERT_EQ(summary.successful, 1u);
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path() / "downloads")) {
        files.push_back(entry.path());
    }
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].parent_path().string(), (dir_.path() / "downloads").string());
    EXPECT_EQ(files[0].filename().string().find('/'), std::string::npos);
}

// Two URLs with the same last segment share one local file; nothing
// disambiguates them. With the server ignoring ranges the second transfer
// overwrites the first.
TEST_F(DownloadManagerTest, SameBasenameCollidesOnOneFile) {
    TestHttpServer server(&staticFiles);
    DownloadManager manager(config(1));

    const auto summary = manager.run(std::vector<std::string>{server.url("/a/file.txt"), server.url("/b/file.txt")});

    EXPECT_EQ(summary.successful, 2u);
    EXPECT_EQ(summary.outcomes[0].path.string(), summary.outcomes[1].path.string());
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir_.path() / "downloads")) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(readFile(dir_.path() / "downloads" / "file.txt"), "second");
}

} // namespace
} // namespace parafetch
