#include <catch2/catch_test_macros.hpp>
#include "files/file_downloader.hpp"
#include "mocks/fake_object_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dbsync;
using namespace dbsync::testing;
using namespace std::chrono_literals;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "dbsync_test_downloads") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
};

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

DetectedFile key_file(const std::string& locator, const std::string& row_id = "7") {
    DetectedFile f;
    f.locator = locator;
    f.table = "documents";
    f.row_id = row_id;
    f.column = "cover_s3_key";
    f.filename = locator.substr(locator.rfind('/') + 1);
    f.file_type = f.filename.substr(f.filename.rfind('.') + 1);
    f.reference_type = FileReferenceType::DIRECT_KEY;
    return f;
}

RetryPolicy fast_retry(int attempts = 3) {
    RetryPolicy r;
    r.max_attempts = attempts;
    r.initial_backoff = 1ms;
    r.max_backoff = 2ms;
    return r;
}

struct Harness {
    TmpDir tmp;
    std::shared_ptr<FakeObjectStore> urls = std::make_shared<FakeObjectStore>("http");
    std::shared_ptr<FakeObjectStore> storage = std::make_shared<FakeObjectStore>("s3:assets");

    FileDownloader make(DownloadStrategy strategy = DownloadStrategy::DIRECT_STORAGE,
                        DownloadPolicy policy = {}) {
        return FileDownloader(tmp.path.string(), std::move(policy), fast_retry(), strategy, urls, storage);
    }
};

} // namespace

TEST_CASE("FileDownloader: strategy names", "[files][download]") {
    CHECK(download_strategy_from_string("presigned_url") == DownloadStrategy::PRESIGNED_URL);
    CHECK(download_strategy_from_string("direct_storage") == DownloadStrategy::DIRECT_STORAGE);
    CHECK_FALSE(download_strategy_from_string("ftp").has_value());
}

TEST_CASE("FileDownloader: local path is <dir>/<table>/<row>/<column>/<filename>", "[files][download]") {
    Harness h;
    auto downloader = h.make();

    auto f = key_file("co/proj/7/cover.png");
    CHECK(downloader.local_path_for(f) ==
          (h.tmp.path / "documents" / "7" / "cover_s3_key" / "cover.png").string());

    f.row_id = "a/b";
    CHECK(downloader.local_path_for(f) ==
          (h.tmp.path / "documents" / "a_b" / "cover_s3_key" / "cover.png").string());

    f.row_id = "7";
    f.column = "attachments_s3_keys";
    f.map_key = "rev/2";
    CHECK(downloader.local_path_for(f) ==
          (h.tmp.path / "documents" / "7" / "attachments_s3_keys" / "rev_2" / "cover.png").string());
}

TEST_CASE("FileDownloader: same-named files of one row keep separate copies", "[files][download]") {
    Harness h;
    h.storage->put("co/a/1/sheet.pdf", "PLAN");
    h.storage->put("co/b/1/sheet.pdf", "REVISION");
    auto downloader = h.make();

    auto plan = key_file("co/a/1/sheet.pdf");
    plan.column = "attachments_s3_keys";
    plan.map_key = "plan";
    plan.reference_type = FileReferenceType::KEY_VALUE_MAP;
    auto rev = plan;
    rev.locator = "co/b/1/sheet.pdf";
    rev.map_key = "rev";

    CHECK(downloader.local_path_for(plan) != downloader.local_path_for(rev));

    const auto a = downloader.download(plan);
    const auto b = downloader.download(rev);
    REQUIRE(a.status == DownloadStatus::SUCCESS);
    REQUIRE(b.status == DownloadStatus::SUCCESS);
    CHECK(*a.local_path != *b.local_path);
    CHECK(read_file(*a.local_path) == "PLAN");
    CHECK(read_file(*b.local_path) == "REVISION");
}

TEST_CASE("FileDownloader: skip policy is checked before fetching", "[files][download]") {
    Harness h;
    DownloadPolicy policy;
    policy.max_file_size = 1024;
    auto downloader = h.make(DownloadStrategy::DIRECT_STORAGE, policy);

    auto unsupported = key_file("co/proj/7/notes.docx");
    CHECK(downloader.skip_reason(unsupported) == "unsupported file type: docx");

    auto no_ext = key_file("co/proj/7/README");
    no_ext.file_type.clear();
    CHECK(downloader.skip_reason(no_ext) == "unsupported file type: <none>");

    auto big = key_file("co/proj/7/scan.tiff");
    big.declared_size = 4096;
    CHECK(downloader.skip_reason(big) == "file too large: 4096 bytes");

    const auto result = downloader.download(unsupported);
    CHECK(result.status == DownloadStatus::SKIPPED);
    CHECK(h.storage->fetch_count() == 0);
}

TEST_CASE("FileDownloader: successful download lands at the local path", "[files][download]") {
    Harness h;
    h.storage->put("co/proj/7/cover.png", "PNGDATA");
    auto downloader = h.make();

    const auto result = downloader.download(key_file("co/proj/7/cover.png"));
    REQUIRE(result.status == DownloadStatus::SUCCESS);
    REQUIRE(result.local_path);
    CHECK(result.bytes == 7);
    CHECK(read_file(*result.local_path) == "PNGDATA");
    CHECK_FALSE(std::filesystem::exists(*result.local_path + ".part"));
}

TEST_CASE("FileDownloader: presigned URL preferred when the strategy says so", "[files][download]") {
    Harness h;
    h.urls->put("https://cdn.example.com/cover.png?sig=1", "FROM-URL");
    h.storage->put("co/proj/7/cover.png", "FROM-S3");

    auto f = key_file("co/proj/7/cover.png");
    f.url = "https://cdn.example.com/cover.png?sig=1";

    auto presigned = h.make(DownloadStrategy::PRESIGNED_URL);
    const auto a = presigned.download(f);
    REQUIRE(a.status == DownloadStatus::SUCCESS);
    CHECK(read_file(*a.local_path) == "FROM-URL");

    auto direct = h.make(DownloadStrategy::DIRECT_STORAGE);
    const auto b = direct.download(f);
    REQUIRE(b.status == DownloadStatus::SUCCESS);
    CHECK(read_file(*b.local_path) == "FROM-S3");
}

TEST_CASE("FileDownloader: signed URL reference needs no storage credentials", "[files][download]") {
    TmpDir tmp;
    auto urls = std::make_shared<FakeObjectStore>("http");
    urls->put("https://cdn.example.com/report.pdf", "%PDF");

    FileDownloader downloader(tmp.path.string(), {}, fast_retry(), DownloadStrategy::DIRECT_STORAGE, urls, nullptr);

    DetectedFile f;
    f.locator = "https://cdn.example.com/report.pdf";
    f.url = f.locator;
    f.table = "documents";
    f.row_id = "1";
    f.column = "download_url";
    f.filename = "report.pdf";
    f.file_type = "pdf";
    f.reference_type = FileReferenceType::SIGNED_URL;

    CHECK(downloader.download(f).status == DownloadStatus::SUCCESS);
}

TEST_CASE("FileDownloader: key without storage or URL fails", "[files][download]") {
    TmpDir tmp;
    FileDownloader downloader(tmp.path.string(), {}, fast_retry(), DownloadStrategy::DIRECT_STORAGE,
                              nullptr, nullptr);

    const auto result = downloader.download(key_file("co/proj/7/cover.png"));
    CHECK(result.status == DownloadStatus::FAILED);
    CHECK(result.reason == "no pre-authorized URL and no storage credentials");
}

TEST_CASE("FileDownloader: missing object fails without retry", "[files][download]") {
    Harness h;
    auto downloader = h.make();

    const auto result = downloader.download(key_file("co/proj/7/gone.pdf"));
    CHECK(result.status == DownloadStatus::FAILED);
    CHECK(result.reason == "not_found: HTTP 404");
    CHECK(h.storage->fetch_count() == 1);
    CHECK_FALSE(std::filesystem::exists(downloader.local_path_for(key_file("co/proj/7/gone.pdf")) + ".part"));
}

TEST_CASE("FileDownloader: transient failures are retried", "[files][download]") {
    Harness h;
    h.storage->put("co/proj/7/cover.png", "PNGDATA");
    h.storage->fail_next("co/proj/7/cover.png", FetchStatus::ERROR, true);
    h.storage->fail_next("co/proj/7/cover.png", FetchStatus::ERROR, true);
    auto downloader = h.make();

    const auto result = downloader.download(key_file("co/proj/7/cover.png"));
    CHECK(result.status == DownloadStatus::SUCCESS);
    CHECK(h.storage->fetch_count() == 3);
}

TEST_CASE("FileDownloader: transient failures beyond the budget fail the file", "[files][download]") {
    Harness h;
    for (int i = 0; i < 3; ++i) {
        h.storage->fail_next("co/proj/7/cover.png", FetchStatus::ERROR, true);
    }
    h.storage->put("co/proj/7/cover.png", "PNGDATA");
    auto downloader = h.make();

    const auto result = downloader.download(key_file("co/proj/7/cover.png"));
    CHECK(result.status == DownloadStatus::FAILED);
    CHECK(result.reason == "error: connection reset");
}

TEST_CASE("FileDownloader: streamed object over the ceiling is skipped", "[files][download]") {
    Harness h;
    DownloadPolicy policy;
    policy.max_file_size = 4;
    h.storage->put("co/proj/7/cover.png", "0123456789");
    auto downloader = h.make(DownloadStrategy::DIRECT_STORAGE, policy);

    const auto result = downloader.download(key_file("co/proj/7/cover.png"));
    CHECK(result.status == DownloadStatus::SKIPPED);
    CHECK(result.reason == "file too large: 10 bytes");
}

TEST_CASE("FileDownloader: stop request skips the file", "[files][download]") {
    Harness h;
    h.storage->put("co/proj/7/cover.png", "PNGDATA");
    auto downloader = h.make();

    std::stop_source stop;
    stop.request_stop();
    const auto result = downloader.download(key_file("co/proj/7/cover.png"), stop.get_token());
    CHECK(result.status == DownloadStatus::SKIPPED);
    CHECK(result.reason == "cancelled");
    CHECK(h.storage->fetch_count() == 0);
}
