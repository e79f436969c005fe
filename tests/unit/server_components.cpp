#include <atomic>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "stowage/crypto.hpp"
#include "stowage/server/change_feed.hpp"
#include "stowage/server/chunk_writer.hpp"
#include "stowage/server/claim_coordinator.hpp"
#include "stowage/server/connection_pool.hpp"
#include "stowage/server/record_store.hpp"
#include "stowage/server/upload_service.hpp"

using namespace stowage;
using namespace stowage::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    std::vector<std::byte> pattern_bytes(std::size_t size)
    {
        std::vector<std::byte> bytes(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            bytes[i] = static_cast<std::byte>((i * 31 + 7) & 0xFF);
        }
        return bytes;
    }

    std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream input(path, std::ios::binary);
        std::vector<char> chars((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(chars.size());
        for (std::size_t i = 0; i < chars.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(chars[i]);
        }
        return bytes;
    }

    template <typename Fn>
    std::optional<ErrorCode> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void exec_sql(ConnectionPool &pool, const std::string &sql)
    {
        auto connection = pool.acquire();
        const auto rc = sqlite3_exec(connection.get(), sql.c_str(), nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
    }

    protocol::UploadInitRequest sample_request(const std::vector<std::byte> &content)
    {
        return protocol::UploadInitRequest{
            .file = protocol::FileInfo{
                .name = "scan.bin",
                .hash = crypto::hash_bytes(content),
                .size = content.size(),
            },
            .project = "archive",
            .pipeline = "scans",
            .metadata = protocol::UploadMetadata{.uploader = "jdoe", .items = {"item-1"}},
        };
    }

    void test_chunk_writer_ranges()
    {
        const auto root = fresh_directory("stowage_chunk_ranges");
        const auto content = pattern_bytes(10);
        const std::span<const std::byte> all(content);

        chunk_writer::create(root, "upload-a", content.size());
        assert(std::filesystem::file_size(chunk_writer::file_path(root, "upload-a")) == 10);

        chunk_writer::write_range(root, "upload-a", 10, 6, all.subspan(6));
        chunk_writer::write_range(root, "upload-a", 10, 0, all.subspan(0, 3));
        chunk_writer::write_range(root, "upload-a", 10, 3, all.subspan(3, 3));
        assert(read_file(chunk_writer::file_path(root, "upload-a")) == content);

        const auto overflow = pattern_bytes(4);
        const auto code = error_of([&]
                                   { chunk_writer::write_range(root, "upload-a", 10, 8, overflow); });
        assert(code == ErrorCode::ExceededBounds);
        assert(read_file(chunk_writer::file_path(root, "upload-a")) == content);

        const auto past_end = error_of([&]
                                       { (void)chunk_writer::open_range(root, "upload-a", 10, 11); });
        assert(past_end == ErrorCode::OffsetTooLarge);

        cleanup_path(root);
    }

    void test_chunk_writer_create()
    {
        const auto root = fresh_directory("stowage_chunk_create");

        const auto written = pattern_bytes(64);
        chunk_writer::create(root, "upload-b", written.size());
        chunk_writer::write_range(root, "upload-b", written.size(), 0, written);
        const auto again = error_of([&]
                                    { chunk_writer::create(root, "upload-b", 4096); });
        assert(again == ErrorCode::AlreadyExists);
        assert(read_file(chunk_writer::file_path(root, "upload-b")) == written);

        chunk_writer::create(root, "empty", 0);
        assert(std::filesystem::exists(chunk_writer::file_path(root, "empty")));
        assert(std::filesystem::file_size(chunk_writer::file_path(root, "empty")) == 0);

        const auto bad_id = error_of([&]
                                     { chunk_writer::create(root, "../escape", 1); });
        assert(bad_id == ErrorCode::InvalidPayload);

        chunk_writer::remove(root, "upload-b");
        assert(!std::filesystem::exists(chunk_writer::file_path(root, "upload-b")));

        cleanup_path(root);
    }

    void test_chunk_writer_locks()
    {
        const auto root = fresh_directory("stowage_chunk_locks");
        chunk_writer::create(root, "locked", 8);

        {
            auto first = chunk_writer::open_range(root, "locked", 8, 0);
            auto second = chunk_writer::open_range(root, "locked", 8, 4);
            const auto blocked = error_of([&]
                                          { (void)chunk_writer::exclusive_lock(root, "locked"); });
            assert(blocked == ErrorCode::Locked);
        }

        {
            auto exclusive = chunk_writer::exclusive_lock(root, "locked");
            assert(exclusive.exclusive());
            const auto blocked = error_of([&]
                                          { (void)chunk_writer::open_range(root, "locked", 8, 0); });
            assert(blocked == ErrorCode::Locked);
            const auto second = error_of([&]
                                         { (void)chunk_writer::exclusive_lock(root, "locked"); });
            assert(second == ErrorCode::Locked);
        }

        auto writer = chunk_writer::open_range(root, "locked", 8, 0);
        const auto bytes = pattern_bytes(8);
        writer.write(std::span<const std::byte>(bytes).first(5));
        writer.write(std::span<const std::byte>(bytes).subspan(5));
        assert(writer.bytes_written() == 8);

        const auto missing = error_of([&]
                                      { (void)chunk_writer::open_range(root, "missing", 8, 0); });
        assert(missing == ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_record_store_transitions()
    {
        const auto root = fresh_directory("stowage_record_store");
        ConnectionPool pool(root / "uploads.db", 2);
        ChangeFeed feed;
        RecordStore store(pool, feed);

        const auto content = pattern_bytes(16);
        const auto request = sample_request(content);
        const auto created = store.create("rec-1", request.file, request.project, request.pipeline, request.metadata,
                                          root.string());
        assert(created.status == UploadStatus::Uploading);
        assert(!created.processing);

        const auto loaded = store.get("rec-1");
        assert(loaded.file.hash == request.file.hash);
        assert(loaded.metadata.items == request.metadata.items);
        assert(loaded.storage_location == root.string());

        assert(error_of([&]
                        { (void)store.get("nope"); }) == ErrorCode::NotFound);

        store.transition("rec-1", UploadStatus::Uploading, UploadStatus::Verifying);
        assert(error_of([&]
                        { store.transition("rec-1", UploadStatus::Uploading, UploadStatus::Verifying); }) ==
               ErrorCode::WrongStatus);
        assert(error_of([&]
                        { store.transition("nope", UploadStatus::Uploading, UploadStatus::Verifying); }) ==
               ErrorCode::NotFound);
        assert(error_of([&]
                        { store.set_status_and_release("rec-1", UploadStatus::Uploading); }) ==
               ErrorCode::WrongStatus);

        exec_sql(pool, "UPDATE uploads SET processing = 1 WHERE id = 'rec-1'");
        store.set_status_and_release("rec-1", UploadStatus::Packing);
        const auto released = store.get("rec-1");
        assert(released.status == UploadStatus::Packing);
        assert(!released.processing);

        store.set_status_and_release("rec-1", UploadStatus::Finished);
        assert(error_of([&]
                        { store.set_status_and_release("rec-1", UploadStatus::Deriving); }) ==
               ErrorCode::WrongStatus);
        assert(store.get("rec-1").status == UploadStatus::Finished);
        assert(error_of([&]
                        { store.set_status_and_release("nope", UploadStatus::Deriving); }) == ErrorCode::NotFound);

        exec_sql(pool, "UPDATE uploads SET status = 'SIDEWAYS' WHERE id = 'rec-1'");
        assert(error_of([&]
                        { (void)store.get("rec-1"); }) == ErrorCode::InternalError);

        cleanup_path(root);
    }

    void test_claims()
    {
        const auto root = fresh_directory("stowage_claims");
        ConnectionPool pool(root / "uploads.db", 4);
        ChangeFeed feed;
        RecordStore store(pool, feed);
        ClaimCoordinator claims(pool);

        const auto request = sample_request(pattern_bytes(4));
        store.create("claim-1", request.file, "archive", "scans", request.metadata, root.string());
        store.transition("claim-1", UploadStatus::Uploading, UploadStatus::Verifying);
        store.create("other-pipeline", request.file, "archive", "audio", request.metadata, root.string());
        store.transition("other-pipeline", UploadStatus::Uploading, UploadStatus::Verifying);

        std::atomic<int> granted{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < 8; ++i)
        {
            workers.emplace_back([&]
                                 {
                if (claims.claim("archive", "scans", UploadStatus::Verifying, false)) {
                    ++granted;
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }
        assert(granted.load() == 1);

        const auto record = store.get("claim-1");
        assert(record.processing);
        assert(!claims.claim("archive", "scans", UploadStatus::Verifying, false));

        // A fresh claim is not yet eligible for takeover.
        assert(!claims.claim("archive", "scans", UploadStatus::Verifying, true));
        exec_sql(pool, "UPDATE uploads SET last_activity = 0 WHERE id = 'claim-1'");
        const auto reclaimed = claims.claim("archive", "scans", UploadStatus::Verifying, true);
        assert(reclaimed && reclaimed->id == "claim-1");
        assert(reclaimed->processing);

        const auto unrelated = claims.claim("archive", "audio", UploadStatus::Verifying, false);
        assert(unrelated && unrelated->id == "other-pipeline");
        assert(!claims.claim("archive", "scans", UploadStatus::Pending, false));

        cleanup_path(root);
    }

    void test_change_feed()
    {
        ChangeFeed feed;
        auto subscription = feed.subscribe("feed-1", UploadStatus::Uploading);
        auto other = feed.subscribe("feed-2", UploadStatus::Verifying);
        assert(feed.subscriber_count("feed-1") == 1);

        feed.publish("feed-1", UploadStatus::Verifying);
        feed.publish("feed-1", UploadStatus::Verifying);
        feed.publish("feed-1", UploadStatus::Deriving);
        feed.publish("feed-1", UploadStatus::Finished);

        assert(subscription->next() == UploadStatus::Uploading);
        assert(subscription->next() == UploadStatus::Verifying);
        assert(subscription->next() == UploadStatus::Deriving);
        assert(subscription->next() == UploadStatus::Finished);
        assert(!subscription->try_next());

        assert(other->try_next() == UploadStatus::Verifying);
        assert(!other->try_next());

        std::optional<UploadStatus> delivered;
        bool called = false;
        other->async_next([&](std::optional<UploadStatus> status)
                          {
            called = true;
            delivered = status; });
        assert(!called);
        feed.publish("feed-2", UploadStatus::Packing);
        assert(called && delivered == UploadStatus::Packing);

        called = false;
        other->async_next([&](std::optional<UploadStatus> status)
                          {
            called = true;
            delivered = status; });
        feed.close_all();
        assert(called && !delivered);
        assert(subscription->closed());
        assert(!subscription->next());

        other.reset();
        feed.publish("feed-2", UploadStatus::Finished);
        assert(feed.subscriber_count("feed-2") == 0);
    }

    void test_change_feed_releases_finished_streams()
    {
        ChangeFeed feed;
        for (int i = 0; i < 1000; ++i)
        {
            const auto id = "stream-" + std::to_string(i);
            auto subscription = feed.subscribe(id, UploadStatus::Verifying);
            feed.publish(id, UploadStatus::Finished);
            assert(subscription->next() == UploadStatus::Verifying);
            assert(subscription->next() == UploadStatus::Finished);
            subscription->close();
        }
        assert(feed.watched_uploads() <= 1);

        auto live = feed.subscribe("live", UploadStatus::Uploading);
        auto dropped = feed.subscribe("dropped", UploadStatus::Uploading);
        dropped.reset();
        auto another = feed.subscribe("another", UploadStatus::Uploading);
        assert(feed.watched_uploads() == 2);
        assert(feed.subscriber_count("live") == 1);
    }

    void test_service_end_to_end()
    {
        const auto root = fresh_directory("stowage_service_e2e");
        ConnectionPool pool(root / "uploads.db", 4);
        ChangeFeed feed;
        RecordStore store(pool, feed);
        ClaimCoordinator claims(pool);
        UploadService service(store, claims, root / "files");
        std::filesystem::create_directories(root / "files");

        constexpr std::size_t kMiB = 1024 * 1024;
        const auto content = pattern_bytes(10 * kMiB);
        const std::span<const std::byte> all(content);

        const auto record = service.initialize(sample_request(content));
        assert(record.status == UploadStatus::Uploading);
        auto events = service.watch(record.id);

        service.write_chunk(record.id, 0, all.subspan(0, 4 * kMiB));
        service.write_chunk(record.id, 4 * kMiB, all.subspan(4 * kMiB, 4 * kMiB));
        service.write_chunk(record.id, 8 * kMiB, all.subspan(8 * kMiB));

        service.finish(record.id);
        assert(service.get(record.id).status == UploadStatus::Verifying);
        assert(error_of([&]
                        { service.finish(record.id); }) == ErrorCode::WrongStatus);
        assert(error_of([&]
                        { service.write_chunk(record.id, 0, all.subspan(0, 1)); }) == ErrorCode::WrongStatus);

        const auto claimed = service.claim(protocol::ClaimRequest{
            .project = "archive",
            .pipeline = "scans",
            .status = UploadStatus::Verifying,
            .processing = false,
        });
        assert(claimed && claimed->id == record.id && claimed->processing);
        assert(!service.claim(protocol::ClaimRequest{
            .project = "archive",
            .pipeline = "scans",
            .status = UploadStatus::Verifying,
            .processing = false,
        }));

        const auto stored = chunk_writer::file_path(claimed->storage_location, record.id);
        assert(crypto::hash_file(stored) == record.file.hash);
        service.update_status(record.id, UploadStatus::Finished);

        assert(events->next() == UploadStatus::Uploading);
        assert(events->next() == UploadStatus::Verifying);
        assert(events->next() == UploadStatus::Finished);
        assert(!service.get(record.id).processing);

        cleanup_path(root);
    }

    void test_service_rejections()
    {
        const auto root = fresh_directory("stowage_service_rejections");
        ConnectionPool pool(root / "uploads.db", 2);
        ChangeFeed feed;
        RecordStore store(pool, feed);
        ClaimCoordinator claims(pool);
        UploadService service(store, claims, root);

        const auto content = pattern_bytes(1024);
        const std::span<const std::byte> all(content);
        const auto record = service.initialize(sample_request(content));

        assert(error_of([&]
                        { service.write_chunk(record.id, 2048, all.subspan(0, 16)); }) == ErrorCode::OffsetTooLarge);
        assert(error_of([&]
                        { service.write_chunk(record.id, 1000, all.subspan(0, 100)); }) == ErrorCode::ExceededBounds);
        assert(service.get(record.id).status == UploadStatus::Uploading);

        auto bad_hash = sample_request(content);
        bad_hash.file.hash = "not-a-digest";
        assert(error_of([&]
                        { (void)service.initialize(bad_hash); }) == ErrorCode::InvalidPayload);

        {
            auto writer = service.begin_chunk(record.id, 0);
            assert(error_of([&]
                            { service.finish(record.id); }) == ErrorCode::Locked);
            writer.write(all);
        }
        service.finish(record.id);
        assert(service.get(record.id).status == UploadStatus::Verifying);

        cleanup_path(root);
    }

    void test_initialize_removes_file_when_record_fails()
    {
        const auto root = fresh_directory("stowage_init_compensation");
        ConnectionPool pool(root / "uploads.db", 2);
        ChangeFeed feed;
        RecordStore store(pool, feed);
        ClaimCoordinator claims(pool);
        const auto storage = root / "files";
        std::filesystem::create_directories(storage);
        UploadService service(store, claims, storage);

        exec_sql(pool, "DROP TABLE uploads");
        assert(error_of([&]
                        { (void)service.initialize(sample_request(pattern_bytes(128))); }) == ErrorCode::WriteFailed);
        assert(std::filesystem::is_empty(storage));

        cleanup_path(root);
    }

    void test_abandonment()
    {
        const auto root = fresh_directory("stowage_abandon");
        ConnectionPool pool(root / "uploads.db", 2);
        ChangeFeed feed;
        RecordStore store(pool, feed);
        ClaimCoordinator claims(pool);
        UploadService service(store, claims, root);

        const auto content = pattern_bytes(64);
        const auto idle = service.initialize(sample_request(content));
        const auto active = service.initialize(sample_request(content));
        const auto explicit_one = service.initialize(sample_request(content));

        service.abandon(explicit_one.id);
        assert(service.get(explicit_one.id).status == UploadStatus::Abandoned);
        assert(!std::filesystem::exists(chunk_writer::file_path(root, explicit_one.id)));
        assert(error_of([&]
                        { service.abandon(explicit_one.id); }) == ErrorCode::WrongStatus);

        exec_sql(pool, "UPDATE uploads SET last_activity = 0 WHERE id = '" + idle.id + "'");
        assert(service.abandon_expired(std::chrono::hours(1)) == 1);
        assert(service.get(idle.id).status == UploadStatus::Abandoned);
        assert(service.get(active.id).status == UploadStatus::Uploading);
        assert(std::filesystem::exists(chunk_writer::file_path(root, active.id)));

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_chunk_writer_ranges();
    test_chunk_writer_create();
    test_chunk_writer_locks();
    test_record_store_transitions();
    test_claims();
    test_change_feed();
    test_change_feed_releases_finished_streams();
    test_service_end_to_end();
    test_service_rejections();
    test_initialize_removes_file_when_record_fails();
    test_abandonment();
}
