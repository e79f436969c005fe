#include <cassert>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "stowage/crypto.hpp"
#include "stowage/error_codes.hpp"
#include "stowage/framing.hpp"
#include "stowage/protocol.hpp"
#include "stowage/status.hpp"

using namespace stowage;
using namespace stowage::protocol;

void run_server_component_tests();
void run_service_http_tests();
void run_client_component_tests();

namespace
{

    void test_status_labels()
    {
        const std::vector<UploadStatus> all = {
            UploadStatus::Uploading, UploadStatus::Verifying, UploadStatus::Pending,
            UploadStatus::Deriving, UploadStatus::Packing, UploadStatus::Finished,
            UploadStatus::Abandoned, UploadStatus::FailedChecksum, UploadStatus::FailedVerify,
            UploadStatus::FailedOther,
        };
        for (const auto status : all)
        {
            const auto parsed = status_from_string(to_string(status));
            assert(parsed && *parsed == status);
        }
        assert(to_string(UploadStatus::FailedChecksum) == "FAILED_CHECKSUM");
        assert(!status_from_string("uploading"));

        assert(!is_terminal(UploadStatus::Uploading));
        assert(!is_terminal(UploadStatus::Verifying));
        assert(!is_terminal(UploadStatus::Packing));
        assert(is_terminal(UploadStatus::Finished));
        assert(is_terminal(UploadStatus::FailedVerify));
        assert(is_failure(UploadStatus::FailedOther));
        assert(!is_failure(UploadStatus::Finished));

        bool caught = false;
        try
        {
            (void)nlohmann::json("SIDEWAYS").get<UploadStatus>();
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::WrongStatus) == "wrong_status");
        assert(to_string(ErrorCode::ExceededBounds) == "exceeded_bounds");
        assert(to_string(ErrorCode::Locked) == "locked");
        assert(to_string(static_cast<ErrorCode>(9999)) == "unknown");
    }

    void test_record_json()
    {
        UploadRecord record{
            .id = "0190a1b2-0000-7000-8000-000000000000",
            .status = UploadStatus::Verifying,
            .file = FileInfo{.name = "scan.tar", .hash = std::string(64, 'a'), .size = 42},
            .metadata = UploadMetadata{.uploader = "jdoe", .items = {"item-1", "item-2"}},
            .project = "archive",
            .pipeline = "scans",
            .last_activity = 1700000000,
            .processing = true,
            .storage_location = "/srv/stowage",
        };
        const auto json = nlohmann::json(record);
        assert(json.at("status") == "VERIFYING");
        assert(json.at("file").at("size") == 42);
        assert(json.at("metadata").at("items").size() == 2);

        const auto decoded = json.get<UploadRecord>();
        assert(decoded.id == record.id);
        assert(decoded.status == UploadStatus::Verifying);
        assert(decoded.metadata.items == record.metadata.items);
        assert(decoded.processing);
    }

    void test_envelope()
    {
        const auto ok = nlohmann::json(make_ok(UploadInformation{.id = "abc", .base_url = "http://h/upload/abc"}));
        assert(ok.at("status") == "ok");
        assert(ok.at("payload").at("base_url") == "http://h/upload/abc");

        const auto not_found = nlohmann::json(make_not_found());
        assert(not_found.at("status") == "not_found");
        assert(!not_found.contains("payload"));

        const auto error = nlohmann::json(make_error("Offset too large"));
        assert(error.at("status") == "err");
        assert(error.at("payload") == "Offset too large");

        const auto decoded = error.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Err);
        assert(decoded.message == "Offset too large");

        const auto decoded_ok = nlohmann::json::parse(R"({"status":"ok","payload":null})").get<ResponseEnvelope>();
        assert(decoded_ok.kind == ResponseKind::Ok);
        assert(decoded_ok.payload.is_null());
    }

    void test_event_lines()
    {
        const UploadEvent event{.kind = EventKind::StatusChange, .status = UploadStatus::Verifying};
        const auto line = encode_line(nlohmann::json(event));
        assert(line == "{\"payload\":\"VERIFYING\",\"type\":\"status_change\"}\n");

        std::string buffer = line + "\r\n" + encode_line(nlohmann::json(UploadEvent{
                                                 .kind = EventKind::StatusChange,
                                                 .status = UploadStatus::Finished,
                                             }));
        buffer += "{\"type\":\"status_";

        auto first = try_decode_line(buffer);
        assert(first);
        assert(first->message.get<UploadEvent>().status == UploadStatus::Verifying);
        buffer.erase(0, first->bytes_consumed);

        auto second = try_decode_line(buffer);
        assert(second);
        assert(second->message.get<UploadEvent>().status == UploadStatus::Finished);
        buffer.erase(0, second->bytes_consumed);

        assert(!try_decode_line(buffer));
    }

    void test_crypto()
    {
        const std::string text = "This is a STRING!\n";
        const auto bytes = std::as_bytes(std::span(text.data(), text.size()));
        const std::string expected = "9d7780a699c93822709b3aeac17615f8bb4d2de6f17fb832a510bdf8cb96f6b9";
        assert(crypto::hash_bytes(bytes) == expected);

        crypto::Sha256 incremental;
        incremental.update(bytes.first(5));
        incremental.update(bytes.subspan(5));
        assert(incremental.finish_hex() == expected);

        std::istringstream stream(text);
        assert(crypto::hash_stream(stream) == expected);

        const auto file_path = std::filesystem::temp_directory_path() / "stowage_hash_test.txt";
        {
            std::ofstream out(file_path, std::ios::binary);
            out << text;
        }
        assert(crypto::hash_file(file_path) == expected);
        std::filesystem::remove(file_path);
    }

    void test_upload_ids()
    {
        const auto first = crypto::generate_upload_id();
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        const auto second = crypto::generate_upload_id();

        assert(first.size() == 36);
        assert(first[8] == '-' && first[13] == '-' && first[18] == '-' && first[23] == '-');
        assert(first[14] == '7');
        assert(first != second);
        assert(first < second);
    }

} // namespace

int main()
{
    try
    {
        test_status_labels();
        test_error_codes();
        test_record_json();
        test_envelope();
        test_event_lines();
        test_crypto();
        test_upload_ids();
        run_server_component_tests();
        run_service_http_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
