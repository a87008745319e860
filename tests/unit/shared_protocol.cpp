#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "treasury/chunk_format.hpp"
#include "treasury/crypto.hpp"
#include "treasury/encoding/base64.hpp"
#include "treasury/error_codes.hpp"
#include "treasury/framing.hpp"
#include "treasury/protocol.hpp"

using namespace treasury;
using namespace treasury::protocol;

void run_server_component_tests();
void run_server_transfer_tests();

namespace
{

    constexpr std::uint64_t kMiB = 1024 * 1024;

    void test_chunk_counts()
    {
        assert(format::chunk_count(0) == 0);
        assert(format::chunk_count(1) == 1);
        assert(format::chunk_count(format::kChunkDataSize) == 1);
        assert(format::chunk_count(format::kChunkDataSize + 1) == 2);
        assert(format::chunk_count(5 * kMiB) == 3);

        assert(format::kChunkOverhead == 44);
        assert(format::kEncryptedChunkSize == 2 * kMiB + 44);

        assert(format::encrypted_container_size(0) == 4);
        assert(format::encrypted_container_size(1) == 4 + 44 + 1);
        assert(format::encrypted_container_size(5 * kMiB) == 4 + 3 * 44 + 5 * kMiB);
    }

    void test_raw_sizes()
    {
        assert(format::raw_chunk_size(format::kEncryptedChunkSize) == format::kChunkDataSize);
        assert(format::raw_chunk_size(44) == 0);

        bool caught = false;
        try
        {
            (void)format::raw_chunk_size(43);
        }
        catch (const std::logic_error &)
        {
            caught = true;
        }
        assert(caught);

        for (const std::uint64_t size : {std::uint64_t{0}, std::uint64_t{1}, format::kChunkDataSize,
                                         format::kChunkDataSize + 1, 5 * kMiB, 4 * kMiB})
        {
            const auto container = format::encrypted_container_size(size);
            assert(format::raw_file_size_from_container_size(container) == size);
        }
    }

    void test_expected_chunk_sizes()
    {
        const auto file_size = 5 * kMiB;
        assert(format::expected_encrypted_chunk_size(file_size, 0) == format::kEncryptedChunkSize);
        assert(format::expected_encrypted_chunk_size(file_size, 1) == format::kEncryptedChunkSize);
        assert(format::expected_encrypted_chunk_size(file_size, 2) == kMiB + 44);
        assert(!format::expected_encrypted_chunk_size(file_size, 3));

        assert(!format::expected_encrypted_chunk_size(0, 0));
        assert(format::expected_encrypted_chunk_size(10, 0) == 54);

        // Exact multiple of the chunk size: the last chunk is full.
        assert(format::expected_encrypted_chunk_size(4 * kMiB, 1) == format::kEncryptedChunkSize);
        assert(!format::expected_encrypted_chunk_size(4 * kMiB, 2));
    }

    void test_chunk_read_ranges()
    {
        const auto container = format::encrypted_container_size(5 * kMiB);

        const auto first = format::chunk_read_range(0, container);
        assert(first);
        assert(first->offset == 4);
        assert(first->length == format::kEncryptedChunkSize);

        const auto last = format::chunk_read_range(2, container);
        assert(last);
        assert(last->offset == 4 + 2 * format::kEncryptedChunkSize);
        assert(last->length == kMiB + 44);
        assert(last->offset + last->length == container);

        assert(!format::chunk_read_range(3, container));
        assert(!format::chunk_read_range(std::numeric_limits<std::uint64_t>::max(), container));

        // The header-only container of an empty file has an empty chunk 0.
        const auto empty = format::chunk_read_range(0, 4);
        assert(empty);
        assert(empty->length == 0);
    }

    void test_handles()
    {
        assert(format::is_valid_handle("abcDEF0123456789"));
        assert(!format::is_valid_handle("abcDEF012345678"));
        assert(!format::is_valid_handle("abcDEF0123456789a"));
        assert(!format::is_valid_handle("abcDEF01234567-9"));
        assert(!format::is_valid_handle("../../etc/passwd"));

        const auto first = crypto::generate_handle(format::kHandleLength);
        const auto second = crypto::generate_handle(format::kHandleLength);
        assert(format::is_valid_handle(first));
        assert(format::is_valid_handle(second));
        assert(first != second);

        assert(crypto::constant_time_equals("token-a", "token-a"));
        assert(!crypto::constant_time_equals("token-a", "token-b"));
        assert(!crypto::constant_time_equals("token", "token-a"));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::ChunkSizeMismatch) == "chunk_size_mismatch");
        assert(to_int(ErrorCode::IncompleteUpload) == 105);
        assert(error_code_from_int(to_int(ErrorCode::ChunkOutOfRange)) == ErrorCode::ChunkOutOfRange);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        assert(is_client_error(ErrorCode::StaleChunk));
        assert(is_client_error(ErrorCode::TooManyPendingChunks));
        assert(!is_client_error(ErrorCode::IoError));
        assert(!is_client_error(ErrorCode::FinalizeIoError));
        assert(!is_client_error(ErrorCode::Ok));
    }

    void test_request_roundtrip()
    {
        RequestEnvelope envelope{
            .command = Command::UploadChunk,
            .payload = {{"handle", "abcDEF0123456789"}},
            .request_id = std::string("req-7"),
        };
        const nlohmann::json json = envelope;
        assert(json.at("cmd") == "UPLOAD_CHUNK");

        const auto parsed = json.get<RequestEnvelope>();
        assert(parsed.command == Command::UploadChunk);
        assert(parsed.payload.at("handle") == "abcDEF0123456789");
        assert(parsed.request_id == std::optional<std::string>("req-7"));

        const auto without_payload = nlohmann::json{{"cmd", "PING"}}.get<RequestEnvelope>();
        assert(without_payload.command == Command::Ping);
        assert(without_payload.payload.is_object());
        assert(!without_payload.request_id);

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "LIST"}}.get<RequestEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_response_roundtrip()
    {
        ResponseEnvelope envelope{
            .kind = ResponseKind::Error,
            .error = ErrorCode::IncompleteUpload,
            .message = "10 bytes are still missing",
            .payload = {{"bytes_remaining", 10}},
        };
        const nlohmann::json json = envelope;
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == 105);
        assert(!json.contains("id"));

        const auto parsed = json.get<ResponseEnvelope>();
        assert(parsed.kind == ResponseKind::Error);
        assert(parsed.error == ErrorCode::IncompleteUpload);
        assert(parsed.payload.at("bytes_remaining") == 10);
    }

    void test_transfer_payloads()
    {
        const UploadStartResponse start{.handle = "abcDEF0123456789", .chunk_count = 3, .container_size = 5243016};
        const auto start_parsed = nlohmann::json(start).get<UploadStartResponse>();
        assert(start_parsed.handle == start.handle);
        assert(start_parsed.chunk_count == 3);
        assert(start_parsed.container_size == 5243016);

        const UploadFinaliseRequest finalise{
            .handle = "abcDEF0123456789",
            .parent_handle = "parentHandle0001",
            .encrypted_metadata_base64 = "bWV0YQ==",
            .encrypted_crypt_key_base64 = "a2V5",
            .signature_base64 = "c2ln",
        };
        const nlohmann::json finalise_json = finalise;
        assert(finalise_json.at("encrypted_metadata") == "bWV0YQ==");
        const auto finalise_parsed = finalise_json.get<UploadFinaliseRequest>();
        assert(finalise_parsed.parent_handle == "parentHandle0001");
        assert(finalise_parsed.signature_base64 == "c2ln");

        const DownloadChunkResponse chunk{.handle = "abcDEF0123456789", .chunk_id = 2, .bytes = 3, .data_base64 = "AQID"};
        const auto chunk_parsed = nlohmann::json(chunk).get<DownloadChunkResponse>();
        assert(chunk_parsed.chunk_id == 2);
        assert(chunk_parsed.bytes == 3);
        assert(chunk_parsed.data_base64 == "AQID");

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"handle", "abcDEF0123456789"}}.get<DownloadChunkRequest>();
        }
        catch (const nlohmann::json::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_framing()
    {
        const nlohmann::json message = {{"cmd", "PING"}};
        const auto frame = encode_frame(message);
        const auto text = message.dump();
        assert(frame.size() == kFrameHeaderSize + text.size());

        std::array<std::uint8_t, kFrameHeaderSize> header{};
        std::copy_n(frame.begin(), kFrameHeaderSize, header.begin());
        assert(read_frame_header(header) == text.size());

        const auto payload = nlohmann::json::parse(frame.begin() + kFrameHeaderSize, frame.end());
        assert(payload == message);

        // Big-endian length prefix.
        assert(read_frame_header({0x00, 0x01, 0x02, 0x03}) == 0x00010203u);
        assert(read_frame_header({0xFF, 0x00, 0x00, 0x00}) == 0xFF000000u);

        const FrameTooLarge too_large(5000000, kDefaultMaxFrameSize);
        assert(too_large.size() == 5000000);
    }

    void test_base64()
    {
        const std::string text = "hello";
        const std::vector<std::byte> bytes(reinterpret_cast<const std::byte *>(text.data()),
                                           reinterpret_cast<const std::byte *>(text.data()) + text.size());
        assert(encoding::encode_base64(bytes) == "aGVsbG8=");

        const auto decoded = encoding::decode_base64("aGVsbG8=");
        assert(decoded);
        assert(*decoded == bytes);

        const auto empty = encoding::decode_base64("");
        assert(empty);
        assert(empty->empty());

        assert(!encoding::decode_base64("aGVs*G8="));
        assert(!encoding::decode_base64("aGVs=bG8"));
        assert(!encoding::decode_base64("Q"));
        assert(!encoding::decode_base64("Q==="));
        assert(!encoding::decode_base64("QQ"));
        assert(!encoding::decode_base64("QR=="));
        assert(!encoding::decode_base64("QUJ="));

        const auto single = encoding::decode_base64("QQ==");
        assert(single);
        assert(single->size() == 1);
        assert(single->front() == std::byte{'A'});
        assert(encoding::decode_base64("QUI=")->size() == 2);
    }

} // namespace

int main()
{
    try
    {
        test_chunk_counts();
        test_raw_sizes();
        test_expected_chunk_sizes();
        test_chunk_read_ranges();
        test_handles();
        test_error_codes();
        test_request_roundtrip();
        test_response_roundtrip();
        test_transfer_payloads();
        test_framing();
        test_base64();
        run_server_component_tests();
        run_server_transfer_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
