#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include "treasury/chunk_format.hpp"
#include "treasury/server/downloads_manager.hpp"
#include "treasury/server/file_record_store.hpp"
#include "treasury/server/transfer_service.hpp"
#include "treasury/server/uploads_manager.hpp"

#include "test_support.hpp"

using namespace treasury;
using namespace treasury::server;
using namespace treasury::test;

namespace
{

    using namespace std::chrono_literals;

    constexpr UserId kAlice = 1;
    constexpr UserId kBob = 2;

    // Runs an io_context on a background thread until stop() is called.
    class IoThread
    {
    public:
        IoThread()
            : guard_(asio::make_work_guard(io_context_)),
              thread_([this]
                      { io_context_.run(); })
        {
        }

        ~IoThread() { stop(); }

        asio::io_context &context() noexcept { return io_context_; }

        void stop()
        {
            if (thread_.joinable())
            {
                guard_.reset();
                io_context_.stop();
                thread_.join();
            }
        }

    private:
        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> guard_;
        std::thread thread_;
    };

    // Stores a finished upload under `handle`; chunk i is filled with 0xC0 + i.
    void store_upload(UploadsManager &uploads, const std::string &handle, std::uint64_t file_size)
    {
        uploads.open(kAlice, handle, file_size);
        for (std::uint64_t id = 0; id < format::chunk_count(file_size); ++id)
        {
            uploads.accept_chunk(handle, id, chunk_for(file_size, id, static_cast<std::uint8_t>(0xC0 + id)));
        }
        uploads.finalize(handle);
    }

    void test_download_chunk_streams()
    {
        TempDir temp("treasury_download_streams");
        UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
        const std::string handle = "D0wnloadHandle01";
        const auto file_size = 5 * kMiB;
        store_upload(uploads, handle, file_size);

        IoThread io;
        {
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 10s);

            auto first = downloads.read_chunk_stream(kAlice, handle, 0);
            assert(first.offset() == format::kContainerHeaderSize);
            assert(first.length() == format::kEncryptedChunkSize);
            const auto first_bytes = first.read_all();
            assert(first_bytes == chunk_for(file_size, 0, 0xC0));
            assert(first.done());
            assert(downloads.is_cached(handle));

            // The last chunk is short and can be consumed piecewise.
            auto last = downloads.read_chunk_stream(kAlice, handle, 2);
            assert(last.length() == kMiB + format::kChunkOverhead);
            std::vector<std::byte> buffer(64 * 1024);
            std::uint64_t total = 0;
            while (!last.done())
            {
                const auto read = last.read_some(buffer);
                assert(read > 0);
                assert(buffer[0] == std::byte{0xC2});
                total += read;
            }
            assert(total == kMiB + format::kChunkOverhead);
            assert(last.remaining() == 0);
            assert(last.read_some(buffer) == 0);

            expect_transfer_error(ErrorCode::ChunkOutOfRange, [&]
                                  { downloads.read_chunk_stream(kAlice, handle, 3); });
            assert(downloads.cached_count() == 1);

            expect_transfer_error(ErrorCode::FileNotFound, [&]
                                  { downloads.read_chunk_stream(kAlice, "MissingHandle001", 0); });
            expect_transfer_error(ErrorCode::FileNotFound, [&]
                                  { downloads.read_chunk_stream(kAlice, "../userfiles/x", 0); });
            assert(!downloads.is_cached("MissingHandle001"));
            assert(downloads.cached_count() == 1);

            io.stop();
        }
    }

    void test_stream_outlives_eviction()
    {
        TempDir temp("treasury_download_evict");
        UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
        const std::string handle = "EvictedHandle001";
        store_upload(uploads, handle, 100);

        IoThread io;
        {
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 100ms);
            auto stream = downloads.read_chunk_stream(kAlice, handle, 0);
            std::this_thread::sleep_for(500ms);
            assert(!downloads.is_cached(handle));

            const auto bytes = stream.read_all();
            assert(bytes.size() == 100 + format::kChunkOverhead);
            assert(bytes.front() == std::byte{0xC0});

            // A later access opens the file again.
            auto again = downloads.read_chunk_stream(kAlice, handle, 0);
            assert(again.length() == bytes.size());
            assert(downloads.is_cached(handle));

            downloads.shutdown();
            assert(downloads.cached_count() == 0);
            expect_transfer_error(ErrorCode::IoError, [&]
                                  { downloads.read_chunk_stream(kAlice, handle, 0); });

            io.stop();
        }
    }

    void test_open_file_errors()
    {
        TempDir temp("treasury_open_file");
        expect_transfer_error(ErrorCode::FileNotFound, [&]
                              { OpenFile::open(temp.path() / "missing.tef"); });
        expect_transfer_error(ErrorCode::FileNotFound, [&]
                              { OpenFile::open(temp.path() / "missing" / "nested.tef"); });
        expect_transfer_error(ErrorCode::IoError, [&]
                              { OpenFile::open(temp.path()); });

        const auto path = temp.path() / "present.tef";
        {
            std::ofstream(path, std::ios::binary) << "0123456789";
        }
        const auto file = OpenFile::open(path);
        assert(file->size() == 10);
        assert(file->path() == path);

        std::vector<std::byte> buffer(4);
        assert(file->read_at(6, buffer) == 4);
        assert(buffer[0] == std::byte{'6'} && buffer[3] == std::byte{'9'});
        assert(file->read_at(10, buffer) == 0);
    }

    void test_empty_file_download()
    {
        TempDir temp("treasury_download_empty");
        UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
        const std::string handle = "EmptyFileHandle1";
        store_upload(uploads, handle, 0);

        IoThread io;
        {
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 10s);
            auto stream = downloads.read_chunk_stream(kAlice, handle, 0);
            assert(stream.length() == 0);
            assert(stream.done());
            assert(stream.read_all().empty());
            expect_transfer_error(ErrorCode::ChunkOutOfRange, [&]
                                  { downloads.read_chunk_stream(kAlice, handle, 1); });
            io.stop();
        }
    }

    void test_idle_downloads_are_evicted()
    {
        TempDir temp("treasury_download_idle");
        UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
        const std::string handle = "IdleDownload0001";
        store_upload(uploads, handle, 100);

        IoThread io;
        {
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 150ms);
            (void)downloads.read_chunk_stream(kAlice, handle, 0);
            assert(downloads.is_cached(handle));

            std::this_thread::sleep_for(700ms);
            assert(!downloads.is_cached(handle));
            assert(downloads.cached_count() == 0);

            io.stop();
        }
    }

    void test_access_resets_idle_timer()
    {
        TempDir temp("treasury_download_reset");
        UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
        const std::string handle = "BusyDownload0001";
        store_upload(uploads, handle, 100);

        IoThread io;
        {
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 600ms);
            (void)downloads.read_chunk_stream(kAlice, handle, 0);
            std::this_thread::sleep_for(350ms);
            (void)downloads.read_chunk_stream(kAlice, handle, 0);
            std::this_thread::sleep_for(350ms);

            // 700ms after the first access, but only 350ms after the second one.
            assert(downloads.is_cached(handle));

            std::this_thread::sleep_for(1200ms);
            assert(!downloads.is_cached(handle));

            io.stop();
        }
    }

    FinalizeRequest valid_finalize_request()
    {
        return FinalizeRequest{
            .parent_handle = "RootFolderHandle",
            .fields = EncryptedFields{
                .metadata = make_chunk(48, 0x01),
                .crypt_key = make_chunk(kEncryptedCryptKeySize, 0x02),
                .signature = make_chunk(kSignatureSize, 0x03),
            },
        };
    }

    void test_transfer_service_flow()
    {
        TempDir temp("treasury_service_flow");
        IoThread io;
        {
            UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 10s);
            JsonFileRecordStore records(temp.path() / "records.json");
            TransferService service(uploads, downloads, records);

            const auto ticket = service.open_upload(kAlice, 10);
            assert(format::is_valid_handle(ticket.handle));
            assert(ticket.chunk_count == 1);
            assert(ticket.container_size == 4 + 44 + 10);

            expect_transfer_error(ErrorCode::PermissionDenied, [&]
                                  { service.accept_chunk(kBob, ticket.handle, 0, chunk_for(10, 0, 5)); });
            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.accept_chunk(kAlice, "short", 0, chunk_for(10, 0, 5)); });
            expect_transfer_error(ErrorCode::UnknownHandle, [&]
                                  { service.accept_chunk(kAlice, "NoSuchUpload0001", 0, chunk_for(10, 0, 5)); });

            assert(service.accept_chunk(kAlice, ticket.handle, 0, chunk_for(10, 0, 5)) == 1);

            auto bad_key = valid_finalize_request();
            bad_key.fields.crypt_key.pop_back();
            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.finalize_upload(kAlice, ticket.handle, bad_key); });
            auto bad_signature = valid_finalize_request();
            bad_signature.fields.signature.push_back(std::byte{0});
            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.finalize_upload(kAlice, ticket.handle, bad_signature); });
            auto big_metadata = valid_finalize_request();
            big_metadata.fields.metadata = make_chunk(kMaxEncryptedMetadataSize + 1, 0);
            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.finalize_upload(kAlice, ticket.handle, big_metadata); });
            auto bad_parent = valid_finalize_request();
            bad_parent.parent_handle = "not/a/handle";
            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.finalize_upload(kAlice, ticket.handle, bad_parent); });
            expect_transfer_error(ErrorCode::PermissionDenied, [&]
                                  { service.finalize_upload(kBob, ticket.handle, valid_finalize_request()); });

            // Rejected finalize requests leave the upload untouched.
            assert(uploads.active_count() == 1);

            const auto finalized = service.finalize_upload(kAlice, ticket.handle, valid_finalize_request());
            assert(finalized.raw_size == 10);
            assert(finalized.container_size == ticket.container_size);

            const auto record = records.find(ticket.handle);
            assert(record);
            assert(record->owner == kAlice);
            assert(record->parent_handle == "RootFolderHandle");
            assert(record->size == 10);
            assert(record->fields.signature.size() == kSignatureSize);

            auto stream = service.read_download_chunk(kAlice, ticket.handle, 0);
            assert(stream.read_all() == chunk_for(10, 0, 5));
            expect_transfer_error(ErrorCode::FileNotFound, [&]
                                  { service.read_download_chunk(kBob, ticket.handle, 0); });
            expect_transfer_error(ErrorCode::FileNotFound, [&]
                                  { service.read_download_chunk(kAlice, "NoSuchFile000001", 0); });
            expect_transfer_error(ErrorCode::ChunkOutOfRange, [&]
                                  { service.read_download_chunk(kAlice, ticket.handle, 1); });

            io.stop();
        }
    }

    void test_transfer_service_cancel_and_limits()
    {
        TempDir temp("treasury_service_cancel");
        IoThread io;
        {
            UploadsManager uploads(temp.path() / "uploads", temp.path() / "userfiles", 4);
            DownloadsManager downloads(io.context(), temp.path() / "userfiles", 10s);
            JsonFileRecordStore records(temp.path() / "records.json");
            TransferService service(uploads, downloads, records);

            expect_transfer_error(ErrorCode::InvalidPayload, [&]
                                  { service.open_upload(kAlice, format::kMaxFileSize + 1); });

            const auto first = service.open_upload(kAlice, 5 * kMiB);
            const auto second = service.open_upload(kAlice, 5 * kMiB);
            assert(first.handle != second.handle);
            assert(uploads.active_count() == 2);

            expect_transfer_error(ErrorCode::PermissionDenied, [&]
                                  { service.cancel_upload(kBob, first.handle); });
            service.cancel_upload(kAlice, first.handle);
            assert(uploads.active_count() == 1);
            expect_transfer_error(ErrorCode::UnknownHandle, [&]
                                  { service.cancel_upload(kAlice, first.handle); });

            const auto error = expect_transfer_error(ErrorCode::IncompleteUpload, [&]
                                                     { service.finalize_upload(kAlice, second.handle, valid_finalize_request()); });
            assert(error.bytes_remaining() == 5 * kMiB);
            assert(!records.find(second.handle));

            io.stop();
        }
    }

} // namespace

void run_server_transfer_tests()
{
    test_download_chunk_streams();
    test_stream_outlives_eviction();
    test_open_file_errors();
    test_empty_file_download();
    test_idle_downloads_are_evicted();
    test_access_resets_idle_timer();
    test_transfer_service_flow();
    test_transfer_service_cancel_and_limits();
}
