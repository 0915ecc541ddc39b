#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cassert>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/client/chunk_sender.hpp"
#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/manifest.hpp"
#include "ferry/client/progress_renderer.hpp"
#include "ferry/client/session.hpp"
#include "ferry/client/upload_controller.hpp"
#include "ferry/protocol.hpp"
#include "loopback.hpp"
#include "test_support.hpp"

using namespace ferry;
using namespace ferry::client;
using namespace ferry::protocol;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "ferry_client");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::exception &)
        {
            return true;
        }
        return false;
    }

    void test_format_size()
    {
        assert(format_size(0) == "0");
        assert(format_size(512) == "512 B");
        assert(format_size(1023) == "1,023 B");
        assert(format_size(1536) == "1.5 KB");
        assert(format_size(1024 * 1024) == "1 MB");
        assert(format_size(3ULL * 1024 * 1024 * 1024) == "3 GB");
    }

    void test_progress_renderer()
    {
        std::ostringstream out;
        ProgressRenderer renderer(out);
        renderer.begin_file("a.txt", 100);
        assert(out.str() == "\"a.txt\"\n|" + std::string(ProgressRenderer::kBarSize, ' ') + "| 100 B\n ");
        assert(renderer.cells_drawn() == 0);

        renderer.update(50);
        assert(renderer.cells_drawn() == 25);
        renderer.update(40);
        assert(renderer.cells_drawn() == 25);
        renderer.update(500);
        assert(renderer.cells_drawn() == ProgressRenderer::kBarSize);

        std::ostringstream second;
        ProgressRenderer partial(second);
        partial.begin_file("b", 10);
        partial.update(2);
        partial.finish_file();
        const auto text = second.str();
        assert(text.ends_with(std::string(ProgressRenderer::kBarSize, '#') + " 100%\n\n"));

        // Empty files have nothing to measure until the server acknowledges them.
        std::ostringstream empty;
        ProgressRenderer zero(empty);
        zero.begin_file("z", 0);
        zero.update(10);
        assert(zero.cells_drawn() == 0);
        zero.finish_file();
        assert(zero.cells_drawn() == ProgressRenderer::kBarSize);
    }

    void test_controller_happy_path()
    {
        std::ostringstream out;
        ProgressRenderer renderer(out);
        UploadController controller({{.name = "a.txt", .declared_size = 5}, {.name = "b.txt", .declared_size = 3}},
                                    renderer);

        auto action = controller.on_text("ready");
        assert(action.kind == ControlAction::Kind::StartFile && action.file_index == 0);

        action = controller.on_text("progress|4");
        assert(action.kind == ControlAction::Kind::None);
        assert(renderer.cells_drawn() == 40);

        action = controller.on_text("next");
        assert(action.kind == ControlAction::Kind::StartFile && action.file_index == 1);
        assert(controller.cursor() == 1);
        assert(!controller.completed());

        action = controller.on_text("next");
        assert(action.kind == ControlAction::Kind::SendExit);
        assert(controller.completed());
        assert(out.str().find("\"b.txt\"") != std::string::npos);

        // Nothing is expected after exit was requested.
        assert(controller.on_text("next").kind == ControlAction::Kind::Abort);
    }

    void test_controller_aborts()
    {
        std::ostringstream out;
        ProgressRenderer renderer(out);
        const std::vector<ManifestEntry> files = {{.name = "a", .declared_size = 1}};

        {
            UploadController controller(files, renderer);
            assert(controller.on_text("reject").kind == ControlAction::Kind::Abort);
        }
        {
            UploadController controller(files, renderer);
            assert(controller.on_text("next").kind == ControlAction::Kind::Abort);
        }
        {
            UploadController controller(files, renderer);
            const auto action = controller.on_text("Unknown command");
            assert(action.kind == ControlAction::Kind::Abort);
            assert(action.reason == "Server: Unknown command");
        }
        {
            UploadController controller(files, renderer);
            assert(controller.on_text("ready").kind == ControlAction::Kind::StartFile);
            assert(controller.on_text("ready").kind == ControlAction::Kind::Abort);
        }
        {
            UploadController controller(files, renderer);
            assert(controller.on_text("ready").kind == ControlAction::Kind::StartFile);
            const auto action = controller.on_text("error|io_failure|disk full");
            assert(action.kind == ControlAction::Kind::Abort);
            assert(action.reason.find("disk full") != std::string::npos);
        }
    }

    void test_send_file_chunks()
    {
        const auto root = test::fresh_directory("ferry_send_file");
        test::write_file(root / "twenty.bin", std::string(20, 'x'));
        test::write_file(root / "empty.bin", "");

        test::RecordingSink sink;
        const auto sent = send_file(sink, root / "twenty.bin",
                                    SendOptions{.chunk_size = 8, .framing = FramingMode::Tagged, .boundary = "#B#"});
        assert(sent == 20);
        assert(sink.frames.size() == 4);
        assert(sink.frames[0].payload.size() == 9);
        assert(sink.frames[1].payload.size() == 9);
        assert(sink.frames[2].payload.size() == 5);
        for (std::size_t i = 0; i < 3; ++i)
        {
            assert(sink.frames[i].type == FrameType::Binary);
            assert(sink.frames[i].payload.front() == kTagContent);
        }
        const auto eof = classify_data_frame(FramingMode::Tagged, sink.frames[3].payload, "#B#");
        assert(eof.kind == DataFrameKind::EndOfFile);

        sink.clear();
        assert(send_file(sink, root / "empty.bin",
                         SendOptions{.chunk_size = 8, .framing = FramingMode::Boundary, .boundary = "#B#"}) == 0);
        assert(sink.frames.size() == 1);
        assert(sink.frames[0].text() == "#B#");

        bool threw = false;
        try
        {
            (void)send_file(sink, root / "missing.bin", SendOptions{.boundary = "#B#"});
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        test::cleanup_path(root);
    }

    void test_chunk_sender_worker()
    {
        const auto root = test::fresh_directory("ferry_chunk_sender");
        test::write_file(root / "one.bin", "first");
        test::write_file(root / "two.bin", "second!");

        test::RecordingSink sink;
        std::atomic<std::uint64_t> total{0};
        std::atomic<std::size_t> failed_index{99};
        {
            ChunkSender sender(
                sink, SendOptions{.chunk_size = 4, .framing = FramingMode::Tagged, .boundary = "@"},
                [&](std::size_t index, const std::string &)
                { failed_index = index; },
                [&](std::size_t, std::uint64_t bytes)
                { total += bytes; });

            sender.start_file(0, root / "one.bin");
            sender.wait_idle();
            sender.start_file(1, root / "two.bin");
            sender.wait_idle();
            assert(total == 12);
            assert(sink.frames.size() == 6);

            sender.start_file(2, root / "missing.bin");
            sender.wait_idle();
            assert(failed_index == 2);

            sender.stop();
            sender.start_file(3, root / "one.bin");
        }
        assert(sink.frames.size() == 6);

        test::cleanup_path(root);
    }

    void test_manifest_collection()
    {
        const auto root = test::fresh_directory("ferry_manifest");
        test::write_file(root / "b.txt", "bye");
        test::write_file(root / "a.txt", "hello");
        std::filesystem::create_directories(root / "nested");

        const auto files = collect_directory(root);
        assert(files.size() == 2);
        assert(files[0].entry == (ManifestEntry{.name = "a.txt", .declared_size = 5}));
        assert(files[1].entry == (ManifestEntry{.name = "b.txt", .declared_size = 3}));
        assert(manifest_entries(files).size() == 2);

        assert(collect_directory(root / "absent").empty());

        const auto explicit_files = collect_files({root / "b.txt"});
        assert(explicit_files.size() == 1 && explicit_files[0].entry.name == "b.txt");

        bool threw = false;
        try
        {
            (void)collect_files({root / "nested"});
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        test::cleanup_path(root);
    }

    void test_parse_arguments()
    {
        const auto defaults = parse({"localhost:9000"});
        assert(defaults.username == "username");
        assert(defaults.host == "localhost" && defaults.port == 9000);
        assert(defaults.source_dir && *defaults.source_dir == "assets");
        assert(defaults.chunk_size == 8192);
        assert(defaults.framing == FramingMode::Tagged);
        assert(!defaults.boundary);
        assert(defaults.token == "randomKey");
        assert(defaults.timeout == std::chrono::seconds(300));

        const auto custom = parse({"bob@10.0.0.1:7000", "--file", "x.bin", "--file", "y.bin", "--token", "t",
                                   "--chunk-size", "4096", "--framing", "boundary", "--boundary", "#END#"});
        assert(custom.username == "bob");
        assert(custom.files.size() == 2);
        assert(!custom.source_dir);
        assert(custom.token == "t");
        assert(custom.chunk_size == 4096);
        assert(custom.framing == FramingMode::Boundary);
        assert(custom.boundary && *custom.boundary == "#END#");

        assert(parse_fails({}));
        assert(parse_fails({"no-port"}));
        assert(parse_fails({"h:1", "--chunk-size", "0"}));
        assert(parse_fails({"h:1", "--chunk-size", std::to_string(kDefaultMaxFramePayload)}));
        assert(parse({"h:1", "--chunk-size", std::to_string(kDefaultMaxFramePayload - 1)}).chunk_size ==
               kDefaultMaxFramePayload - 1);
        assert(parse({"h:1", "--timeout", "5"}).timeout == std::chrono::seconds(5));
        assert(parse_fails({"h:1", "--timeout", "0"}));
        assert(parse_fails({"h:1", "--token", ""}));
        assert(parse_fails({"h:1", "--framing", "weird"}));
        assert(parse_fails({"h:1", "--source", "d", "--file", "f"}));
        assert(parse_fails({"h:1", "--boundary"}));
        assert(parse_fails({"h:1", "--bogus"}));
    }

    ClientConfig session_config(std::uint16_t port, const std::filesystem::path &source)
    {
        ClientConfig config;
        config.username = "bob";
        config.host = "127.0.0.1";
        config.port = port;
        config.source_dir = source;
        config.chunk_size = 2;
        config.timeout = std::chrono::seconds(10);
        return config;
    }

    void test_session_uploads_directory()
    {
        const auto root = test::fresh_directory("ferry_session_upload");
        const auto source = root / "source";
        std::filesystem::create_directories(source);
        test::write_file(source / "a.txt", "hello");
        test::write_file(source / "b.txt", "bye");

        for (const auto framing : {FramingMode::Tagged, FramingMode::Boundary})
        {
            const auto destination = root / "dest";
            test::cleanup_path(destination);
            {
                test::LoopbackServer server(destination);
                auto config = session_config(server.port(), source);
                config.framing = framing;
                config.boundary = "#END#";
                std::ostringstream out;
                ClientSession session(std::move(config), Logger(std::nullopt), out);
                assert(session.run() == 0);
                assert(out.str().find("\"a.txt\"") != std::string::npos);
                assert(out.str().find("Connection closed: 1000") != std::string::npos);
            }
            assert(test::read_file(destination / "bob" / "a.txt") == "hello");
            assert(test::read_file(destination / "bob" / "b.txt") == "bye");
        }

        test::cleanup_path(root);
    }

    void test_session_with_nothing_to_send()
    {
        const auto root = test::fresh_directory("ferry_session_empty");
        std::filesystem::create_directories(root / "source");
        {
            test::LoopbackServer server(root / "dest");
            std::ostringstream out;
            ClientSession session(session_config(server.port(), root / "source"), Logger(std::nullopt), out);
            assert(session.run() == 0);
            assert(out.str().find("No files to upload") != std::string::npos);
            assert(out.str().find("Connection closed: 1000") != std::string::npos);
        }
        assert(!std::filesystem::exists(root / "dest" / "bob"));
        test::cleanup_path(root);
    }

    void test_session_rejected()
    {
        const auto root = test::fresh_directory("ferry_session_rejected");
        test::write_file(root / "a.txt", "hello");
        {
            test::LoopbackServer server(root / "dest");
            auto config = session_config(server.port(), root);
            config.username = "../outside";
            std::ostringstream out;
            ClientSession session(std::move(config), Logger(std::nullopt), out);
            assert(session.run() == 1);
            assert(out.str().find("Server rejected the upload") != std::string::npos);
        }
        test::cleanup_path(root);
    }

    // The listener never accepts, so init is buffered by the kernel and no
    // reply ever comes back.
    void test_session_times_out()
    {
        const auto root = test::fresh_directory("ferry_session_timeout");
        test::write_file(root / "a.txt", "hello");

        asio::io_context io_context;
        asio::ip::tcp::acceptor silent(io_context, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

        auto config = session_config(silent.local_endpoint().port(), root);
        config.timeout = std::chrono::seconds(1);
        std::ostringstream out;
        ClientSession session(std::move(config), Logger(std::nullopt), out);

        const auto started = std::chrono::steady_clock::now();
        assert(session.run() == 1);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
        assert(out.str().find("No reply from the server within 1 seconds") != std::string::npos);

        test::cleanup_path(root);
    }

} // namespace

void run_client_component_tests()
{
    test_format_size();
    test_progress_renderer();
    test_controller_happy_path();
    test_controller_aborts();
    test_send_file_chunks();
    test_chunk_sender_worker();
    test_manifest_collection();
    test_parse_arguments();
    test_session_uploads_directory();
    test_session_with_nothing_to_send();
    test_session_rejected();
    test_session_times_out();
}
