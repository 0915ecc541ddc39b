#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"
#include "test_support.hpp"

using namespace ferry;
using namespace ferry::protocol;

void run_server_component_tests();
void run_client_component_tests();

namespace
{

    bool decode_fails(const std::string &text)
    {
        try
        {
            (void)decode_control_message(text);
        }
        catch (const ProtocolError &error)
        {
            assert(error.code() == ErrorCode::MalformedMessage);
            return true;
        }
        return false;
    }

    void test_init_message_encoding()
    {
        InitMessage init{
            .username = "alice",
            .token = "secret",
            .files = {{.name = "a.txt", .declared_size = 5}, {.name = "b.txt", .declared_size = 3}},
            .boundary = "#END#",
            .framing = FramingMode::Tagged,
        };

        const auto json = nlohmann::json::parse(encode_init_message(init));
        assert(json.at("command") == "init");
        assert(json.at("filenames") == "a.txt|b.txt");
        assert(json.at("sizes") == "5|3");
        assert(json.at("framing") == "tagged");

        const auto decoded = decode_control_message(encode_init_message(init));
        assert(decoded.command == ControlCommand::Init);
        assert(decoded.init);
        assert(decoded.init->username == "alice");
        assert(decoded.init->token == "secret");
        assert(decoded.init->files == init.files);
        assert(decoded.init->boundary == "#END#");
        assert(decoded.init->framing == FramingMode::Tagged);
    }

    void test_init_message_without_framing_key()
    {
        const std::string wire = R"({"username":"username","token":"randomKey","filenames":"x.bin|y.bin",)"
                                 R"("sizes":"1024|0","command":"init","boundary":"q7#kP0z"})";
        const auto decoded = decode_control_message(wire);
        assert(decoded.init);
        assert(decoded.init->framing == FramingMode::Boundary);
        assert(decoded.init->files.size() == 2);
        assert(decoded.init->files[1].declared_size == 0);

        InitMessage init = *decoded.init;
        const auto reencoded = nlohmann::json::parse(encode_init_message(init));
        assert(!reencoded.contains("framing"));
    }

    void test_control_message_failures()
    {
        assert(decode_fails("not json"));
        assert(decode_fails("[1,2,3]"));
        assert(decode_fails(R"({"command":"launch"})"));
        assert(decode_fails(R"({"username":"u","filenames":"a","sizes":"1","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","filenames":"a","sizes":"1","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"","sizes":"","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"1","boundary":""})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a|b","sizes":"1","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a||b","sizes":"1|2|3","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"-1","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"1","boundary":"b","token":7})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"1","boundary":"b"})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"1","boundary":"b","token":""})"));
        assert(decode_fails(R"({"command":"init","username":"u","filenames":"a","sizes":"1","boundary":"b","framing":"x"})"));

        const auto exit = decode_control_message(encode_exit_message());
        assert(exit.command == ControlCommand::Exit);
        assert(!exit.init);

        bool caught = false;
        try
        {
            (void)encode_init_message(InitMessage{.username = "u", .token = "t", .files = {{.name = "a|b"}}, .boundary = "b"});
        }
        catch (const ProtocolError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_notices()
    {
        assert(encode_notice(ServerNotice{.kind = NoticeKind::Ready}) == "ready");
        assert(encode_notice(ServerNotice{.kind = NoticeKind::Next}) == "next");
        assert(encode_notice(ServerNotice{.kind = NoticeKind::Progress, .bytes = 1048576}) == "progress|1048576");
        assert(encode_notice(ServerNotice{.kind = NoticeKind::Error,
                                          .error = ErrorCode::IoFailure,
                                          .message = "disk full"}) == "error|io_failure|disk full");

        const auto progress = parse_notice("progress|2097152");
        assert(progress && progress->kind == NoticeKind::Progress && progress->bytes == 2097152);

        const auto error = parse_notice("error|protocol_violation|bad tag|x");
        assert(error && error->error == ErrorCode::ProtocolViolation && error->message == "bad tag|x");

        assert(parse_notice("reject") && parse_notice("reject")->kind == NoticeKind::Reject);
        assert(!parse_notice("progress|abc"));
        assert(!parse_notice("progress"));
        assert(!parse_notice("ready|now"));
        assert(!parse_notice("hello"));
    }

    void test_data_frame_classification()
    {
        const std::string boundary = "#END#";
        const auto eof = test::binary_frame("#END#");
        const auto content = test::binary_frame("hello");

        auto view = classify_data_frame(FramingMode::Boundary, eof.payload, boundary);
        assert(view.kind == DataFrameKind::EndOfFile);
        view = classify_data_frame(FramingMode::Boundary, content.payload, boundary);
        assert(view.kind == DataFrameKind::Content && view.content.size() == 5);

        const auto tagged_content = encode_content_payload(FramingMode::Tagged, eof.payload);
        view = classify_data_frame(FramingMode::Tagged, tagged_content, boundary);
        assert(view.kind == DataFrameKind::Content);
        assert(std::string(view.content.begin(), view.content.end()) == "#END#");

        const auto tagged_eof = encode_end_of_file_payload(FramingMode::Tagged, boundary);
        assert(tagged_eof.size() == boundary.size() + 1 && tagged_eof[0] == kTagEndOfFile);
        view = classify_data_frame(FramingMode::Tagged, tagged_eof, boundary);
        assert(view.kind == DataFrameKind::EndOfFile);

        const auto expect_violation = [&boundary](const std::vector<std::uint8_t> &payload)
        {
            try
            {
                (void)classify_data_frame(FramingMode::Tagged, payload, boundary);
            }
            catch (const TransferError &error)
            {
                return error.code() == ErrorCode::ProtocolViolation;
            }
            return false;
        };
        assert(expect_violation({}));
        assert(expect_violation({0x07, 'x'}));
        assert(expect_violation(encode_end_of_file_payload(FramingMode::Tagged, "#OTHER#")));
    }

    void test_framing()
    {
        const std::vector<std::uint8_t> payload = {0x00, 0x01, 0xFF};
        const auto frame = encode_frame(FrameType::Binary, payload);
        assert(frame.size() == kFrameHeaderSize + payload.size());
        assert(frame[0] == static_cast<std::uint8_t>(FrameType::Binary));

        auto combined = frame;
        const auto text = encode_text_frame("next");
        combined.insert(combined.end(), text.begin(), text.end());

        assert(!try_decode_frame(std::span<const std::uint8_t>(combined).first(kFrameHeaderSize + 1)));

        const auto first = try_decode_frame(combined);
        assert(first);
        assert(first->frame.type == FrameType::Binary);
        assert(first->frame.payload == payload);
        assert(first->bytes_consumed == frame.size());

        const auto second = try_decode_frame(std::span<const std::uint8_t>(combined).subspan(first->bytes_consumed));
        assert(second && second->frame.type == FrameType::Text && second->frame.text() == "next");

        const auto close = try_decode_frame(encode_close_frame(kCloseNormal, "done"));
        assert(close && close->frame.type == FrameType::Close);
        const auto info = parse_close_payload(close->frame.payload);
        assert(info.status == kCloseNormal);
        assert(info.reason == "done");

        bool too_large = false;
        try
        {
            (void)try_decode_frame(encode_frame(FrameType::Binary, payload), 2);
        }
        catch (const std::length_error &)
        {
            too_large = true;
        }
        assert(too_large);

        bool bad_opcode = false;
        try
        {
            const std::vector<std::uint8_t> bogus = {0x7, 0, 0, 0, 0};
            (void)try_decode_frame(bogus);
        }
        catch (const std::runtime_error &)
        {
            bad_opcode = true;
        }
        assert(bad_opcode);
    }

    void test_lists_and_error_codes()
    {
        assert(join_list({"a", "b", "c"}) == "a|b|c");
        assert(split_list("a|b|c").size() == 3);
        assert(split_list("").size() == 1);
        assert(split_list("a|").back().empty());

        assert(to_string(ErrorCode::DestinationUnavailable) == "destination_unavailable");
        assert(error_code_from_string("io_failure") == ErrorCode::IoFailure);
        assert(error_code_from_string("nonsense") == ErrorCode::InternalError);
    }

    void test_crypto()
    {
        const auto first = crypto::random_token(8);
        const auto second = crypto::random_token(8);
        assert(first.size() == 16);
        assert(first != second);
        assert(first.find_first_not_of("0123456789abcdef") == std::string::npos);

        const auto file_path = std::filesystem::temp_directory_path() / "ferry_crypto_test.bin";
        test::write_file(file_path, std::string("\xDE\xAD\xBE\xEF", 4));
        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_file(file_path) == crypto::hash_stream(stream));
        std::filesystem::remove(file_path);
    }

} // namespace

int main()
{
    try
    {
        test_init_message_encoding();
        test_init_message_without_framing_key();
        test_control_message_failures();
        test_notices();
        test_data_frame_classification();
        test_framing();
        test_lists_and_error_codes();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
