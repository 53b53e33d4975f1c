#include "utils.hpp"

namespace keel::test {

    TEST_CASE("002: classify requests, notifications and responses", "[002][protocol]") {
        auto request = protocol::decode(R"({"jsonrpc":"2.0","id":7,"method":"prompt","params":{"session_id":"s"}})");
        REQUIRE(request);
        CHECK(protocol::classify(*request) == protocol::frame_kind::request);
        CHECK(std::get<std::int64_t>(*request->id) == 7);
        REQUIRE(request->params);

        // jsonrpc member is optional on input
        auto note = protocol::decode(R"({"method":"cancel","params":{"session_id":"s"}})");
        REQUIRE(note);
        CHECK(protocol::classify(*note) == protocol::frame_kind::notification);

        auto response = protocol::decode(R"({"id":"0b7c","result":{"content":"x"}})");
        REQUIRE(response);
        CHECK(protocol::classify(*response) == protocol::frame_kind::response);
        CHECK(protocol::to_string(*response->id) == "0b7c");

        auto failed = protocol::decode(R"({"id":"0b7d","error":{"code":-32001,"message":"no"}})");
        REQUIRE(failed);
        CHECK(protocol::classify(*failed) == protocol::frame_kind::response);
        REQUIRE(failed->error);
        auto err = protocol::to_error(*failed->error);
        CHECK(err.code == errc::access_denied);
        CHECK(err.message == "no");

        auto empty = protocol::decode(R"({"jsonrpc":"2.0"})");
        REQUIRE(empty);
        CHECK(protocol::classify(*empty) == protocol::frame_kind::invalid);
    }

    TEST_CASE("002: malformed text is a parse error", "[002][protocol]") {
        auto bad = protocol::decode("{\"id\": 1, \"method\": ");
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == errc::parse_error);

        auto not_object = protocol::decode("[1,2,3]");
        REQUIRE_FALSE(not_object);
        CHECK(not_object.error().code == errc::parse_error);

        auto unknown_members = protocol::decode(R"({"id":1,"method":"initialize","extension":{"a":1}})");
        CHECK(unknown_members);
    }

    TEST_CASE("002: encoded frames always carry jsonrpc 2.0", "[002][protocol]") {
        auto req = protocol::encode_request(protocol::request_id{std::string{"abc"}}, "fs_read_text_file", R"({"path":"/a"})");
        CHECK(req.find(R"("jsonrpc":"2.0")") != std::string::npos);
        auto req_back = protocol::decode(req);
        REQUIRE(req_back);
        CHECK(protocol::classify(*req_back) == protocol::frame_kind::request);
        CHECK(protocol::to_string(*req_back->id) == "abc");
        CHECK(req_back->method == "fs_read_text_file");
        REQUIRE(req_back->params);
        CHECK(req_back->params->str == R"({"path":"/a"})");

        auto note = protocol::encode_notification("session_update", "");
        CHECK(note.find(R"("jsonrpc":"2.0")") != std::string::npos);
        CHECK(note.find(R"("id")") == std::string::npos);
        auto note_back = protocol::decode(note);
        REQUIRE(note_back);
        CHECK(protocol::classify(*note_back) == protocol::frame_kind::notification);
        REQUIRE(note_back->params);
        CHECK(note_back->params->str == "{}");

        auto res = protocol::encode_result(protocol::request_id{std::int64_t{3}}, R"({"stop_reason":"end_turn"})");
        CHECK(res.find(R"("jsonrpc":"2.0")") != std::string::npos);
        auto res_back = protocol::decode(res);
        REQUIRE(res_back);
        CHECK(protocol::classify(*res_back) == protocol::frame_kind::response);
        CHECK(std::get<std::int64_t>(*res_back->id) == 3);
        REQUIRE(res_back->result);
        CHECK(res_back->result->str == R"({"stop_reason":"end_turn"})");
        CHECK_FALSE(res_back->error);
    }

    TEST_CASE("002: error data that is not text still resolves the response", "[002][protocol]") {
        auto text = protocol::decode(R"({"jsonrpc":"2.0","id":9,"error":{"code":-32602,"message":"bad","data":"path"}})");
        REQUIRE(text);
        REQUIRE(text->error);
        CHECK(text->error->data == "path");

        auto structured = protocol::decode(
                R"({"jsonrpc":"2.0","id":"r1","error":{"code":-32005,"message":"gone","data":{"retry":false}}})");
        REQUIRE(structured);
        CHECK(protocol::classify(*structured) == protocol::frame_kind::response);
        CHECK(protocol::to_string(*structured->id) == "r1");
        REQUIRE(structured->error);
        CHECK(protocol::to_error(*structured->error).code == errc::connection_closed);
        CHECK(structured->error->message == "gone");
    }

    TEST_CASE("002: error responses map errc to rpc codes", "[002][protocol]") {
        auto denied = protocol::encode_error(protocol::request_id{std::int64_t{4}}, make_error(errc::access_denied, "nope"));
        auto decoded = protocol::decode(denied);
        REQUIRE(decoded);
        REQUIRE(decoded->error);
        CHECK(decoded->error->code == -32001);
        CHECK(decoded->error->message == "nope");

        auto parse = protocol::encode_error(std::nullopt, make_error(errc::parse_error, "bad json"));
        CHECK(parse.find(R"("id":null)") != std::string::npos);
        auto parse_back = protocol::decode(parse);
        REQUIRE(parse_back);
        CHECK_FALSE(parse_back->id);
        REQUIRE(parse_back->error);
        CHECK(parse_back->error->code == -32700);
        CHECK(parse_back->error->message == "bad json");

        for (auto code :
             {errc::parse_error,
              errc::invalid_request,
              errc::method_not_found,
              errc::invalid_params,
              errc::access_denied,
              errc::unknown_session,
              errc::unknown_client,
              errc::ownership_required,
              errc::connection_closed,
              errc::timeout,
              errc::session_busy}) {
            CHECK(from_rpc_code(rpc_code(code)) == code);
        }
        CHECK(rpc_code(errc::internal) == -32603);
        CHECK(from_rpc_code(-1) == errc::internal);
    }

    TEST_CASE("002: method tags", "[002][protocol]") {
        CHECK(protocol::parse_method("execute_code") == protocol::method::execute_code);
        CHECK(protocol::parse_method("list_sessions") == protocol::method::list_sessions);
        CHECK_FALSE(protocol::parse_method("tools/call"));
        CHECK_FALSE(protocol::parse_method(""));
        for (auto name :
             {"initialize",
              "new_session",
              "load_session",
              "fork_session",
              "set_session_mode",
              "prompt",
              "cancel",
              "release_session"}) {
            auto m = protocol::parse_method(name);
            REQUIRE(m);
            CHECK(protocol::to_string(*m) == name);
        }
    }

    TEST_CASE("002: payload helpers tolerate unknown keys", "[002][protocol]") {
        auto params = protocol::read_payload<schema::prompt_params>(
                R"({"session_id":"session-1","prompt":[{"type":"text","text":"hi"}],"meta":{}})");
        REQUIRE(params);
        CHECK(params->session_id == "session-1");
        REQUIRE(params->prompt.size() == 1);
        CHECK(params->prompt[0].text == "hi");

        auto wrong = protocol::read_payload<schema::prompt_params>(R"({"session_id":5})");
        REQUIRE_FALSE(wrong);
        CHECK(wrong.error().code == errc::invalid_params);

        auto json = protocol::write_payload(schema::new_session_result{.session_id = "session-2"});
        REQUIRE(json);
        CHECK(*json == R"({"session_id":"session-2"})");
    }

}  // namespace keel::test
