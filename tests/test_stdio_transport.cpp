// Tests for stdio framing and the stdio server loop, driven through string
// streams instead of the real stdin/stdout.

#include "transport/stdio_transport.hpp"
#include "test_support.hpp"

#include <chrono>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

using json = nlohmann::json;
using mcp_types::ToolResult;
using test_support::report;

namespace test_stdio_transport {

static void register_tools(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor wait;
    wait.name = "wait";
    mcp_types::ParameterSpec milliseconds;
    milliseconds.name = "ms";
    milliseconds.type = mcp_types::ValueType::Integer;
    wait.parameters = {milliseconds};
    registry.register_tool(wait, [](const mcp_types::ValidatedArguments &arguments) {
        std::this_thread::sleep_for(std::chrono::milliseconds(arguments.get_integer("ms")));
        return ToolResult::ok(arguments.get_integer("ms"));
    });
    registry.seal();
}

// Runs a server over the given input and returns one parsed JSON value per output line.
static std::vector<json> serve_lines(const std::string &input_text, stdio_transport::StdioOptions options) {
    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(2000));

    std::istringstream input(input_text);
    std::ostringstream output;
    {
        stdio_transport::StdioServer server(dispatcher, input, output, options);
        server.run();
    }

    std::vector<json> responses;
    std::istringstream lines(output.str());
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            responses.push_back(json::parse(line));
        }
    }
    return responses;
}

static bool test_read_newline_frames() {
    std::istringstream input("{\"a\":\"}\"}\n\n  {\"b\":{\"c\":1}}{\"d\":2}");
    stdio_transport::FrameReadResult first = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 1024);
    stdio_transport::FrameReadResult second = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 1024);
    stdio_transport::FrameReadResult third = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 1024);
    stdio_transport::FrameReadResult end = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 1024);
    bool success = first.status == stdio_transport::ReadStatus::Frame && first.text == "{\"a\":\"}\"}" &&
                   second.text == "{\"b\":{\"c\":1}}" && third.text == "{\"d\":2}" &&
                   end.status == stdio_transport::ReadStatus::EndOfStream;
    return report(success, "Newline framing splits objects, respecting braces inside strings");
}

static bool test_read_content_length_frames() {
    std::string body = "{\"jsonrpc\":\"2.0\"}";
    std::istringstream input("Content-Length: " + std::to_string(body.size()) +
                             "\r\nContent-Type: application/json\r\n\r\n" + body + "Content-Length: x\r\n\r\n");
    stdio_transport::FrameReadResult first =
        stdio_transport::read_frame(input, stdio_transport::Framing::ContentLength, 1024);
    stdio_transport::FrameReadResult second =
        stdio_transport::read_frame(input, stdio_transport::Framing::ContentLength, 1024);
    bool success = first.status == stdio_transport::ReadStatus::Frame && first.text == body &&
                   second.status == stdio_transport::ReadStatus::Malformed;
    return report(success, "Content-Length framing reads the body and rejects bad headers");
}

static bool test_oversized_frame() {
    std::string big = "{\"x\":\"" + std::string(200, 'a') + "\"}\n{\"y\":1}";
    std::istringstream input(big);
    stdio_transport::FrameReadResult first = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 64);
    stdio_transport::FrameReadResult second = stdio_transport::read_frame(input, stdio_transport::Framing::Newline, 64);
    bool success = first.status == stdio_transport::ReadStatus::Oversized &&
                   second.status == stdio_transport::ReadStatus::Frame && second.text == "{\"y\":1}";
    return report(success, "Oversized frame is skipped and the next frame still reads");
}

static bool test_oversized_content_length() {
    // Longer than one skip chunk, so the drain has to loop and stop exactly at the next frame.
    std::string big(3 * 1024 * 1024 + 17, 'a');
    std::istringstream skipped("Content-Length: " + std::to_string(big.size()) + "\r\n\r\n" + big +
                               "Content-Length: 2\r\n\r\n{}");
    stdio_transport::FrameReadResult first =
        stdio_transport::read_frame(skipped, stdio_transport::Framing::ContentLength, 1024);
    stdio_transport::FrameReadResult second =
        stdio_transport::read_frame(skipped, stdio_transport::Framing::ContentLength, 1024);

    // A length past the streamsize range claims the rest of the stream.
    std::istringstream endless("Content-Length: 18446744073709551615\r\n\r\n"
                               "Content-Length: 2\r\n\r\n{}");
    stdio_transport::FrameReadResult huge =
        stdio_transport::read_frame(endless, stdio_transport::Framing::ContentLength, 1024);
    stdio_transport::FrameReadResult after_huge =
        stdio_transport::read_frame(endless, stdio_transport::Framing::ContentLength, 1024);

    bool success = first.status == stdio_transport::ReadStatus::Oversized &&
                   second.status == stdio_transport::ReadStatus::Frame && second.text == "{}" &&
                   huge.status == stdio_transport::ReadStatus::Oversized &&
                   after_huge.status == stdio_transport::ReadStatus::EndOfStream;
    return report(success, "Oversized Content-Length bodies are skipped without losing frame sync");
}

static bool test_write_frame() {
    std::ostringstream newline_output;
    std::ostringstream header_output;
    stdio_transport::write_frame(newline_output, stdio_transport::Framing::Newline, "{}");
    stdio_transport::write_frame(header_output, stdio_transport::Framing::ContentLength, "{}");
    return report(newline_output.str() == "{}\n" && header_output.str() == "Content-Length: 2\r\n\r\n{}",
                  "Frames are written in the configured framing");
}

static bool test_server_session() {
    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"wait","arguments":{"ms":1}}})" "\n"
        "not json at all\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"missing"}})" "\n";
    std::vector<json> responses = serve_lines(input, stdio_transport::StdioOptions());

    std::map<std::string, json> by_id;
    for (const json &response : responses) {
        by_id[response["id"].dump()] = response;
    }
    bool success = responses.size() == 4 && by_id["1"].contains("result") &&
                   by_id["2"]["result"]["structuredContent"]["result"] == 1 &&
                   by_id["null"]["error"]["code"] == -32700 && by_id["3"]["error"]["code"] == -32601;
    return report(success, "Session answers requests, skips notifications and reports bad frames");
}

static bool test_calls_overlap() {
    std::string input =
        R"({"jsonrpc":"2.0","id":"slow","method":"tools/call","params":{"name":"wait","arguments":{"ms":300}}})" "\n"
        R"({"jsonrpc":"2.0","id":"fast","method":"tools/call","params":{"name":"wait","arguments":{"ms":1}}})" "\n";
    std::vector<json> responses = serve_lines(input, stdio_transport::StdioOptions());
    bool success = responses.size() == 2 && responses[0]["id"] == "fast" && responses[1]["id"] == "slow";
    return report(success, "A fast call is answered while a slow one is still running");
}

static bool test_duplicate_in_flight_id() {
    std::string input =
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"wait","arguments":{"ms":300}}})" "\n"
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"wait","arguments":{"ms":1}}})" "\n";
    std::vector<json> responses = serve_lines(input, stdio_transport::StdioOptions());
    bool success = responses.size() == 2 && responses[0]["error"]["code"] == -32600 &&
                   responses[1]["result"]["structuredContent"]["result"] == 300;
    return report(success, "A second call reusing an in-flight id is rejected");
}

static bool test_content_length_session() {
    std::string body = R"({"jsonrpc":"2.0","id":7,"method":"ping"})";
    std::string input = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;

    tool_registry::ToolRegistry registry;
    register_tools(registry);
    call_dispatcher::Dispatcher dispatcher(registry, std::chrono::milliseconds(1000));
    stdio_transport::StdioOptions options;
    options.framing = stdio_transport::Framing::ContentLength;

    std::istringstream input_stream(input);
    std::ostringstream output;
    stdio_transport::StdioServer server(dispatcher, input_stream, output, options);
    std::size_t frames = server.run();

    std::string text = output.str();
    std::size_t separator = text.find("\r\n\r\n");
    bool success = frames == 1 && text.compare(0, 16, "Content-Length: ") == 0 && separator != std::string::npos &&
                   json::parse(text.substr(separator + 4))["id"] == 7;
    return report(success, "Content-Length session answers with a Content-Length frame");
}

static bool test_parse_framing() {
    stdio_transport::Framing framing = stdio_transport::Framing::Newline;
    bool header = stdio_transport::parse_framing("Content-Length", framing) &&
                  framing == stdio_transport::Framing::ContentLength;
    bool ndjson = stdio_transport::parse_framing("ndjson", framing) && framing == stdio_transport::Framing::Newline;
    bool unknown = !stdio_transport::parse_framing("lsp", framing);
    return report(header && ndjson && unknown, "Framing names parse case-insensitively");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_read_newline_frames();
    all_passed &= test_read_content_length_frames();
    all_passed &= test_oversized_frame();
    all_passed &= test_oversized_content_length();
    all_passed &= test_write_frame();
    all_passed &= test_server_session();
    all_passed &= test_calls_overlap();
    all_passed &= test_duplicate_in_flight_id();
    all_passed &= test_content_length_session();
    all_passed &= test_parse_framing();
    return all_passed;
}

} // namespace test_stdio_transport
