#ifndef MMCPS_STDIO_TRANSPORT_HPP
#define MMCPS_STDIO_TRANSPORT_HPP

// MCP stdio transport: JSON-RPC frames on an input stream, responses on an
// output stream (stdin/stdout in production).
//
// Two framings are supported:
//   newline         one JSON object per frame, found by brace counting with
//                   string/escape awareness, so pretty-printed JSON works too.
//   content-length  "Content-Length: N" header block, blank line, N bytes.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <set>
#include <string>

#include "mcp/call_dispatcher.hpp"
#include "protocol/json_rpc.hpp"

namespace stdio_transport {

using json = nlohmann::json;

enum class Framing {
    Newline,
    ContentLength
};

// Accepts "newline" and "content-length".
bool parse_framing(const std::string &text, Framing &output_framing);

const char *framing_name(Framing framing);

enum class ReadStatus {
    Frame,       // text holds one complete frame
    EndOfStream, // input closed (a partial frame is discarded)
    Oversized,   // frame exceeded the limit and was skipped
    Malformed    // framing itself was broken (bad header, stray text)
};

struct FrameReadResult {
    ReadStatus status = ReadStatus::EndOfStream;
    std::string text;
    std::string error_message;
};

// Read the next frame. Oversized frames are consumed and dropped so the
// stream stays in sync.
FrameReadResult read_frame(std::istream &input, Framing framing, std::size_t max_frame_bytes);

// Write one frame and flush.
void write_frame(std::ostream &output, Framing framing, const std::string &body);

struct StdioOptions {
    Framing framing = Framing::Newline;
    std::size_t max_message_bytes = 1048576;
    std::size_t max_in_flight = 8;
};

class StdioServer {
public:
    StdioServer(const call_dispatcher::Dispatcher &dispatcher, std::istream &input, std::ostream &output,
                StdioOptions options);
    ~StdioServer();

    StdioServer(const StdioServer &) = delete;
    StdioServer &operator=(const StdioServer &) = delete;

    // Serve frames until end of input or request_stop(), then wait for the
    // calls still in flight. Returns the number of frames processed.
    std::size_t run();

    // Stop reading after the current frame.
    void request_stop() { stop_requested = true; }

private:
    void process_frame(const std::string &frame_text);
    void start_concurrent_call(const json_rpc::Request &request);
    void finish_concurrent_call(const std::string &id_key);
    void wait_for_in_flight();
    void write_response(const json &response);

    const call_dispatcher::Dispatcher &dispatcher;
    std::istream &input;
    std::ostream &output;
    StdioOptions options;

    std::atomic<bool> stop_requested{false};

    // Serializes whole responses on the output stream.
    std::mutex output_mutex;

    // Ids (as their JSON text) of tools/call requests still running.
    std::mutex in_flight_mutex;
    std::condition_variable in_flight_changed;
    std::set<std::string> in_flight_ids;
    std::size_t running_workers = 0;
};

} // namespace stdio_transport

#endif // MMCPS_STDIO_TRANSPORT_HPP
