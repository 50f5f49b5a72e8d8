#include "transport/stdio_transport.hpp"
#include "mcp/error_normalizer.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "utils/server_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <system_error>
#include <thread>

namespace stdio_transport {

bool parse_framing(const std::string &text, Framing &output_framing) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (lowered == "newline" || lowered == "ndjson") {
        output_framing = Framing::Newline;
        return true;
    }
    if (lowered == "content-length") {
        output_framing = Framing::ContentLength;
        return true;
    }
    return false;
}

const char *framing_name(Framing framing) {
    return framing == Framing::ContentLength ? "content-length" : "newline";
}

static FrameReadResult make_frame(ReadStatus status, std::string text, std::string error_message = "") {
    FrameReadResult result;
    result.status = status;
    result.text = std::move(text);
    result.error_message = std::move(error_message);
    return result;
}

static FrameReadResult oversized_frame(std::size_t max_frame_bytes) {
    return make_frame(ReadStatus::Oversized, "",
                      "Message exceeds the maximum size of " + std::to_string(max_frame_bytes) + " bytes");
}

// Text that does not start with '{' runs to the end of its line. It is handed
// back as a frame so the parser reports it (arrays, garbage, ...).
static FrameReadResult read_stray_line(std::istream &input, char first_character, std::size_t max_frame_bytes) {
    std::string line(1, first_character);
    bool oversized = false;
    char character;
    while (input.get(character) && character != '\n') {
        if (line.size() >= max_frame_bytes) {
            oversized = true;
            continue;
        }
        line += character;
    }
    if (oversized) {
        return oversized_frame(max_frame_bytes);
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return make_frame(ReadStatus::Frame, line);
}

// Read a single complete JSON object.
// Uses brace-counting approach: tracks { } depth, respecting strings and escapes.
static FrameReadResult read_newline_frame(std::istream &input, std::size_t max_frame_bytes) {
    std::string buffer;
    std::size_t frame_size = 0;
    bool oversized = false;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
                frame_size = 1;
                continue;
            }
            // Whitespace and newlines between frames.
            if (std::isspace(static_cast<unsigned char>(character))) {
                continue;
            }
            return read_stray_line(input, character, max_frame_bytes);
        }

        ++frame_size;
        if (!oversized && frame_size > max_frame_bytes) {
            // Keep counting braces to find the end, but stop buffering.
            oversized = true;
            buffer.clear();
            buffer.shrink_to_fit();
        }
        if (!oversized) {
            buffer += character;
        }

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                if (oversized) {
                    return oversized_frame(max_frame_bytes);
                }
                return make_frame(ReadStatus::Frame, buffer);
            }
        }
    }

    // EOF reached without a complete message.
    return make_frame(ReadStatus::EndOfStream, "");
}

static std::string trim_ascii(const std::string &text) {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

// Discards count bytes in bounded chunks. A single ignore() cannot take a
// count above the streamsize range, and ignore(max) means "until EOF".
static void skip_bytes(std::istream &input, unsigned long long count) {
    const unsigned long long chunk_limit = 1 << 20;
    while (count > 0) {
        std::streamsize chunk = static_cast<std::streamsize>(std::min(count, chunk_limit));
        input.ignore(chunk);
        if (input.gcount() < chunk) {
            return;
        }
        count -= static_cast<unsigned long long>(chunk);
    }
}

static FrameReadResult read_content_length_frame(std::istream &input, std::size_t max_frame_bytes) {
    bool have_length = false;
    bool header_broken = false;
    unsigned long long content_length = 0;
    bool saw_header = false;

    std::string line;
    while (true) {
        if (!std::getline(input, line)) {
            return make_frame(ReadStatus::EndOfStream, "");
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (!saw_header) {
                continue; // blank lines between frames
            }
            break;
        }
        saw_header = true;

        std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            header_broken = true;
            continue;
        }
        std::string header_name = trim_ascii(line.substr(0, colon));
        std::transform(header_name.begin(), header_name.end(), header_name.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        if (header_name != "content-length") {
            continue; // Content-Type and friends are accepted and ignored.
        }

        std::string header_value = trim_ascii(line.substr(colon + 1));
        char *parse_end = nullptr;
        content_length = std::strtoull(header_value.c_str(), &parse_end, 10);
        if (header_value.empty() || !std::isdigit(static_cast<unsigned char>(header_value[0])) ||
            parse_end == nullptr || *parse_end != '\0') {
            header_broken = true;
            continue;
        }
        have_length = true;
    }

    if (header_broken || !have_length) {
        return make_frame(ReadStatus::Malformed, "", "Missing or invalid Content-Length header");
    }

    if (content_length > max_frame_bytes) {
        skip_bytes(input, content_length);
        return oversized_frame(max_frame_bytes);
    }

    std::string body(static_cast<std::size_t>(content_length), '\0');
    if (content_length > 0) {
        input.read(&body[0], static_cast<std::streamsize>(content_length));
        if (static_cast<unsigned long long>(input.gcount()) < content_length) {
            return make_frame(ReadStatus::EndOfStream, "");
        }
    }
    return make_frame(ReadStatus::Frame, body);
}

FrameReadResult read_frame(std::istream &input, Framing framing, std::size_t max_frame_bytes) {
    if (framing == Framing::ContentLength) {
        return read_content_length_frame(input, max_frame_bytes);
    }
    return read_newline_frame(input, max_frame_bytes);
}

void write_frame(std::ostream &output, Framing framing, const std::string &body) {
    if (framing == Framing::ContentLength) {
        output << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    } else {
        output << body << "\n";
    }
    output.flush();
}

StdioServer::StdioServer(const call_dispatcher::Dispatcher &dispatcher, std::istream &input,
                         std::ostream &output, StdioOptions options)
    : dispatcher(dispatcher), input(input), output(output), options(options) {
    if (this->options.max_in_flight == 0) {
        this->options.max_in_flight = 1;
    }
}

StdioServer::~StdioServer() {
    wait_for_in_flight();
}

void StdioServer::write_response(const json &response) {
    // Invalid UTF-8 from a tool must not take the transport down.
    std::string body = response.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(output_mutex);
    write_frame(output, options.framing, body);
}

void StdioServer::finish_concurrent_call(const std::string &id_key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex);
    in_flight_ids.erase(id_key);
    --running_workers;
    in_flight_changed.notify_all();
}

void StdioServer::wait_for_in_flight() {
    std::unique_lock<std::mutex> lock(in_flight_mutex);
    in_flight_changed.wait(lock, [this]() { return running_workers == 0; });
}

void StdioServer::start_concurrent_call(const json_rpc::Request &request) {
    const std::string id_key = request.id.dump();
    {
        std::unique_lock<std::mutex> lock(in_flight_mutex);
        in_flight_changed.wait(lock, [this]() { return in_flight_ids.size() < options.max_in_flight; });
        if (in_flight_ids.count(id_key) > 0) {
            lock.unlock();
            json detail;
            detail["id"] = request.id;
            write_response(error_normalizer::build_error_response(error_normalizer::decode_error(
                "Request id " + id_key + " is already in flight", request.id, false, detail)));
            return;
        }
        in_flight_ids.insert(id_key);
        ++running_workers;
    }

    try {
        std::thread worker([this, request, id_key]() {
            try {
                json response = mcp_dispatch::handle_request(dispatcher, request);
                if (!response.is_null()) {
                    write_response(response);
                }
            } catch (const std::exception &exception) {
                write_response(error_normalizer::build_error_response(
                    error_normalizer::from_exception(exception, "stdio worker", request.id)));
            }
            finish_concurrent_call(id_key);
        });
        worker.detach();
    } catch (const std::system_error &error) {
        finish_concurrent_call(id_key);
        write_response(error_normalizer::build_error_response(
            error_normalizer::from_exception(error, "starting stdio worker", request.id)));
    }
}

void StdioServer::process_frame(const std::string &frame_text) {
    mcp_dispatch::DecodedMessage decoded = mcp_dispatch::decode_message(frame_text);
    if (!decoded.success) {
        server_log::debug("Rejected frame: " + decoded.error.message);
        write_response(error_normalizer::build_error_response(decoded.error));
        return;
    }

    const json_rpc::Request &request = decoded.request;
    if (request.method == "tools/call" && !request.is_notification && !request.id.is_null()) {
        start_concurrent_call(request);
        return;
    }

    json response = mcp_dispatch::handle_request(dispatcher, request);
    if (!response.is_null()) {
        write_response(response);
    }
}

std::size_t StdioServer::run() {
    server_log::info(std::string("Stdio transport ready (") + framing_name(options.framing) + " framing)");

    std::size_t frames_processed = 0;
    while (!stop_requested) {
        FrameReadResult frame = read_frame(input, options.framing, options.max_message_bytes);
        if (frame.status == ReadStatus::EndOfStream) {
            server_log::info("EOF on stdin. Shutting down stdio transport.");
            break;
        }
        ++frames_processed;

        if (frame.status != ReadStatus::Frame) {
            json detail;
            detail["limit"] = options.max_message_bytes;
            server_log::warning(frame.error_message);
            write_response(error_normalizer::build_error_response(
                error_normalizer::decode_error(frame.error_message, nullptr, false, detail)));
            continue;
        }
        process_frame(frame.text);
    }

    wait_for_in_flight();
    return frames_processed;
}

} // namespace stdio_transport
