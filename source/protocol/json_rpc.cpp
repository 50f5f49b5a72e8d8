#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

static bool is_valid_id(const json &id) {
    return id.is_null() || id.is_string() || id.is_number();
}

static DecodeResult decode_failure(const std::string &message, const json &error_id) {
    DecodeResult result;
    result.success = false;
    result.error_message = message;
    result.error_id = error_id;
    return result;
}

DecodeResult decode_request(const json &message) {
    if (!message.is_object()) {
        return decode_failure("Request must be a JSON object", nullptr);
    }

    // Answer with the caller's id whenever it is usable, even if the rest is broken.
    json request_id = nullptr;
    if (message.contains("id") && is_valid_id(message["id"])) {
        request_id = message["id"];
    }

    if (message.contains("id") && !is_valid_id(message["id"])) {
        return decode_failure("Invalid 'id': must be a string, number or null", nullptr);
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return decode_failure("Missing or invalid 'jsonrpc' version (expected \"2.0\")", request_id);
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return decode_failure("Missing or invalid 'method'", request_id);
    }
    if (message.contains("params") && !message["params"].is_object() && !message["params"].is_null()) {
        return decode_failure("'params' must be an object", request_id);
    }

    DecodeResult result;
    result.request.method = message["method"].get<std::string>();
    result.request.is_notification = is_notification(message);
    result.request.id = request_id;
    if (message.contains("params") && message["params"].is_object()) {
        result.request.params = message["params"];
    }

    if (result.request.method == "tools/call") {
        const json &params = result.request.params;
        if (!params.contains("name") || !params["name"].is_string()) {
            return decode_failure("Missing or invalid 'name' in tools/call", request_id);
        }
        if (params.contains("arguments") && !params["arguments"].is_object() && !params["arguments"].is_null()) {
            return decode_failure("'arguments' in tools/call must be an object", request_id);
        }
    }

    result.success = true;
    return result;
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc
