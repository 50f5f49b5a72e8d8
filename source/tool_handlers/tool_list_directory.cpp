#include "tool_handlers/tool_handlers.hpp"
#include "utils/utf8_sanitize.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using mcp_types::ToolFailureKind;
using mcp_types::ToolResult;

// file_time_type has no portable epoch before C++20; shift it onto system_clock.
static double modified_epoch_seconds(const fs::file_time_type &file_time) {
    auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration<double>(system_time.time_since_epoch()).count();
}

static ToolResult directory_failure(const std::string &directory_path, const std::error_code &error) {
    platform::FileResult result;
    result.error_kind = platform::classify_errno(error.value());
    result.error_message = "Cannot list directory '" + directory_path + "': " + error.message();
    return tool_handlers::file_failure(result);
}

static ToolResult handle_list_directory(const mcp_types::ValidatedArguments &arguments) {
    std::string directory_path = arguments.get_string("directory_path");
    bool include_hidden = arguments.get_boolean("include_hidden");
    if (directory_path.empty()) {
        directory_path = ".";
    }

    std::error_code error;
    fs::file_status status = fs::status(directory_path, error);
    if (status.type() == fs::file_type::not_found) {
        return ToolResult::fail(ToolFailureKind::NotFound, "Directory not found: " + directory_path,
                                {{"directory_path", directory_path}});
    }
    if (error) {
        return directory_failure(directory_path, error);
    }
    if (!fs::is_directory(status)) {
        return ToolResult::fail(ToolFailureKind::InvalidInput, "Path is not a directory: " + directory_path,
                                {{"directory_path", directory_path}});
    }

    fs::directory_iterator iterator(directory_path, error);
    if (error) {
        return directory_failure(directory_path, error);
    }

    std::vector<json> entries;
    for (const fs::directory_entry &entry : iterator) {
        std::string name = entry.path().filename().string();
        std::string path = entry.path().string();
        if (!include_hidden && !name.empty() && name[0] == '.') {
            continue;
        }

        std::error_code entry_error;
        bool is_file = entry.is_regular_file(entry_error);
        bool is_directory = entry.is_directory(entry_error);

        utf8_sanitize::sanitize(name);
        utf8_sanitize::sanitize(path);

        json item;
        item["name"] = name;
        item["path"] = path;
        item["is_file"] = is_file;
        item["is_directory"] = is_directory;
        item["size"] = nullptr;
        if (is_file) {
            std::uintmax_t size = entry.file_size(entry_error);
            if (!entry_error) {
                item["size"] = size;
            }
        }
        item["modified"] = nullptr;
        fs::file_time_type modified = entry.last_write_time(entry_error);
        if (!entry_error) {
            item["modified"] = modified_epoch_seconds(modified);
        }
        entries.push_back(std::move(item));
    }

    std::sort(entries.begin(), entries.end(), [](const json &left, const json &right) {
        return left["name"].get<std::string>() < right["name"].get<std::string>();
    });

    return ToolResult::ok(json(entries));
}

namespace tool_list_directory {

tool_registry::RegistrationResult register_tool(tool_registry::ToolRegistry &registry) {
    mcp_types::ToolDescriptor descriptor;
    descriptor.name = "list_directory";
    descriptor.description = "List the entries of a directory, sorted by name.";
    descriptor.parameters = {
        tool_handlers::optional_parameter("directory_path", mcp_types::ValueType::String, ".",
                                          "Directory to list"),
        tool_handlers::optional_parameter("include_hidden", mcp_types::ValueType::Boolean, false,
                                          "Include entries whose name starts with a dot"),
    };
    descriptor.return_type = mcp_types::ValueType::Array;
    return registry.register_tool(descriptor, handle_list_directory);
}

} // namespace tool_list_directory
