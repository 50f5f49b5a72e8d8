#include "platform/platform_abi.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace platform {

// Captured output per stream is capped; the rest is read and dropped.
static const std::size_t MAX_CAPTURED_BYTES = 8 * 1024 * 1024;

FileErrorKind classify_errno(int error_number) {
    switch (error_number) {
    case 0:
        return FileErrorKind::None;
    case ENOENT:
    case ENOTDIR:
        return FileErrorKind::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return FileErrorKind::PermissionDenied;
    case EISDIR:
        return FileErrorKind::WrongType;
    case EEXIST:
        return FileErrorKind::AlreadyExists;
    default:
        return FileErrorKind::Other;
    }
}

static FileResult file_failure(FileErrorKind kind, const std::string &message) {
    FileResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

static FileResult errno_failure(int error_number, const std::string &what) {
    return file_failure(classify_errno(error_number), what + ": " + strerror(error_number));
}

static FileResult file_success() {
    FileResult result;
    result.success = true;
    return result;
}

FileResult read_file_contents(const std::string &file_path, std::string &output_contents) {
    int file_descriptor = open(file_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file_descriptor < 0) {
        return errno_failure(errno, "Cannot open " + file_path);
    }

    struct stat file_status;
    if (fstat(file_descriptor, &file_status) != 0) {
        int saved_errno = errno;
        close(file_descriptor);
        return errno_failure(saved_errno, "Cannot stat " + file_path);
    }
    if (!S_ISREG(file_status.st_mode)) {
        close(file_descriptor);
        return file_failure(FileErrorKind::WrongType, "Path is not a file: " + file_path);
    }

    std::string contents;
    char buffer[65536];
    while (true) {
        ssize_t bytes_read = read(file_descriptor, buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            close(file_descriptor);
            return errno_failure(saved_errno, "Cannot read " + file_path);
        }
        if (bytes_read == 0) {
            break;
        }
        contents.append(buffer, static_cast<std::size_t>(bytes_read));
    }
    close(file_descriptor);

    output_contents = std::move(contents);
    return file_success();
}

FileResult write_file_contents(const std::string &file_path, const std::string &contents,
                               bool overwrite, bool &output_existed) {
    output_existed = false;

    struct stat existing_status;
    if (stat(file_path.c_str(), &existing_status) == 0) {
        if (S_ISDIR(existing_status.st_mode)) {
            return file_failure(FileErrorKind::WrongType, "Path is a directory: " + file_path);
        }
        output_existed = true;
        if (!overwrite) {
            return file_failure(FileErrorKind::AlreadyExists,
                                "File already exists: " + file_path + ". Use overwrite=true to replace it.");
        }
    }

    std::filesystem::path parent_directory = std::filesystem::path(file_path).parent_path();
    if (!parent_directory.empty()) {
        std::error_code error;
        std::filesystem::create_directories(parent_directory, error);
        if (error) {
            return file_failure(classify_errno(error.value()),
                                "Cannot create directory " + parent_directory.string() + ": " + error.message());
        }
    }

    // O_EXCL closes the window between the existence check and the open.
    int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    if (!overwrite) {
        flags |= O_EXCL;
    }
    int file_descriptor = open(file_path.c_str(), flags, 0644);
    if (file_descriptor < 0) {
        return errno_failure(errno, "Cannot open " + file_path + " for writing");
    }

    std::size_t total_written = 0;
    while (total_written < contents.size()) {
        ssize_t bytes_written = write(file_descriptor, contents.data() + total_written, contents.size() - total_written);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved_errno = errno;
            close(file_descriptor);
            return errno_failure(saved_errno, "Cannot write " + file_path);
        }
        total_written += static_cast<std::size_t>(bytes_written);
    }

    if (close(file_descriptor) != 0) {
        return errno_failure(errno, "Cannot close " + file_path);
    }
    return file_success();
}

// --- processes ---

static void set_nonblocking(int file_descriptor) {
    int flags = fcntl(file_descriptor, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(file_descriptor, F_SETFL, flags | O_NONBLOCK);
    }
}

// Read whatever is available; marks the stream closed on EOF.
static void drain_pipe(int file_descriptor, bool &is_open, std::string &output) {
    if (!is_open) {
        return;
    }
    char buffer[8192];
    while (true) {
        ssize_t bytes_read = read(file_descriptor, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            if (output.size() < MAX_CAPTURED_BYTES) {
                std::size_t room = MAX_CAPTURED_BYTES - output.size();
                output.append(buffer, std::min(room, static_cast<std::size_t>(bytes_read)));
            }
            continue;
        }
        if (bytes_read == 0) {
            is_open = false;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            is_open = false;
        }
        return;
    }
}

static int decode_wait_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

CommandResult run_command(const std::string &command, int timeout_milliseconds) {
    CommandResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe failed: ") + strerror(errno);
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe failed: ") + strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return result;
    }

    // The child must not read the server's stdin (it may be the MCP stream).
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    // Own process group, so a timeout kills everything the command started.
    posix_spawnattr_t spawn_attributes;
    posix_spawnattr_init(&spawn_attributes);
    posix_spawnattr_setflags(&spawn_attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&spawn_attributes, 0);

    std::vector<std::string> argv_strings = {"sh", "-c", command};
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, "/bin/sh", &file_actions, &spawn_attributes,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&spawn_attributes);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    if (spawn_status != 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }
    result.started = true;

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    auto start_time = std::chrono::steady_clock::now();
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int wait_status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        pollfd poll_descriptors[2];
        nfds_t descriptor_count = 0;
        if (stdout_open) {
            poll_descriptors[descriptor_count].fd = stdout_pipe[0];
            poll_descriptors[descriptor_count].events = POLLIN;
            poll_descriptors[descriptor_count].revents = 0;
            ++descriptor_count;
        }
        if (stderr_open) {
            poll_descriptors[descriptor_count].fd = stderr_pipe[0];
            poll_descriptors[descriptor_count].events = POLLIN;
            poll_descriptors[descriptor_count].revents = 0;
            ++descriptor_count;
        }
        if (descriptor_count > 0) {
            poll(poll_descriptors, descriptor_count, 50);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, result.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, result.stderr_text);

        if (!child_exited) {
            pid_t waited = waitpid(child_pid, &wait_status, WNOHANG);
            if (waited == child_pid) {
                child_exited = true;
            } else if (waited < 0 && errno != EINTR) {
                child_exited = true;
                wait_status = 0;
            }
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start_time)
                           .count();
        if (timeout_milliseconds > 0 && elapsed > timeout_milliseconds) {
            // Also catches background children still holding the pipes open.
            kill(-child_pid, SIGKILL);
            if (!child_exited) {
                waitpid(child_pid, &wait_status, 0);
                child_exited = true;
                result.timed_out = true;
            }
            drain_pipe(stdout_pipe[0], stdout_open, result.stdout_text);
            drain_pipe(stderr_pipe[0], stderr_open, result.stderr_text);
            break;
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    result.exit_code = decode_wait_status(wait_status);
    return result;
}

int current_process_id() {
    return static_cast<int>(getpid());
}

static bool read_text(const std::string &path, std::string &output) {
    std::ifstream file_stream(path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output = string_stream.str();
    return true;
}

static const char *describe_process_state(char state) {
    switch (state) {
    case 'R':
        return "running";
    case 'S':
        return "sleeping";
    case 'D':
        return "disk-sleep";
    case 'Z':
        return "zombie";
    case 'T':
        return "stopped";
    case 't':
        return "tracing-stop";
    case 'X':
    case 'x':
        return "dead";
    case 'I':
        return "idle";
    case 'W':
        return "waking";
    case 'P':
        return "parked";
    default:
        return "unknown";
    }
}

static double read_boot_time() {
    std::ifstream stat_stream("/proc/stat");
    std::string key;
    while (stat_stream >> key) {
        if (key == "btime") {
            double boot_time = 0.0;
            stat_stream >> boot_time;
            return boot_time;
        }
        stat_stream.ignore(1 << 20, '\n');
    }
    return 0.0;
}

FileResult read_process_info(int process_id, ProcessInfo &output_info) {
    if (process_id <= 0) {
        return file_failure(FileErrorKind::NotFound, "Process with PID " + std::to_string(process_id) + " not found");
    }
    const std::string process_directory = "/proc/" + std::to_string(process_id);

    std::string stat_text;
    if (!read_text(process_directory + "/stat", stat_text)) {
        return file_failure(FileErrorKind::NotFound, "Process with PID " + std::to_string(process_id) + " not found");
    }

    // "pid (comm) state ppid ..."; comm may itself contain spaces and parens.
    std::size_t name_open = stat_text.find('(');
    std::size_t name_close = stat_text.rfind(')');
    if (name_open == std::string::npos || name_close == std::string::npos || name_close < name_open) {
        return file_failure(FileErrorKind::Other, "Unexpected format in " + process_directory + "/stat");
    }

    ProcessInfo info;
    info.process_id = process_id;
    info.name = stat_text.substr(name_open + 1, name_close - name_open - 1);

    std::istringstream fields(stat_text.substr(name_close + 1));
    std::vector<std::string> tokens;
    std::string token;
    while (fields >> token) {
        tokens.push_back(token);
    }
    // tokens[0] is field 3 of proc(5).
    if (tokens.size() < 22) {
        return file_failure(FileErrorKind::Other, "Unexpected format in " + process_directory + "/stat");
    }

    const double clock_ticks = static_cast<double>(sysconf(_SC_CLK_TCK));
    const long page_size = sysconf(_SC_PAGESIZE);

    info.status = describe_process_state(tokens[0].empty() ? '?' : tokens[0][0]);
    info.cpu_seconds = (std::strtod(tokens[11].c_str(), nullptr) + std::strtod(tokens[12].c_str(), nullptr)) / clock_ticks;
    info.thread_count = std::atoi(tokens[17].c_str());
    info.start_time_epoch = read_boot_time() + std::strtod(tokens[19].c_str(), nullptr) / clock_ticks;
    info.virtual_bytes = std::strtoull(tokens[20].c_str(), nullptr, 10);
    info.resident_bytes = std::strtoull(tokens[21].c_str(), nullptr, 10) * static_cast<std::uint64_t>(page_size);

    std::string command_line_text;
    if (read_text(process_directory + "/cmdline", command_line_text)) {
        std::size_t begin = 0;
        while (begin < command_line_text.size()) {
            std::size_t end = command_line_text.find('\0', begin);
            if (end == std::string::npos) {
                end = command_line_text.size();
            }
            info.command_line.push_back(command_line_text.substr(begin, end - begin));
            begin = end + 1;
        }
    }

    output_info = std::move(info);
    return file_success();
}

// --- system statistics ---

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

static bool read_cpu_times(CpuTimes &output_times) {
    std::ifstream stat_stream("/proc/stat");
    std::string label;
    if (!(stat_stream >> label) || label != "cpu") {
        return false;
    }
    unsigned long long values[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    for (unsigned long long &value : values) {
        if (!(stat_stream >> value)) {
            break;
        }
    }
    output_times.total = 0;
    for (unsigned long long value : values) {
        output_times.total += value;
    }
    // idle + iowait
    output_times.idle = values[3] + values[4];
    return true;
}

static std::map<std::string, std::uint64_t> read_meminfo() {
    std::map<std::string, std::uint64_t> values;
    std::ifstream meminfo_stream("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo_stream, line)) {
        std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream value_stream(line.substr(colon + 1));
        std::uint64_t kilobytes = 0;
        value_stream >> kilobytes;
        values[line.substr(0, colon)] = kilobytes * 1024;
    }
    return values;
}

static double read_cpu_frequency() {
    std::ifstream cpuinfo_stream("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo_stream, line)) {
        if (line.compare(0, 7, "cpu MHz") == 0) {
            std::size_t colon = line.find(':');
            if (colon != std::string::npos) {
                return std::strtod(line.c_str() + colon + 1, nullptr);
            }
        }
    }
    return 0.0;
}

static NetworkStats read_network_stats() {
    NetworkStats stats;
    std::ifstream device_stream("/proc/net/dev");
    std::string line;
    int line_number = 0;
    while (std::getline(device_stream, line)) {
        if (++line_number <= 2) {
            continue; // headers
        }
        std::size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream counters(line.substr(colon + 1));
        std::uint64_t fields[10] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        for (std::uint64_t &field : fields) {
            if (!(counters >> field)) {
                break;
            }
        }
        stats.bytes_received += fields[0];
        stats.packets_received += fields[1];
        stats.bytes_sent += fields[8];
        stats.packets_sent += fields[9];
    }
    return stats;
}

FileResult read_system_stats(int sample_milliseconds, SystemStats &output_stats) {
    SystemStats stats;

    CpuTimes first_sample;
    CpuTimes second_sample;
    if (!read_cpu_times(first_sample)) {
        return file_failure(FileErrorKind::Other, "Cannot read /proc/stat");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(sample_milliseconds));
    if (!read_cpu_times(second_sample)) {
        return file_failure(FileErrorKind::Other, "Cannot read /proc/stat");
    }
    unsigned long long total_delta = second_sample.total - first_sample.total;
    unsigned long long idle_delta = second_sample.idle - first_sample.idle;
    if (total_delta > 0) {
        stats.cpu.percent = 100.0 * static_cast<double>(total_delta - idle_delta) / static_cast<double>(total_delta);
    }
    stats.cpu.count = static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN));
    if (getloadavg(stats.cpu.load_average, 3) < 0) {
        stats.cpu.load_average[0] = stats.cpu.load_average[1] = stats.cpu.load_average[2] = 0.0;
    }
    stats.cpu.frequency_mhz = read_cpu_frequency();

    std::map<std::string, std::uint64_t> meminfo = read_meminfo();
    if (meminfo.count("MemTotal") == 0) {
        return file_failure(FileErrorKind::Other, "Cannot read /proc/meminfo");
    }
    stats.memory.total = meminfo["MemTotal"];
    stats.memory.free = meminfo["MemFree"];
    stats.memory.available = meminfo.count("MemAvailable") > 0 ? meminfo["MemAvailable"] : stats.memory.free;
    stats.memory.used = stats.memory.total - std::min(stats.memory.total, stats.memory.available);
    if (stats.memory.total > 0) {
        stats.memory.percent = 100.0 * static_cast<double>(stats.memory.used) / static_cast<double>(stats.memory.total);
    }

    stats.swap.total = meminfo["SwapTotal"];
    stats.swap.free = meminfo["SwapFree"];
    stats.swap.used = stats.swap.total - std::min(stats.swap.total, stats.swap.free);
    if (stats.swap.total > 0) {
        stats.swap.percent = 100.0 * static_cast<double>(stats.swap.used) / static_cast<double>(stats.swap.total);
    }

    struct statvfs filesystem_status;
    if (statvfs("/", &filesystem_status) == 0) {
        const std::uint64_t block_size = filesystem_status.f_frsize;
        stats.disk.total = filesystem_status.f_blocks * block_size;
        stats.disk.free = filesystem_status.f_bavail * block_size;
        stats.disk.used = (filesystem_status.f_blocks - filesystem_status.f_bfree) * block_size;
        if (stats.disk.total > 0) {
            stats.disk.percent = 100.0 * static_cast<double>(stats.disk.used) / static_cast<double>(stats.disk.total);
        }
    }

    stats.network = read_network_stats();

    std::string uptime_text;
    if (read_text("/proc/uptime", uptime_text)) {
        stats.uptime_seconds = std::strtod(uptime_text.c_str(), nullptr);
    }

    output_stats = stats;
    return file_success();
}

FileResult read_system_identity(SystemIdentity &output_identity) {
    struct utsname system_name;
    if (uname(&system_name) != 0) {
        return errno_failure(errno, "uname failed");
    }
    output_identity.system = system_name.sysname;
    output_identity.node = system_name.nodename;
    output_identity.release = system_name.release;
    output_identity.version = system_name.version;
    output_identity.machine = system_name.machine;
    return file_success();
}

std::map<std::string, std::string> environment_variables() {
    std::map<std::string, std::string> variables;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const char *text = *entry;
        const char *equals = std::strchr(text, '=');
        if (equals == nullptr) {
            continue;
        }
        variables[std::string(text, static_cast<std::size_t>(equals - text))] = std::string(equals + 1);
    }
    return variables;
}

std::string executable_path() {
    char buffer[4096];
    ssize_t length = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (length <= 0) {
        return "";
    }
    return std::string(buffer, static_cast<std::size_t>(length));
}

} // namespace platform
