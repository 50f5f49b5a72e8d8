#ifndef MMCPS_PLATFORM_ABI_HPP
#define MMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace platform {

// How a file operation failed, in terms a tool can report.
enum class FileErrorKind {
    None,
    NotFound,
    PermissionDenied,
    WrongType,     // directory where a file was expected, or the reverse
    AlreadyExists,
    Other
};

FileErrorKind classify_errno(int error_number);

struct FileResult {
    bool success = false;
    FileErrorKind error_kind = FileErrorKind::None;
    std::string error_message;
};

// Read the entire contents of a regular file (bytes, no newline translation).
FileResult read_file_contents(const std::string &file_path, std::string &output_contents);

// Write contents, creating missing parent directories. Refuses to replace an
// existing file unless overwrite is set; output_existed reports whether one
// was there.
FileResult write_file_contents(const std::string &file_path, const std::string &contents,
                               bool overwrite, bool &output_existed);

// Result of running a shell command to completion.
struct CommandResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1; // 128 + signal number when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;
};

// Run "/bin/sh -c <command>" in the current directory, capturing stdout and
// stderr. The child is killed when timeout_milliseconds elapses.
CommandResult run_command(const std::string &command, int timeout_milliseconds);

int current_process_id();

struct ProcessInfo {
    int process_id = -1;
    std::string name;
    std::string status;
    std::uint64_t resident_bytes = 0;
    std::uint64_t virtual_bytes = 0;
    int thread_count = 0;
    double start_time_epoch = 0.0; // seconds since the Unix epoch
    double cpu_seconds = 0.0;      // user + system time consumed so far
    std::vector<std::string> command_line;
};

// False with error_kind NotFound when no such process exists.
FileResult read_process_info(int process_id, ProcessInfo &output_info);

struct MemoryStats {
    std::uint64_t total = 0;
    std::uint64_t available = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    double percent = 0.0;
};

struct SwapStats {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    double percent = 0.0;
};

struct CpuStats {
    int count = 0;
    double percent = 0.0; // busy share over the sampling interval
    double load_average[3] = {0.0, 0.0, 0.0};
    double frequency_mhz = 0.0; // 0 when unknown
};

struct DiskStats {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    double percent = 0.0;
};

struct NetworkStats {
    std::uint64_t bytes_sent = 0;
    std::uint64_t bytes_received = 0;
    std::uint64_t packets_sent = 0;
    std::uint64_t packets_received = 0;
};

struct SystemStats {
    CpuStats cpu;
    MemoryStats memory;
    SwapStats swap;
    DiskStats disk;
    NetworkStats network;
    double uptime_seconds = 0.0;
};

// Sample CPU usage over sample_milliseconds and read everything else once.
FileResult read_system_stats(int sample_milliseconds, SystemStats &output_stats);

struct SystemIdentity {
    std::string system;   // "Linux"
    std::string node;
    std::string release;
    std::string version;
    std::string machine;  // "x86_64"
};

FileResult read_system_identity(SystemIdentity &output_identity);

// The whole process environment.
std::map<std::string, std::string> environment_variables();

// Absolute path of the running executable, empty when unknown.
std::string executable_path();

} // namespace platform

#endif // MMCPS_PLATFORM_ABI_HPP
