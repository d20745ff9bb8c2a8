#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Error taxonomy shared by every layer.
enum class ErrorKind {
    None,
    Authentication,               // bad credentials
    Unreachable,                  // DNS/TCP failure or connect timeout
    Protocol,                     // handshake or channel setup failure
    NotConnected,                 // no live session for the id
    RemoteIO,                     // permission/path errors from SFTP or exec
    SessionClosed,                // session torn down while work was in flight
    MissingDependency,            // remote tool absent and not installed
    UnsupportedOperation,         // client-side policy rejection
    CrossSessionPasteUnsupported, // paste target differs from clipboard source
    Cancelled,                    // user cancelled a transfer selection
    Other,                        // local failures (config, filesystem)
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Other};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Other};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

using SessionId = std::string;

// Connection parameters for one remote host.
struct HostConfig {
    std::string name;                            // profile name from config.yaml
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> passphrase;
    int timeout = 20;                            // connect timeout, seconds
    int keepalive_interval = 30;                 // seconds, 0 disables
};

struct TerminalSize {
    int rows = 24;
    int cols = 80;
    std::string type = "xterm-256color";
};

// One remote directory entry. Listings are replaced wholesale on refresh.
struct FileEntry {
    std::string name;
    bool is_directory = false;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;                      // full st_mode bits
    std::int64_t modified_at = 0;                // epoch seconds
};

// A remote path reference carried by the clipboard and batch operations.
struct RemoteItem {
    std::string path;
    std::string name;
    bool is_directory = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
