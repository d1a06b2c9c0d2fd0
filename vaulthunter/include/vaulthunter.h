/**
 * @file vaulthunter.h
 * @brief Vault Hunter C++ library - personal password lookup on top of a Vault KV store
 *
 * This is the ONLY header the user needs to include.
 *
 * Usage:
 *   #include <vaulthunter.h>
 *
 *   auto paths = vaulthunter::ConfigPaths::from_environment();
 *   vaulthunter::Client client(vaulthunter::Config::load(paths));
 *   client.login();
 *   for (const auto& path : client.search("mail")) {
 *       std::cout << path << std::endl;
 *   }
 */

#pragma once

#ifdef _WIN32
    #ifdef VAULTHUNTER_EXPORTS
        #define VAULTHUNTER_API __declspec(dllexport)
    #else
        #define VAULTHUNTER_API
    #endif
#else
    #define VAULTHUNTER_API
#endif

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace vaulthunter {

// ============================================================================
// EXCEPTION HIERARCHY
// ============================================================================

/**
 * @brief Discriminant shared by every Vault Hunter exception
 */
enum class ErrorKind {
    Transport,           ///< Server could not be reached (connection, TLS, timeout)
    Store,               ///< Server answered with an error payload or non-2xx status
    AuthRejected,        ///< Login refused (bad credentials)
    MalformedResponse,   ///< Response JSON has an unexpected shape
    NoCredentialSource,  ///< No cached token and no way to ask for a password
    Local                ///< Local files: cache, config, CA certificates
};

/**
 * @brief Base exception for all Vault Hunter errors
 */
class VAULTHUNTER_API VaultHunterError : public std::runtime_error {
public:
    VaultHunterError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown when an HTTP exchange could not be completed
 */
class VAULTHUNTER_API TransportError : public VaultHunterError {
public:
    explicit TransportError(const std::string& message = "Failed to reach server.")
        : VaultHunterError(ErrorKind::Transport, message) {}
};

/**
 * @brief Thrown when the store reports an error
 *
 * Carries the HTTP status of the exchange (0 if not relevant).
 */
class VAULTHUNTER_API StoreError : public VaultHunterError {
public:
    explicit StoreError(const std::string& message = "Vault error.", int status_code = 0)
        : VaultHunterError(ErrorKind::Store, message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * @brief Thrown when the login endpoint rejects the credentials
 */
class VAULTHUNTER_API AuthRejectedError : public VaultHunterError {
public:
    explicit AuthRejectedError(const std::string& message = "Authentication failed.")
        : VaultHunterError(ErrorKind::AuthRejected, message) {}
};

/**
 * @brief Thrown when a response is not JSON or misses expected fields
 */
class VAULTHUNTER_API MalformedResponseError : public VaultHunterError {
public:
    explicit MalformedResponseError(const std::string& message = "Malformed response from server.")
        : VaultHunterError(ErrorKind::MalformedResponse, message) {}
};

/**
 * @brief Thrown when no token is cached and no password can be obtained
 */
class VAULTHUNTER_API NoCredentialSourceError : public VaultHunterError {
public:
    explicit NoCredentialSourceError(const std::string& message = "No cached token and no password available.")
        : VaultHunterError(ErrorKind::NoCredentialSource, message) {}
};

/**
 * @brief Thrown on local I/O failures (cache file, config file, CA certificates)
 */
class VAULTHUNTER_API LocalError : public VaultHunterError {
public:
    explicit LocalError(const std::string& message = "Local error.")
        : VaultHunterError(ErrorKind::Local, message) {}
};

VAULTHUNTER_API const char* to_string(ErrorKind kind);

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @brief Session lifecycle states
 */
enum class SessionState {
    NoToken,        ///< No token held
    Probing,        ///< Cached token loaded, not validated yet
    Authenticated,  ///< Token validated or freshly issued
    Failed          ///< Interactive login failed
};

/**
 * @brief Server health as reported by /v1/sys/health
 */
enum class HealthStatus {
    Active,
    Standby,
    Recovery,
    Performance,
    Uninitialized,
    Sealed
};

/**
 * @brief Map a /v1/sys/health status code to a HealthStatus
 * @throws StoreError for codes outside the documented set
 */
VAULTHUNTER_API HealthStatus health_status_from_http(int status_code);

VAULTHUNTER_API const char* to_string(HealthStatus status);
VAULTHUNTER_API const char* to_string(SessionState state);

// ============================================================================
// DATA MODEL
// ============================================================================

/**
 * @brief Location in the secret tree
 *
 * An ordered list of non-empty components, none containing '/'.
 * The root path has no components and renders as "".
 */
class VAULTHUNTER_API Path {
public:
    static constexpr char SEPARATOR = '/';

    Path() = default;

    /**
     * @brief Build a path from its textual form
     *
     * Empty segments ("a//b", leading or trailing '/') are skipped.
     */
    static Path parse(const std::string& text);

    /**
     * @brief Append a component in place
     * @throws std::invalid_argument if the component is empty or contains '/'
     */
    void push(const std::string& component);

    /**
     * @brief Copy of this path with one more component
     */
    Path pushed(const std::string& component) const;

    const std::vector<std::string>& components() const { return components_; }
    bool is_root() const { return components_.empty(); }
    size_t depth() const { return components_.size(); }

    /// Last component, or "" for the root
    std::string leaf() const;

    std::string str() const;

    bool operator==(const Path& other) const { return components_ == other.components_; }
    bool operator!=(const Path& other) const { return !(*this == other); }
    bool operator<(const Path& other) const { return components_ < other.components_; }

private:
    std::vector<std::string> components_;
};

VAULTHUNTER_API std::ostream& operator<<(std::ostream& os, const Path& path);

/**
 * @brief One item of a directory listing
 */
struct VAULTHUNTER_API TreeEntry {
    enum class Kind {
        Key,  ///< Leaf secret
        Dir   ///< Sub-tree
    };

    Kind kind = Kind::Key;
    std::string name;

    bool is_dir() const { return kind == Kind::Dir; }
    bool is_key() const { return kind == Kind::Key; }

    /**
     * @brief Classify a raw listing name
     *
     * A trailing '/' marks a directory and is stripped from the name.
     */
    static TreeEntry from_listing(const std::string& raw);
};

/// Field name -> value payload stored at one leaf
using SecretRecord = std::map<std::string, std::string>;

/// Reserved field handled by the reveal workflow
VAULTHUNTER_API extern const char* const PASSWORD_FIELD;

/**
 * @brief One record of a full-tree export
 */
struct VAULTHUNTER_API ExportEntry {
    Path path;
    SecretRecord record;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * @brief Locations resolved once at startup from the environment
 */
struct VAULTHUNTER_API ConfigPaths {
    std::string config_file;   ///< JSON configuration file (may not exist)
    std::string cache_file;    ///< JSON runtime cache holding the token
    std::string user_name;     ///< Login name of the current user, used as default username

    /**
     * @brief Resolve paths from XDG_CONFIG_HOME, XDG_CACHE_HOME, HOME and USER
     */
    static ConfigPaths from_environment();
};

/**
 * @brief Client configuration
 */
struct VAULTHUNTER_API Config {
    std::vector<std::string> ca_certs;      ///< PEM files added as trust roots
    std::string end_point = "https://localhost/";  ///< Base URL of the Vault HTTP API
    std::string username;                   ///< userpass login name
    std::optional<std::string> clipboard_prog;     ///< Program reading the password on stdin
    int timeout_seconds = 30;               ///< Connect/read/write timeout
    int token_max_ttl = 3600 * 24;          ///< Requested token lifetime in seconds
    std::string cache_path;                 ///< Runtime cache file

    /**
     * @brief Username as used in URLs and login payloads
     *
     * The userpass backend case-folds usernames while storage paths are
     * case-sensitive, so every request uses the lower-cased form.
     */
    std::string lowercase_username() const;

    /**
     * @brief Clipboard command line, or nullopt if none is known for this OS
     */
    std::optional<std::vector<std::string>> clipboard_command() const;

    /**
     * @brief Defaults for the given environment
     */
    static Config defaults(const ConfigPaths& paths);

    /**
     * @brief Parse a JSON configuration document on top of the defaults
     * @throws LocalError if the text is not a JSON object or a key has the wrong type
     */
    static Config from_json(const std::string& text, const ConfigPaths& paths);

    /**
     * @brief Load the configuration file, or the defaults if it does not exist
     * @throws LocalError if the file exists but cannot be read or parsed
     */
    static Config load(const ConfigPaths& paths);
};

// ============================================================================
// CALLBACKS
// ============================================================================

/**
 * @brief Source of the login password
 * @param prompt Text to display
 * @return The password, or nullopt if no interactive input is available
 */
using PasswordPrompt = std::function<std::optional<std::string>(const std::string& prompt)>;

namespace transport {
class Transport;
}

// ============================================================================
// MAIN CLASS: Client
// ============================================================================

/**
 * @brief Vault Hunter client bound to one session
 *
 * Composes the session manager and the tree navigator. One token is
 * obtained by login() and reused for every operation.
 *
 * @example
 * vaulthunter::Client client(config);
 * client.login();
 * auto record = client.get(vaulthunter::Path::parse("web/github"));
 */
class VAULTHUNTER_API Client {
public:
    /**
     * @brief Construct a client talking HTTPS to config.end_point
     *
     * @param config Configuration (copied)
     * @param prompt Password source; defaults to a masked terminal prompt
     * @throws LocalError if a configured CA certificate cannot be loaded
     */
    explicit Client(const Config& config, PasswordPrompt prompt = {});

    /**
     * @brief Construct a client over an explicit transport
     */
    Client(const Config& config, std::unique_ptr<transport::Transport> transport,
           PasswordPrompt prompt);

    ~Client();

    // Move only (no copy)
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // ========================================================================
    // SESSION
    // ========================================================================

    /**
     * @brief Obtain a valid token
     *
     * Reuses the cached token if the server accepts it, otherwise prompts
     * for the password once and caches the new token.
     */
    void login();

    /**
     * @brief Load the cached token without validating it
     * @throws NoCredentialSourceError if no token is cached
     */
    void login_cached();

    /**
     * @brief Log in with an explicit password and cache the token
     */
    void login_with_password(const std::string& password);

    /**
     * @brief Revoke the token and erase it from the cache
     *
     * A token the server already considers invalid is not an error.
     */
    void logout();

    /**
     * @brief Revoke the cached token, if one can be loaded
     *
     * A missing or unreadable cache is not an error: nothing is revoked.
     *
     * @return true if a cached token was found and revoked
     */
    bool logout_cached();

    /// Pretty-printed body of /v1/auth/token/lookup-self
    std::string lookup_token();

    SessionState state() const;
    bool authenticated() const;

    // ========================================================================
    // SECRET TREE
    // ========================================================================

    std::vector<TreeEntry> list(const Path& path);
    SecretRecord get(const Path& path);

    /**
     * @brief Find every key whose name contains pattern (case-insensitive)
     *
     * Only ASCII letters are folded. Other characters, including accented
     * letters, must match exactly.
     */
    std::vector<Path> search(const std::string& pattern);

    /**
     * @brief Fetch every record in the tree
     */
    std::vector<ExportEntry> export_all();

    // ========================================================================
    // ADMIN
    // ========================================================================

    HealthStatus health();

    /// Pretty-printed body of /v1/sys/mounts
    std::string list_mounts();

    // ========================================================================
    // RUNTIME CACHE
    // ========================================================================

    /// Unix time of the last export, if recorded
    std::optional<long long> last_export_time();
    void set_last_export_time(long long unix_time);

    const Config& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Serialize an export as a JSON array of {"path", "fields"} objects
 */
VAULTHUNTER_API std::string export_to_json(const std::vector<ExportEntry>& entries);

// ============================================================================
// DEBUG MODE
// ============================================================================

/**
 * @brief Log level for debug output
 */
enum class LogLevel {
    None = 0,    ///< No logging (default)
    Error = 1,   ///< Only errors
    Warning = 2, ///< Errors and warnings
    Info = 3,    ///< Errors, warnings, and info
    Debug = 4    ///< All messages including debug
};

/**
 * @brief Enable or disable debug mode
 * @param enabled true to enable debug output to stderr
 *
 * When enabled, the library prints:
 * - Which authentication path is taken (cached, validated, interactive)
 * - Every request method and endpoint
 * - Traversal progress per level
 * Tokens and passwords are never printed.
 */
VAULTHUNTER_API void set_debug_mode(bool enabled);

/**
 * @brief Set the log level for debug output
 */
VAULTHUNTER_API void set_log_level(LogLevel level);

VAULTHUNTER_API bool is_debug_mode();
VAULTHUNTER_API LogLevel get_log_level();

// ============================================================================
// TERMINAL UTILITIES
// ============================================================================

/**
 * @brief Read a password from the terminal with echo disabled
 * @return The password, or nullopt on end of input
 */
VAULTHUNTER_API std::optional<std::string> read_password(const std::string& prompt);

/**
 * @brief Print a prompt and read one line (without the line terminator)
 * @throws LocalError on end of input
 */
VAULTHUNTER_API std::string prompt_line(const std::string& prompt);

/**
 * @brief Pipe content to the clipboard program
 *
 * @return false if no clipboard program is configured or it cannot be started
 * @throws LocalError if the program starts but exits with a failure status
 */
VAULTHUNTER_API bool copy_to_clipboard(const std::string& content, const Config& config);

// ============================================================================
// FILE UTILITIES
// ============================================================================

/**
 * @brief Replace a file's content, keeping it readable by the owner only
 *
 * A new file is created with mode 0600 before anything is written; an
 * existing one is switched to 0600 first.
 *
 * @throws LocalError if the file cannot be opened or written
 */
VAULTHUNTER_API void write_private_file(const std::string& path, const std::string& content);

} // namespace vaulthunter
