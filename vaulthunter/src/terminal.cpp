/**
 * @file terminal.cpp
 * @brief Password prompt, line prompt and clipboard copy
 */

#include "../include/vaulthunter.h"
#include "log.h"

#include <iostream>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

namespace vaulthunter {

namespace {

void strip_line_end(std::string& line) {
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

#if !defined(_WIN32)
/**
 * @brief Turns terminal echo off for its lifetime (no-op if stdin is not a tty)
 */
class EchoGuard {
public:
    EchoGuard() {
        if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios tty = saved_;
            tty.c_lflag &= ~ECHO;
            active_ = tcsetattr(STDIN_FILENO, TCSANOW, &tty) == 0;
        }
    }

    ~EchoGuard() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

/**
 * @brief Run argv with input on its stdin
 * @return Exit status as returned by waitpid, or -1 if the process could not be created
 */
int run_writer_with_stdin(const std::vector<std::string>& argv, const std::string& input) {
    int pipefd[2];
    if (pipe(pipefd) != 0) return -1;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return -1;
    }

    if (pid == 0) {
        // child: replace stdin with read end, silence output
        dup2(pipefd[0], STDIN_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127);
    }

    // parent: write input; a child that died early must not kill us with SIGPIPE
    close(pipefd[0]);
    auto previous = signal(SIGPIPE, SIG_IGN);

    size_t remaining = input.size();
    const char* ptr = input.data();
    while (remaining > 0) {
        ssize_t w = write(pipefd[1], ptr, remaining);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) break;
        ptr += w;
        remaining -= static_cast<size_t>(w);
    }
    close(pipefd[1]);
    signal(SIGPIPE, previous);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}
#endif

} // namespace

// ============================================================================
// PROMPTS
// ============================================================================

std::optional<std::string> read_password(const std::string& prompt) {
    std::cerr << prompt << std::flush;

    std::string password;
    bool got_line = false;
    {
#if !defined(_WIN32)
        EchoGuard guard;
#endif
        got_line = static_cast<bool>(std::getline(std::cin, password));
    }
    // The newline typed by the user was not echoed
    std::cerr << std::endl;

    if (!got_line) {
        return std::nullopt;
    }
    strip_line_end(password);
    return password;
}

std::string prompt_line(const std::string& prompt) {
    std::cout << prompt << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        throw LocalError("Failed to read line");
    }
    strip_line_end(line);
    return line;
}

// ============================================================================
// CLIPBOARD
// ============================================================================

bool copy_to_clipboard(const std::string& content, const Config& config) {
    auto command = config.clipboard_command();
    if (!command) {
        return false;
    }

#if !defined(_WIN32)
    int status = run_writer_with_stdin(*command, content);
    if (status < 0) {
        LOG_WARN("CLIPBOARD", std::string("Failed to start ") + command->front() + ": " +
                 std::strerror(errno));
        return false;
    }
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            return true;
        }
        if (code == 127) {
            LOG_WARN("CLIPBOARD", command->front() + " not found");
            return false;
        }
        throw LocalError("Clipboard program failed with code: " + std::to_string(code));
    }
    throw LocalError("Clipboard program failed with code: ??");
#else
    (void)content;
    return false;
#endif
}

} // namespace vaulthunter
