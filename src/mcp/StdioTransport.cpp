#include "mcp/StdioTransport.h"
#include "mcp/McpErrors.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cctype>
#include <cstring>
#include <vector>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>

extern char** environ;

namespace {
const std::size_t kStderrTailLines = 20;
const int kPollIntervalMs = 100;

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key)) continue;
        out.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
} // namespace

StdioTransport::~StdioTransport() {
    stop();
}

void StdioTransport::start(const ServerCommand& cmd, LineHandler lineHandler, ExitHandler exitHandler) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    if (childPid > 0 || stopped) {
        throw LaunchError("Transport already used; create a new transport per connection");
    }
    if (cmd.command.empty()) {
        throw LaunchError("No server command configured");
    }

    ignoreSigpipe();
    command = cmd;
    encoder = MessageFramer(cmd.framing);
    onLine = std::move(lineHandler);
    onExit = std::move(exitHandler);

    // argv/envp are prepared before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> args;
    args.push_back(cmd.command);
    args.insert(args.end(), cmd.args.begin(), cmd.args.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = buildEnvironment(cmd.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& entry : envStrings) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw LaunchError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw LaunchError(std::string("Fork failed: ") + std::strerror(err));
    }

    if (pid == 0) { // Child
        setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);
    childPid = pid;
    writeFd = inPipe[1];
    readFd = outPipe[0];
    errFd = errPipe[0];

    // The status pipe closes on a successful exec and carries errno otherwise.
    int execErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        reap(true);
        closeFds();
        childPid = -1;
        stopped = true;
        throw LaunchError("Failed to launch '" + cmd.command + "': " + std::strerror(execErrno));
    }

    Logger::getInstance().debug("Started server process " + std::to_string(childPid) + ": " + cmd.command);

    if (waitForExit(cmd.startupGrace)) {
        drainStderr(std::chrono::milliseconds(200));
        int code;
        {
            std::lock_guard<std::mutex> lock(procMutex);
            code = exitCode;
        }
        closeFds();
        childPid = -1;
        stopped = true;
        throw LaunchError(describeLaunchFailure(cmd.command, code, stderrTail()));
    }

    lastActivityMs = nowMs();
    readerThread = std::thread(&StdioTransport::receiveLoop, this);
    stderrThread = std::thread(&StdioTransport::stderrLoop, this);
}

void StdioTransport::send(const std::string& payload) {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (writeFd < 0) {
        throw BrokenPipeError("Server input stream is closed");
    }
    std::string full = encoder.frame(payload);
    const char* data = full.c_str();
    std::size_t total = 0;
    while (total < full.size()) {
        ssize_t n = write(writeFd, data + total, full.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw BrokenPipeError(std::string("Failed to write to server: ") + std::strerror(errno));
        }
        total += static_cast<std::size_t>(n);
    }
}

void StdioTransport::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    if (stopped) return;
    stopped = true;
    stopRequested = true;

    {
        std::lock_guard<std::mutex> lock(writeMutex);
        closeFd(writeFd);
    }

    if (childPid > 0 && !reap(false)) {
        signalGroup(SIGTERM);
        if (!waitForExit(command.stopGrace)) {
            Logger::getInstance().warn("Server process " + std::to_string(childPid) +
                                       " did not terminate gracefully, force killing");
            signalGroup(SIGKILL);
            reap(true);
        }
    }

    for (std::thread* t : {&readerThread, &stderrThread}) {
        if (!t->joinable()) continue;
        if (t->get_id() == std::this_thread::get_id()) {
            t->detach();
        } else {
            t->join();
        }
    }
    closeFds();
}

bool StdioTransport::isAlive() const {
    if (childPid <= 0 || stopRequested) return false;
    return !reap(false);
}

std::chrono::system_clock::time_point StdioTransport::lastActivity() const {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(lastActivityMs.load()));
}

std::string StdioTransport::stderrTail() const {
    std::lock_guard<std::mutex> lock(stderrMutex);
    std::string out;
    for (const auto& line : stderrLines) {
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}

void StdioTransport::receiveLoop() {
    MessageFramer decoder(command.framing);
    char temp[4096];
    struct pollfd pfd;
    pfd.fd = readFd;
    pfd.events = POLLIN;

    while (!stopRequested) {
        int ret = poll(&pfd, 1, kPollIntervalMs);
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) continue;
        if (ret < 0) break;

        ssize_t n = read(readFd, temp, sizeof(temp));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        lastActivityMs = nowMs();
        decoder.feed(temp, static_cast<std::size_t>(n));
        std::string message;
        while (decoder.next(message)) {
            try {
                onLine(message);
            } catch (const std::exception& e) {
                Logger::getInstance().error(std::string("Error handling server message: ") + e.what());
            }
        }
    }
    if (stopRequested) return;

    // Output closed: the process is exiting, or is useless without stdout.
    if (!waitForExit(command.stopGrace)) {
        Logger::getInstance().warn("Server closed its output but is still running, killing it");
        signalGroup(SIGKILL);
        reap(true);
    }
    if (stopRequested) return;

    int code;
    {
        std::lock_guard<std::mutex> lock(procMutex);
        code = exitCode;
    }
    Logger::getInstance().warn("Server process exited with code " + std::to_string(code));
    if (onExit) onExit(code);
}

void StdioTransport::stderrLoop() {
    std::string buffer;
    char temp[1024];
    struct pollfd pfd;
    pfd.fd = errFd;
    pfd.events = POLLIN;

    while (!stopRequested) {
        int ret = poll(&pfd, 1, kPollIntervalMs);
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) continue;
        if (ret < 0) break;

        ssize_t n = read(errFd, temp, sizeof(temp));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(temp, temp + n);

        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            Logger::getInstance().debug("[server] " + line);
            rememberStderr(line);
        }
    }
    if (!buffer.empty()) rememberStderr(buffer);
}

bool StdioTransport::reap(bool block) const {
    std::lock_guard<std::mutex> lock(procMutex);
    if (exited || childPid <= 0) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(childPid, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;
    exited = true;
    exitCode = r == childPid ? decodeStatus(status) : -1;
    return true;
}

bool StdioTransport::waitForExit(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void StdioTransport::signalGroup(int sig) const {
    std::lock_guard<std::mutex> lock(procMutex);
    if (exited || childPid <= 0) return;
    // Negative pid targets the child's process group.
    if (kill(-childPid, sig) != 0) {
        kill(childPid, sig);
    }
}

void StdioTransport::drainStderr(std::chrono::milliseconds timeout) {
    if (errFd < 0) return;
    std::string buffer;
    char temp[1024];
    struct pollfd pfd;
    pfd.fd = errFd;
    pfd.events = POLLIN;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int ret = poll(&pfd, 1, kPollIntervalMs);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;
        ssize_t n = read(errFd, temp, sizeof(temp));
        if (n <= 0) break;
        buffer.append(temp, temp + n);
    }
    std::size_t start = 0;
    while (start < buffer.size()) {
        auto newline = buffer.find('\n', start);
        std::string line = buffer.substr(start, newline == std::string::npos ? std::string::npos : newline - start);
        if (!line.empty()) rememberStderr(line);
        if (newline == std::string::npos) break;
        start = newline + 1;
    }
}

void StdioTransport::closeFds() {
    {
        std::lock_guard<std::mutex> lock(writeMutex);
        closeFd(writeFd);
    }
    closeFd(readFd);
    closeFd(errFd);
}

void StdioTransport::rememberStderr(const std::string& line) {
    std::lock_guard<std::mutex> lock(stderrMutex);
    stderrLines.push_back(line);
    while (stderrLines.size() > kStderrTailLines) stderrLines.pop_front();
}

std::string StdioTransport::describeLaunchFailure(const std::string& command, int exitCode, const std::string& stderrText) {
    std::string msg = "Server process '" + command + "' failed to start (exit code: " + std::to_string(exitCode) + ")";
    if (!stderrText.empty()) {
        msg += "\nError: " + stderrText;
    }

    std::string lower = stderrText;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (exitCode == 127 || lower.find("not found") != std::string::npos) {
        msg += "\nSolution: check that the server command is installed and on PATH";
    } else if (lower.find("permission denied") != std::string::npos) {
        msg += "\nSolution: check file permissions of the server command";
    } else if (lower.find("token") != std::string::npos) {
        msg += "\nSolution: check that GITHUB_TOKEN is valid and has the required permissions";
    }
    return msg;
}
