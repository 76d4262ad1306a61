// ZKCOMPLY - Subprocess Execution Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/util/process.h"
#include "zkcomply/util/logging.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zkcomply {
namespace util {

namespace {

constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{10};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const std::string& workdir) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argument list");
    }
    
    // Build the exec argument vector before forking
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    
    int outpipe[2];
    if (pipe(outpipe) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    
    auto start = std::chrono::steady_clock::now();
    
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(outpipe[0]);
        close(outpipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }
    
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);
        dup2(outpipe[1], STDOUT_FILENO);
        dup2(outpipe[1], STDERR_FILENO);
        close(outpipe[0]);
        close(outpipe[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            _exit(EXEC_FAILED_EXIT_CODE);
        }
        execvp(cargv[0], cargv.data());
        _exit(EXEC_FAILED_EXIT_CODE);
    }
    
    close(outpipe[1]);
    
    ProcessResult result;
    bool eof = false;
    char buffer[4096];
    
    while (!eof) {
        int waitMs = -1;
        if (timeout.count() > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed >= timeout) {
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>((timeout - elapsed).count());
        }
        
        struct pollfd pfd;
        pfd.fd = outpipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        
        int ready = poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN(LogCategory::PROVER) << "poll failed: " << std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;  // deadline re-checked at loop head
        }
        
        ssize_t n = read(outpipe[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        size_t room = MAX_PROCESS_OUTPUT - std::min(result.output.size(), MAX_PROCESS_OUTPUT);
        result.output.append(buffer, std::min(static_cast<size_t>(n), room));
    }
    
    close(outpipe[0]);
    
    // Output may close before the child exits; keep honouring the deadline
    int status = 0;
    pid_t waited = 0;
    if (!result.timedOut && timeout.count() > 0) {
        while ((waited = waitpid(pid, &status, WNOHANG)) == 0) {
            if (std::chrono::steady_clock::now() - start >= timeout) {
                result.timedOut = true;
                break;
            }
            std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }
    }
    
    if (result.timedOut) {
        // The child leads its own process group, so helpers it spawned die too
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }
    
    while (waited != pid) {
        waited = waitpid(pid, &status, 0);
        if (waited < 0 && errno != EINTR) {
            break;
        }
    }
    
    if (waited == pid) {
        result.exitCode = DecodeWaitStatus(status);
    }
    
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

} // namespace util
} // namespace zkcomply
