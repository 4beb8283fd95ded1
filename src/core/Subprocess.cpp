#include "Subprocess.h"
#include "Logging.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sku_scan {

std::string join_argv(const std::vector<std::string>& argv){
    std::string out;
    for(const auto& a : argv){ if(!out.empty()) out.push_back(' '); out += a; }
    return out;
}

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_child(pid_t pid){
    // Child called setpgid(0,0); take down helpers it spawned (sudo, ssh mux) too
    if(kill(-pid, SIGKILL) != 0) kill(pid, SIGKILL);
}

int wait_child(pid_t pid){
    int status = 0;
    while(waitpid(pid, &status, 0) < 0){
        if(errno != EINTR) return -1;
    }
    if(WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

}

CommandResult SubprocessRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout){
    CommandResult result;
    if(argv.empty()){ result.spawn_failed = true; return result; }

    // Everything the child touches is prepared before fork(); only
    // async-signal-safe calls happen between fork() and exec.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0){
        Logger::instance().warn("pipe2 failed for " + argv[0] + ": " + std::strerror(errno));
        result.spawn_failed = true;
        return result;
    }
    int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    if(devnull < 0){
        Logger::instance().warn(std::string("open /dev/null failed: ") + std::strerror(errno));
        close(fds[0]); close(fds[1]);
        result.spawn_failed = true;
        return result;
    }

    sigset_t no_signals;
    sigemptyset(&no_signals);

    pid_t pid = fork();
    if(pid < 0){
        Logger::instance().warn("fork() failed for " + argv[0] + ": " + std::strerror(errno));
        close(fds[0]); close(fds[1]); close(devnull);
        result.spawn_failed = true;
        return result;
    }
    if(pid == 0){
        setpgid(0, 0);
        // main blocks SIGINT/SIGTERM and ignores SIGPIPE; tools get the defaults back
        sigprocmask(SIG_SETMASK, &no_signals, nullptr);
        signal(SIGPIPE, SIG_DFL);
        dup2(devnull, STDIN_FILENO);
        dup2(fds[1], STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        _exit(127); // exec failed
    }
    close(fds[1]);
    close(devnull);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    bool eof = false;
    while(!eof){
        struct pollfd pfd{fds[0], POLLIN, 0};
        int left = remaining_ms(deadline);
        if(left == 0){ result.timed_out = true; break; }
        int rc = poll(&pfd, 1, left);
        if(rc < 0){
            if(errno == EINTR) continue;
            Logger::instance().warn(std::string("poll failed: ") + std::strerror(errno));
            result.timed_out = true;
            break;
        }
        if(rc == 0){ result.timed_out = true; break; }
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if(n == 0){ eof = true; break; }
        if(result.output.size() < kMaxOutput) result.output.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    if(!result.timed_out){
        // stdout closed; give the child the rest of the budget to exit
        int status = 0;
        while(true){
            pid_t w = waitpid(pid, &status, WNOHANG);
            if(w == pid){
                result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                return result;
            }
            if(w < 0 && errno != EINTR){
                result.exit_code = -1;
                return result;
            }
            if(remaining_ms(deadline) == 0){ result.timed_out = true; break; }
            usleep(10 * 1000);
        }
    }

    Logger::instance().debug("Killing " + join_argv(argv) + " after " + std::to_string(timeout.count()) + "ms");
    kill_child(pid);
    wait_child(pid);
    result.exit_code = -1;
    return result;
}

}
