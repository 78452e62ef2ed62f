#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#include "command_runner.h"
#include "string_utils.h"
#include "logger.h"

std::string command_t::to_string() const {
    // environment values can carry credentials, so only their names are shown
    std::vector<std::string> parts;
    for(const auto& kv: env) {
        parts.push_back(kv.first + "=***");
    }

    parts.insert(parts.end(), argv.begin(), argv.end());
    return StringUtils::join(parts, " ");
}

namespace {
    void close_fd(int& fd) {
        if(fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    bool write_all(int fd, const std::string& data) {
        size_t written = 0;
        while(written < data.size()) {
            ssize_t n = write(fd, data.data() + written, data.size() - written);
            if(n < 0) {
                if(errno == EINTR) {
                    continue;
                }
                return false;
            }
            written += n;
        }
        return true;
    }
}

command_result_t ProcessCommandRunner::run(const command_t& command) {
    command_result_t result;

    if(command.argv.empty()) {
        result.std_err = "Empty command.";
        return result;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if(pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        result.std_err = std::string("pipe() failed: ") + strerror(errno);
        LOG(ERROR) << result.std_err;
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return result;
    }

    std::vector<char*> argv;
    for(const auto& arg: command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if(pid < 0) {
        result.std_err = std::string("fork() failed: ") + strerror(errno);
        LOG(ERROR) << result.std_err;
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return result;
    }

    if(pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        for(const auto& kv: command.env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

        execvp(argv[0], argv.data());

        // 127 mirrors the shell's "command not found"
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if(!command.std_in.empty() && !write_all(in_pipe[1], command.std_in)) {
        LOG(WARNING) << "Could not write stdin of: " << command.to_string();
    }
    close_fd(in_pipe[1]);

    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;

    char buffer[4096];
    int open_fds = 2;

    while(open_fds > 0) {
        int ready = poll(fds, 2, -1);
        if(ready < 0) {
            if(errno == EINTR) {
                continue;
            }
            LOG(ERROR) << "poll() failed: " << strerror(errno);
            break;
        }

        for(size_t i = 0; i < 2; i++) {
            if(fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if(n > 0) {
                std::string& target = (i == 0) ? result.std_out : result.std_err;
                target.append(buffer, n);
            } else if(n == 0 || errno != EINTR) {
                // poll() skips negative descriptors, the pipe itself is closed below
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while(waitpid(pid, &status, 0) < 0) {
        if(errno != EINTR) {
            LOG(ERROR) << "waitpid() failed: " << strerror(errno);
            return result;
        }
    }

    if(WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if(WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}
