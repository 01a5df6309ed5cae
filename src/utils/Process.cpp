#include "Process.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

int Process::run(const std::vector<std::string>& argv, const std::string& input) {
    if (argv.empty()) {
        return -1;
    }
    std::vector<char*> args;
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);
    
    int pipeFds[2] = {-1, -1};
    if (::pipe(pipeFds) != 0) {
        return -1;
    }
    
    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipeFds[0]);
        ::close(pipeFds[1]);
        return -1;
    }
    if (pid == 0) {
        ::dup2(pipeFds[0], STDIN_FILENO);
        ::close(pipeFds[0]);
        ::close(pipeFds[1]);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }
    
    ::close(pipeFds[0]);
    // 子进程提前退出时write返回EPIPE，放弃剩余输入
    size_t written = 0;
    while (written < input.size()) {
        ssize_t n = ::write(pipeFds[1], input.data() + written, input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        written += static_cast<size_t>(n);
    }
    ::close(pipeFds[1]);
    
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string Process::describe(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) line += " ";
        line += argv[i];
    }
    return line;
}
