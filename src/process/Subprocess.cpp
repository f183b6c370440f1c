#include "process/Subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mpc::process {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) == -1)
            throw SpawnError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    ~Pipe() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int& readEnd() { return fds[0]; }
    int& writeEnd() { return fds[1]; }
};

// Reads both pipes until EOF on each, so neither side can fill up and stall the child.
void drain(int& outFd, int& errFd, std::string& out, std::string& err) {
    std::array<char, 4096> buf{};

    while (outFd >= 0 || errFd >= 0) {
        std::array<pollfd, 2> pfds{{{outFd, POLLIN, 0}, {errFd, POLLIN, 0}}};
        const int n = ::poll(pfds.data(), pfds.size(), -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw SpawnError(std::string("poll failed on child output: ") + std::strerror(errno));
        }

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            int& fd = i == 0 ? outFd : errFd;
            std::string& sink = i == 0 ? out : err;

            const ssize_t r = ::read(fd, buf.data(), buf.size());
            if (r > 0) sink.append(buf.data(), static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) closeFd(fd);
        }
    }
}

}

Child::~Child() {
    if (reaped_ || pid_ <= 0) return;
    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, nullptr, 0) == -1 && errno == EINTR) {}
}

int Child::wait() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) throw SpawnError(std::string("waitpid failed: ") + std::strerror(errno));
    }
    reaped_ = true;

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

Result run(const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& workingDir) {
    if (argv.empty()) throw SpawnError("Cannot spawn an empty command");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    Pipe outPipe, errPipe;

    const pid_t pid = ::fork();
    if (pid < 0) throw SpawnError(std::string("Failed to fork: ") + std::strerror(errno));

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe.writeEnd(), STDOUT_FILENO);
        ::dup2(errPipe.writeEnd(), STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

        if (workingDir && ::chdir(workingDir->c_str()) != 0) _exit(EXIT_EXEC_FAILED);

        ::execvp(args[0], args.data());
        const char* msg = "exec failed\n";
        (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
        _exit(EXIT_EXEC_FAILED);
    }

    Child child(pid);
    closeFd(outPipe.writeEnd());
    closeFd(errPipe.writeEnd());

    Result result;
    drain(outPipe.readEnd(), errPipe.readEnd(), result.stdoutText, result.stderrText);
    result.exitCode = child.wait();
    return result;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos) out += '"' + a + '"';
        else out += a;
    }
    return out;
}

}
