#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mpc::process {

struct SpawnError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Result {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Exit code reported when the program could not be executed.
constexpr int EXIT_EXEC_FAILED = 127;

// Owns a forked child until it is reaped. A child still running when the
// owner goes away is killed and waited for, so no zombie is left behind.
class Child {
public:
    explicit Child(pid_t pid) : pid_(pid) {}
    ~Child();

    Child(const Child&) = delete;
    Child& operator=(const Child&) = delete;

    // Blocks until the child exits. Returns its exit code, or 128 + signal.
    int wait();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] bool reaped() const { return reaped_; }

private:
    pid_t pid_;
    bool reaped_ = false;
};

// Runs argv[0] (searched on PATH) with the given arguments, blocking until it
// exits. Both output streams are captured in full. A child killed by a signal
// reports 128 + signal number. The child runs in its own process group so a
// terminal interrupt reaches mpcopy only and in-flight copies can finish.
Result run(const std::vector<std::string>& argv,
           const std::optional<std::filesystem::path>& workingDir = std::nullopt);

std::vector<std::string> splitLines(const std::string& text);

std::string joinCommand(const std::vector<std::string>& argv);

}
