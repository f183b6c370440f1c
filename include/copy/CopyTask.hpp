#pragma once

#include "concurrency/Task.hpp"
#include "copy/CopyResult.hpp"

#include <filesystem>
#include <functional>
#include <memory>

namespace mpc::log { class Registry; }

namespace mpc::copy {

class Copier;

// Shared, read-only settings for every CopyTask of a run.
struct CopyContext {
    std::filesystem::path sourceRoot;
    std::filesystem::path destinationRoot;
    unsigned int maxAttempts = 1;
    std::shared_ptr<Copier> copier;
    std::shared_ptr<log::Registry> log;
};

// Exit code recorded when the destination directory could not be prepared.
constexpr int EXIT_DESTINATION_UNAVAILABLE = 126;

struct CopyTask final : concurrency::Task {
    using Callback = std::function<void(CopyResult&&)>;

    std::shared_ptr<const CopyContext> ctx;
    std::filesystem::path relativePath;
    Callback onComplete;

    CopyTask(std::shared_ptr<const CopyContext> context, std::filesystem::path relPath, Callback done);

    // Executes the copy and hands the result to onComplete. Never throws.
    void operator()() override;

    [[nodiscard]] CopyResult execute() const;

private:
    void logOutcome(const CopyResult& result) const;
};

}
