#pragma once

#include "copy/CopyResult.hpp"

#include <string>

namespace mpc::copy {

// The external copy collaborator: transfers one file into a destination
// directory and reports how it went. Implementations must be safe to call
// from several worker threads at once.
class Copier {
public:
    virtual ~Copier() = default;

    virtual CopyOutcome copy(const CopyRequest& request) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}
