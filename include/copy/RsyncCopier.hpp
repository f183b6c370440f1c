#pragma once

#include "copy/Copier.hpp"
#include "config/Config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mpc::log { class Registry; }

namespace mpc::copy {

class RsyncCopier final : public Copier {
public:
    RsyncCopier(config::CopyConfig cnf, std::shared_ptr<log::Registry> log);

    CopyOutcome copy(const CopyRequest& request) override;

    [[nodiscard]] std::string name() const override { return "rsync"; }

    [[nodiscard]] std::vector<std::string> buildArgs(const CopyRequest& request) const;

private:
    config::CopyConfig cnf_;
    std::shared_ptr<log::Registry> log_;
};

}
