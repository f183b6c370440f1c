#pragma once

namespace mpc::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
