#pragma once

namespace lc::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
