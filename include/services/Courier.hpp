#pragma once

#include "config/Config.hpp"

#include <memory>

namespace lc::pipeline {
class Dispatcher;
class Watcher;
struct PipelineComponents;
}

namespace lc::services {

// Owns one Watcher/Dispatcher pair and the backends selected by configuration
class Courier {
public:
    explicit Courier(config::Config cfg);
    ~Courier();

    Courier(const Courier&) = delete;
    Courier& operator=(const Courier&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool allRunning() const;

    // Restarts the watcher if its thread died; false when the dispatcher is down
    bool recover();

private:
    config::Config cfg_;
    bool usesDatabase_{false};

    std::shared_ptr<pipeline::Dispatcher> dispatcher_;
    std::shared_ptr<pipeline::Watcher> watcher_;

    void initDatabase() const;
    [[nodiscard]] pipeline::PipelineComponents buildComponents() const;
};

}
