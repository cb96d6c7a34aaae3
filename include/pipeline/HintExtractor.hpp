#pragma once

#include "config/Config.hpp"

#include <optional>
#include <regex>
#include <string>

namespace lc::pipeline {

class HintExtractor {
public:
    // Throws std::regex_error for an invalid regex rule
    explicit HintExtractor(config::HintRuleConfig rule);

    [[nodiscard]] std::optional<std::string> extract(const std::string& filename) const;

    [[nodiscard]] const config::HintRuleConfig& rule() const { return rule_; }

private:
    config::HintRuleConfig rule_;
    std::regex regex_;

    [[nodiscard]] std::optional<std::string> extractPositional(const std::string& filename) const;
    [[nodiscard]] std::optional<std::string> extractRegex(const std::string& filename) const;
};

std::optional<std::string> extractHint(const std::string& filename, const config::HintRuleConfig& rule);

}
