#include "pipeline/HintExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <vector>
#include <boost/algorithm/string.hpp>

using namespace lc::pipeline;
using namespace lc::config;

HintExtractor::HintExtractor(HintRuleConfig rule) : rule_(std::move(rule)) {
    if (rule_.kind == HintRuleConfig::Kind::Regex)
        regex_ = std::regex(rule_.pattern, std::regex::ECMAScript);
}

std::optional<std::string> HintExtractor::extract(const std::string& filename) const {
    if (filename.empty()) return std::nullopt;
    if (rule_.kind == HintRuleConfig::Kind::Regex) return extractRegex(filename);
    return extractPositional(filename);
}

std::optional<std::string> HintExtractor::extractPositional(const std::string& filename) const {
    // stem: drop the last extension, keep leading dots of hidden files intact
    std::string stem = filename;
    if (const auto dot = stem.rfind('.'); dot != std::string::npos && dot > 0) stem.erase(dot);

    std::vector<std::string> fields;
    boost::split(fields, stem, boost::is_any_of(rule_.delimiter), boost::token_compress_off);
    if (fields.size() <= rule_.field) return std::nullopt;

    std::string hint = fields[rule_.field];
    if (rule_.length > 0) {
        if (hint.size() < rule_.length) return std::nullopt;
        hint.resize(rule_.length);
    }

    if (hint.empty()) return std::nullopt;
    if (rule_.digits_only &&
        !std::ranges::all_of(hint, [](const unsigned char c) { return std::isdigit(c) != 0; }))
        return std::nullopt;

    return hint;
}

std::optional<std::string> HintExtractor::extractRegex(const std::string& filename) const {
    std::smatch m;
    if (!std::regex_match(filename, m, regex_)) return std::nullopt;
    if (rule_.group >= m.size() || !m[rule_.group].matched) return std::nullopt;
    auto hint = m[rule_.group].str();
    if (hint.empty()) return std::nullopt;
    return hint;
}

std::optional<std::string> lc::pipeline::extractHint(const std::string& filename, const HintRuleConfig& rule) {
    return HintExtractor(rule).extract(filename);
}
