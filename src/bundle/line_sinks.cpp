#include "bundle/line_sinks.hpp"

#include "util/logger.hpp"

namespace bundler {

void LoggerLineSink::OnLine(std::string_view line) {
    LogInfo("[%s] %.*s", tag_.c_str(), (int)line.size(), line.data());
}

void CollectingLineSink::OnLine(std::string_view line) {
    std::lock_guard<std::mutex> lk(mu_);
    lines_.emplace_back(line);
}

std::vector<std::string> CollectingLineSink::Lines() const {
    std::lock_guard<std::mutex> lk(mu_);
    return lines_;
}

} // namespace bundler
