#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace bundler {

// Receives tool output one line at a time, without the trailing newline.
class ILineSink {
  public:
    virtual ~ILineSink() = default;
    virtual void OnLine(std::string_view line) = 0;
};

class LoggerLineSink final : public ILineSink {
  public:
    explicit LoggerLineSink(std::string tag) : tag_(std::move(tag)) {}

    void OnLine(std::string_view line) override;

  private:
    std::string tag_;
};

class CollectingLineSink final : public ILineSink {
  public:
    void OnLine(std::string_view line) override;

    std::vector<std::string> Lines() const;

  private:
    mutable std::mutex mu_;
    std::vector<std::string> lines_;
};

class TeeLineSink final : public ILineSink {
  public:
    TeeLineSink(ILineSink& first, ILineSink& second) : first_(first), second_(second) {}

    void OnLine(std::string_view line) override {
        first_.OnLine(line);
        second_.OnLine(line);
    }

  private:
    ILineSink& first_;
    ILineSink& second_;
};

} // namespace bundler
