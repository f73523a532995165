#pragma once

#include <chrono>
#include <string>

namespace mseq::core {

// IClock stamps configs, machine deletions and audit events.
// Timestamps are UTC at second precision, "YYYY-MM-DDTHH:MM:SSZ". The fixed
// width makes string order equal time order; list ordering relies on that.
class IClock {
 public:
  virtual ~IClock() = default;
  [[nodiscard]] virtual std::string now_iso8601() = 0;
};

[[nodiscard]] std::string format_iso8601_utc(std::chrono::system_clock::time_point time);

class SystemClock final : public IClock {
 public:
  [[nodiscard]] std::string now_iso8601() override;
};

// FixedClock returns the last timestamp it was given.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  [[nodiscard]] std::string now_iso8601() override { return fixed_time_; }

  void set(std::string fixed_time) { fixed_time_ = std::move(fixed_time); }

 private:
  std::string fixed_time_;
};

}  // namespace mseq::core
