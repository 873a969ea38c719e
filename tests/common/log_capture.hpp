#ifndef DCA_TESTS_COMMON_LOG_CAPTURE_HPP_
#define DCA_TESTS_COMMON_LOG_CAPTURE_HPP_

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace dca::tests::common {

class RecordingSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  std::vector<std::pair<spdlog::level::level_enum, std::string>> records;

protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    records.emplace_back(msg.level, std::string(msg.payload.data(), msg.payload.size()));
  }
  void flush_() override {}
};

// Routes the default spdlog logger into memory for the lifetime of the object.
class LogCapture {
public:
  LogCapture()
    : sink_(std::make_shared<RecordingSink>()), previous_(spdlog::default_logger()) {
    auto logger = std::make_shared<spdlog::logger>("dca-test-capture", sink_);
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
  }

  ~LogCapture() { spdlog::set_default_logger(previous_); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  size_t count(spdlog::level::level_enum level) const {
    size_t n = 0;
    for (const auto& r : sink_->records) {
      if (r.first == level) ++n;
    }
    return n;
  }

  bool contains(spdlog::level::level_enum level, const std::string& needle) const {
    for (const auto& r : sink_->records) {
      if (r.first == level && r.second.find(needle) != std::string::npos) return true;
    }
    return false;
  }

private:
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<spdlog::logger> previous_;
};

} // namespace dca::tests::common

#endif // DCA_TESTS_COMMON_LOG_CAPTURE_HPP_
