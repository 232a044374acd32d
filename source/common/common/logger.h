#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cloudtrace/common/pure.h"

#include "source/common/common/fmt.h"
#include "source/common/common/macros.h"
#include "source/common/common/non_copyable.h"

#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/sink.h"
#include "spdlog/spdlog.h"

namespace CloudTrace {
namespace Logger {

#define ALL_LOGGER_IDS(FUNCTION)                                                                   \
  FUNCTION(assert)                                                                                 \
  FUNCTION(config)                                                                                 \
  FUNCTION(testing)                                                                                \
  FUNCTION(tracing)

// clang-format off
enum class Id {
  ALL_LOGGER_IDS(GENERATE_ENUM)
};
// clang-format on

class DelegatingLogSink;
using DelegatingLogSinkSharedPtr = std::shared_ptr<DelegatingLogSink>;

/**
 * Destination for formatted log lines. Delegates form a stack on the DelegatingLogSink: a derived
 * class pushes itself with setDelegate() at the end of its constructor and pops itself with
 * restoreDelegate() in its destructor.
 */
class SinkDelegate : NonCopyable {
public:
  explicit SinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  virtual ~SinkDelegate();

  /**
   * @param msg the formatted line.
   * @param log_msg the record it was formatted from.
   */
  virtual void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) PURE;
  virtual void flush() PURE;

protected:
  void setDelegate();
  void restoreDelegate();
  SinkDelegate* previousDelegate() { return previous_delegate_; }

private:
  SinkDelegate* previous_delegate_{nullptr};
  DelegatingLogSinkSharedPtr log_sink_;
};

/**
 * Bottom of the delegate stack. Writes to stderr.
 */
class StderrSinkDelegate : public SinkDelegate {
public:
  explicit StderrSinkDelegate(DelegatingLogSinkSharedPtr log_sink);
  ~StderrSinkDelegate() override;

  // SinkDelegate
  void log(absl::string_view msg, const spdlog::details::log_msg& log_msg) override;
  void flush() override;

private:
  absl::Mutex stderr_mutex_;
};

/**
 * The one spdlog sink shared by every logger. Formats each record and hands it to the delegate on
 * top of the stack.
 */
class DelegatingLogSink : public spdlog::sinks::sink {
public:
  // spdlog::sinks::sink
  void log(const spdlog::details::log_msg& msg) override;
  void flush() override;
  void set_pattern(const std::string& pattern) override {
    set_formatter(std::make_unique<spdlog::pattern_formatter>(pattern));
  }
  void set_formatter(std::unique_ptr<spdlog::formatter> formatter) override;

  // Builds the sink with a StderrSinkDelegate installed.
  static DelegatingLogSinkSharedPtr init();

private:
  friend class SinkDelegate;

  DelegatingLogSink() = default;

  SinkDelegate* delegate() {
    absl::ReaderMutexLock lock(&sink_mutex_);
    return sink_;
  }
  void setDelegate(SinkDelegate* sink) {
    absl::WriterMutexLock lock(&sink_mutex_);
    sink_ = sink;
  }

  absl::Mutex sink_mutex_;
  SinkDelegate* sink_ ABSL_GUARDED_BY(sink_mutex_){nullptr};
  std::unique_ptr<StderrSinkDelegate> stderr_sink_;
  absl::Mutex format_mutex_;
  std::unique_ptr<spdlog::formatter> formatter_ ABSL_GUARDED_BY(format_mutex_);
};

/**
 * Fixed set of loggers, one per Id, all writing through getSink().
 */
class Registry {
public:
  static constexpr const char* DefaultLogFormat = "[%Y-%m-%d %T.%e][%t][%l][%n] %v";

  static spdlog::logger& getLog(Id id) { return *loggers()[static_cast<size_t>(id)]; }

  static DelegatingLogSinkSharedPtr getSink() {
    static DelegatingLogSinkSharedPtr sink = DelegatingLogSink::init();
    return sink;
  }

  static void setLogLevel(spdlog::level::level_enum level);
  static void setLogFormat(const std::string& format);

  // Indexed by Id.
  static const std::vector<std::shared_ptr<spdlog::logger>>& loggers();
};

/**
 * Mixin giving a class a static logger for the given id, used through CLOUDTRACE_LOG.
 */
template <Id id> class Loggable {
protected:
  // Use CLOUDTRACE_LOG rather than calling this directly.
  static spdlog::logger& __log_do_not_use_read_comment() { // NOLINT(readability-identifier-naming)
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

} // namespace Logger

// LEVEL is one of trace, debug, info, warn, err, critical. Arguments are only evaluated when the
// level is enabled.
#define CLOUDTRACE_LOG_TO_LOGGER(LOGGER, LEVEL, ...)                                               \
  do {                                                                                             \
    if ((LOGGER).should_log(::spdlog::level::LEVEL)) {                                             \
      (LOGGER).log(::spdlog::source_loc{__FILE__, __LINE__, __func__}, ::spdlog::level::LEVEL,     \
                   __VA_ARGS__);                                                                   \
    }                                                                                              \
  } while (0)

#define CLOUDTRACE_LOGGER() __log_do_not_use_read_comment()

#define CLOUDTRACE_LOG_CHECK_LEVEL(LEVEL) CLOUDTRACE_LOGGER().should_log(::spdlog::level::LEVEL)

#define CLOUDTRACE_LOG(LEVEL, ...) CLOUDTRACE_LOG_TO_LOGGER(CLOUDTRACE_LOGGER(), LEVEL, __VA_ARGS__)

} // namespace CloudTrace
