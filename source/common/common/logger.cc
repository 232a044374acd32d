#include "source/common/common/logger.h"

#include <cassert> // Plain assert: assert.h logs through this file.
#include <iostream>

namespace CloudTrace {
namespace Logger {

SinkDelegate::SinkDelegate(DelegatingLogSinkSharedPtr log_sink) : log_sink_(std::move(log_sink)) {}

SinkDelegate::~SinkDelegate() { assert(previous_delegate_ == nullptr); }

void SinkDelegate::setDelegate() {
  assert(previous_delegate_ == nullptr);
  previous_delegate_ = log_sink_->delegate();
  log_sink_->setDelegate(this);
}

void SinkDelegate::restoreDelegate() {
  assert(log_sink_->delegate() == this);
  log_sink_->setDelegate(previous_delegate_);
  previous_delegate_ = nullptr;
}

StderrSinkDelegate::StderrSinkDelegate(DelegatingLogSinkSharedPtr log_sink)
    : SinkDelegate(std::move(log_sink)) {
  setDelegate();
}

StderrSinkDelegate::~StderrSinkDelegate() { restoreDelegate(); }

void StderrSinkDelegate::log(absl::string_view msg, const spdlog::details::log_msg&) {
  absl::MutexLock lock(&stderr_mutex_);
  std::cerr << msg;
}

void StderrSinkDelegate::flush() {
  absl::MutexLock lock(&stderr_mutex_);
  std::cerr << std::flush;
}

DelegatingLogSinkSharedPtr DelegatingLogSink::init() {
  DelegatingLogSinkSharedPtr sink(new DelegatingLogSink());
  sink->stderr_sink_ = std::make_unique<StderrSinkDelegate>(sink);
  return sink;
}

void DelegatingLogSink::set_formatter(std::unique_ptr<spdlog::formatter> formatter) {
  absl::MutexLock lock(&format_mutex_);
  formatter_ = std::move(formatter);
}

void DelegatingLogSink::log(const spdlog::details::log_msg& msg) {
  // Outlives msg_view when a formatter is set.
  spdlog::memory_buf_t formatted;
  absl::string_view msg_view(msg.payload.data(), msg.payload.size());
  {
    absl::MutexLock lock(&format_mutex_);
    if (formatter_ != nullptr) {
      formatter_->format(msg, formatted);
      msg_view = absl::string_view(formatted.data(), formatted.size());
    }
  }

  // The delegate cannot be swapped while a line is being written.
  absl::ReaderMutexLock lock(&sink_mutex_);
  sink_->log(msg_view, msg);
}

void DelegatingLogSink::flush() {
  absl::ReaderMutexLock lock(&sink_mutex_);
  sink_->flush();
}

namespace {

std::shared_ptr<spdlog::logger> makeLogger(const char* name) {
  auto logger = std::make_shared<spdlog::logger>(name, Registry::getSink());
  logger->set_pattern(Registry::DefaultLogFormat);
  logger->set_level(spdlog::level::info);
  // RELEASE_ASSERT and PANIC log at critical right before aborting.
  logger->flush_on(spdlog::level::critical);
  return logger;
}

} // namespace

#define MAKE_LOGGER(X) makeLogger(#X),

const std::vector<std::shared_ptr<spdlog::logger>>& Registry::loggers() {
  static const auto* loggers =
      new std::vector<std::shared_ptr<spdlog::logger>>{ALL_LOGGER_IDS(MAKE_LOGGER)};
  return *loggers;
}

void Registry::setLogLevel(spdlog::level::level_enum level) {
  for (const auto& logger : loggers()) {
    logger->set_level(level);
  }
}

void Registry::setLogFormat(const std::string& format) {
  for (const auto& logger : loggers()) {
    logger->set_pattern(format);
  }
}

} // namespace Logger
} // namespace CloudTrace
