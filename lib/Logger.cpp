#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace mc {
namespace logging {

namespace {

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::mutex &getConsoleMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);
  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string formatMessage(Level level, const std::string &message,
                          const std::string &origin) {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!origin.empty()) {
    ss << "[" << origin << "] ";
  }
  ss << message;
  return ss.str();
}

// Caller holds the registry mutex
std::shared_ptr<LoggerNode> getOrCreateLocked(const std::string &fullName) {
  auto &registry = getRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  if (fullName.empty()) {
    auto spRoot = std::make_shared<LoggerNode>("");
    spRoot->addHandler(std::make_shared<ConsoleHandler>());
    registry[""] = spRoot;
    return spRoot;
  }

  std::string nodeName = fullName;
  std::string parentPath;
  auto lastDot = fullName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = fullName.substr(0, lastDot);
    nodeName = fullName.substr(lastDot + 1);
  }

  auto spParent = getOrCreateLocked(parentPath);
  auto spNode = std::make_shared<LoggerNode>(nodeName);
  spNode->setParent(spParent);
  spParent->addChild(spNode);
  registry[fullName] = spNode;
  return spNode;
}

} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(getConsoleMutex());
  if (level >= Level::WARNING) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::setParent(const std::shared_ptr<LoggerNode> &spParent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = spParent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::log(Level level, const std::string &message,
                     const std::string &origin) {
  std::vector<std::shared_ptr<Handler>> handlers;
  std::shared_ptr<LoggerNode> spParent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
      return;
    }
    handlers = spHandlers_;
    if (propagate_) {
      spParent = parent_.lock();
    }
  }

  if (!handlers.empty()) {
    std::string formatted = formatMessage(level, message, origin);
    for (auto &spHandler : handlers) {
      spHandler->emit(level, formatted);
    }
  }

  if (spParent) {
    spParent->log(level, message, origin);
  }
}

void LoggerNode::addChild(const std::shared_ptr<LoggerNode> &spChild) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(spChild);
}

void LoggerNode::removeChild(const LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<LoggerNode>> result;
  for (const auto &weak : children_) {
    if (auto sp = weak.lock()) {
      result.push_back(sp);
    }
  }
  return result;
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(spNode)) {}

// Proxies must point at the new object, never at the source
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

void Logger::log(Level level, const std::string &message) {
  if (spNode_) {
    spNode_->log(level, message, spNode_->getFullName());
  }
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  for (const auto &spChild : spNode_->getChildren()) {
    result.emplace_back(spChild);
  }
  return result;
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  redirectTo(getLogger(targetLoggerName));
}

void Logger::switchTo(const std::string &loggerName) {
  spNode_ = getLogger(loggerName).spNode_;
}

void Logger::redirectTo(const Logger &target) {
  auto spTarget = target.spNode_;
  if (!spTarget) {
    throw std::invalid_argument("Cannot redirect to null logger");
  }
  if (spTarget == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  auto ancestor = spTarget;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  auto spOldParent = spNode_->getParent();
  if (spOldParent) {
    spOldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(spTarget);
  spTarget->addChild(spNode_);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateLocked(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace mc
