// logging.cpp - Async file logger with bounded MPMC queue (Vyukov algorithm)

#include "common/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <new>
#include <thread>

#include "common/time_utils.h"

namespace Common {

// ---------- Bounded MPMC queue of fixed-size log records ----------
class LogQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  LogQueue(const LogQueue&) = delete;
  LogQueue& operator=(const LogQueue&) = delete;
  LogQueue(LogQueue&&) = delete;
  LogQueue& operator=(LogQueue&&) = delete;

  struct LogRecord {
    uint64_t timestamp_ns{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[480]{};
  };

  explicit LogQueue(std::size_t capacity_pow2)
  : size_(roundUpPow2(capacity_pow2)),
    mask_(0),
    buffer_(nullptr) {
    if (size_ > MAX_CAPACITY) {
      size_ = MAX_CAPACITY;
    }
    mask_ = size_ - 1;

    void* mem = std::aligned_alloc(CACHE_LINE_SIZE, size_ * sizeof(Cell));
    if (!mem) {
      std::abort();
    }
    buffer_ = static_cast<Cell*>(mem);

    for (std::size_t i = 0; i < size_; ++i) {
      new (&buffer_[i]) Cell();
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  ~LogQueue() {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].~Cell();
    }
    std::free(buffer_);
  }

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    CACHE_ALIGNED std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t roundUpPow2(std::size_t n) {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  CACHE_ALIGNED std::atomic<std::size_t> head_{0};
  CACHE_ALIGNED std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  Cell* buffer_;
};

// ---------- Async logger implementation ----------
class AsyncLogger {
public:
  AsyncLogger(const AsyncLogger&) = delete;
  AsyncLogger& operator=(const AsyncLogger&) = delete;
  AsyncLogger(AsyncLogger&&) = delete;
  AsyncLogger& operator=(AsyncLogger&&) = delete;

  AsyncLogger(const char* path, std::size_t capacity)
  : file_(nullptr),
    queue_(capacity),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::strncpy(path_, path, sizeof(path_) - 1);
    path_[sizeof(path_) - 1] = '\0';

    // Create parent directories; a failure surfaces at fopen
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
    }

    file_ = std::fopen(path_, "w");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s, file logging disabled\n", path_);
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  ~AsyncLogger() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();

    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }

    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool log(uint16_t level, const char* format, va_list args) noexcept {
    LogQueue::LogRecord rec{};
    rec.timestamp_ns = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    int len = std::vsnprintf(rec.msg, sizeof(rec.msg), format, args);
#pragma GCC diagnostic pop
    if (len < 0) {
      return false;
    }
    rec.len = static_cast<uint16_t>(std::min(static_cast<std::size_t>(len), sizeof(rec.msg) - 1));

    if (UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    cv_.notify_one();
    return true;
  }

  uint64_t getDrops() const noexcept { return drops_.load(std::memory_order_relaxed); }
  uint64_t getWritten() const noexcept { return written_.load(std::memory_order_relaxed); }
  uint64_t getBytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  void writerLoop() {
    static constexpr std::size_t BATCH_SIZE = 128;
    LogQueue::LogRecord batch[BATCH_SIZE];

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
        return !running_.load(std::memory_order_acquire) || !queue_.empty();
      });

      lock.unlock();

      std::size_t n = 0;
      while (n < BATCH_SIZE && queue_.dequeue(batch[n])) {
        ++n;
      }

      if (n > 0 && file_) {
        for (std::size_t i = 0; i < n; ++i) {
          const auto& rec = batch[i];
          int written = std::fprintf(file_, "[%llu.%09llu][%s][T%u] %s\n",
              static_cast<unsigned long long>(rec.timestamp_ns / 1'000'000'000ULL),
              static_cast<unsigned long long>(rec.timestamp_ns % 1'000'000'000ULL),
              levelToString(static_cast<LogLevel>(rec.level)),
              rec.thread_id,
              rec.msg);
          if (written > 0) {
            written_.fetch_add(1, std::memory_order_relaxed);
            bytes_.fetch_add(static_cast<uint64_t>(written), std::memory_order_relaxed);
          }
        }
        if (queue_.empty()) {
          std::fflush(file_);
        }
      }

      lock.lock();
    }

    if (file_) {
      std::fflush(file_);
    }
  }

  char path_[512]{};
  FILE* file_;
  LogQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
};

// Global logger instance, constructed into static storage
static std::atomic<AsyncLogger*> g_logger{nullptr};
static std::atomic<uint16_t> g_min_level{static_cast<uint16_t>(LogLevel::INFO)};
static std::mutex g_logger_mutex;
alignas(AsyncLogger) static char g_logger_storage[sizeof(AsyncLogger)];

static void destroyLoggerLocked() {
  AsyncLogger* logger = g_logger.exchange(nullptr, std::memory_order_acq_rel);
  if (logger) {
    logger->~AsyncLogger();
  }
}

void initLogging(const char* log_file, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);

  destroyLoggerLocked();
  g_min_level.store(static_cast<uint16_t>(min_level), std::memory_order_relaxed);

  if (!log_file || log_file[0] == '\0') {
    return;
  }

  constexpr std::size_t DEFAULT_CAPACITY = 4096;
  auto* logger = new (g_logger_storage) AsyncLogger(log_file, DEFAULT_CAPACITY);
  g_logger.store(logger, std::memory_order_release);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  destroyLoggerLocked();
}

bool isLoggingEnabled(LogLevel level) noexcept {
  return g_logger.load(std::memory_order_acquire) != nullptr &&
         static_cast<uint16_t>(level) >= g_min_level.load(std::memory_order_relaxed);
}

void logMessage(LogLevel level, const char* format, ...) noexcept {
  AsyncLogger* logger = g_logger.load(std::memory_order_acquire);
  if (!logger) return;

  va_list args;
  va_start(args, format);
  logger->log(static_cast<uint16_t>(level), format, args);
  va_end(args);
}

LoggerStats getLoggerStats() noexcept {
  LoggerStats stats;
  AsyncLogger* logger = g_logger.load(std::memory_order_acquire);
  if (logger) {
    stats.messages_written = logger->getWritten();
    stats.messages_dropped = logger->getDrops();
    stats.bytes_written = logger->getBytes();
  }
  return stats;
}

const char* levelToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO ";
    case LogLevel::WARN:  return "WARN ";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKN ";
  }
}

bool parseLogLevel(const char* text, LogLevel* out) noexcept {
  if (!text || !out) return false;

  char lowered[16];
  std::size_t i = 0;
  for (; text[i] != '\0' && i < sizeof(lowered) - 1; ++i) {
    lowered[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
  }
  lowered[i] = '\0';

  if (std::strcmp(lowered, "debug") == 0) { *out = LogLevel::DEBUG; return true; }
  if (std::strcmp(lowered, "info") == 0)  { *out = LogLevel::INFO;  return true; }
  if (std::strcmp(lowered, "warn") == 0)  { *out = LogLevel::WARN;  return true; }
  if (std::strcmp(lowered, "error") == 0) { *out = LogLevel::ERROR; return true; }
  return false;
}

} // namespace Common
