/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header; this file is release only
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace TerraNav {
namespace {

constexpr size_t kMaxLogFiles = 5;
constexpr size_t kFlushInterval = 32;
constexpr const char *kLogFilePrefix = "terranav_";

std::tm localTimeNow() {
  auto timeNow = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &timeNow);
#else
  localtime_r(&timeNow, &timeinfo);
#endif
  return timeinfo;
}

// Keeps the newest keepCount navigation logs in logDir
void pruneLogDirectory(const std::filesystem::path &logDir, size_t keepCount) {
  namespace fs = std::filesystem;

  std::error_code ec;
  std::vector<fs::directory_entry> logFiles;
  for (const auto &entry : fs::directory_iterator(logDir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.path().extension() == ".log" && name.starts_with(kLogFilePrefix)) {
      logFiles.push_back(entry);
    }
  }

  if (logFiles.size() <= keepCount) {
    return;
  }

  std::sort(logFiles.begin(), logFiles.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return fs::last_write_time(a) < fs::last_write_time(b);
            });

  const size_t excess = logFiles.size() - keepCount;
  for (size_t i = 0; i < excess; ++i) {
    fs::remove(logFiles[i].path(), ec);
  }
}

class NavigationLogFile {
public:
  static NavigationLogFile &Instance() {
    static NavigationLogFile instance;
    return instance;
  }

  void append(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return; // No writable preference path; file logging stays disabled
    }

    const std::tm timeinfo = localTimeNow();
    m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << " [" << level
             << "] [" << system << "] " << message << '\n';

    if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= kFlushInterval) {
      m_stream.flush();
      m_pending = 0;
    }
  }

  NavigationLogFile(const NavigationLogFile &) = delete;
  NavigationLogFile &operator=(const NavigationLogFile &) = delete;

private:
  NavigationLogFile() = default;

  ~NavigationLogFile() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  void open() {
    m_opened = true;

    // TERRANAV_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("HammerForged", TERRANAV_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    namespace fs = std::filesystem;
    const fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    pruneLogDirectory(logDir, kMaxLogFiles);

    const std::tm timeinfo = localTimeNow();
    std::ostringstream filename;
    filename << kLogFilePrefix << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
             << ".log";

    m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << TERRANAV_APP_NAME << " navigation log, started "
               << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << " ===\n";
      m_stream.flush();
    }
  }

  std::mutex m_mutex;
  std::ofstream m_stream;
  bool m_opened{false};
  size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  NavigationLogFile::Instance().append(level, system, message);
}

} // namespace TerraNav

#endif // ifndef DEBUG
