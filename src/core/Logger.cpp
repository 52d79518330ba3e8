/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only, debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Formicary {
namespace {

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::chrono::system_clock::time_point when) {
    auto asTimeT = std::chrono::system_clock::to_time_t(when);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &asTimeT);
#else
    localtime_r(&asTimeT, &timeinfo);
#endif
    return timeinfo;
}

class SimulationLogFile {
public:
    static SimulationLogFile& Instance() {
        static SimulationLogFile instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm timeinfo = localTime(now);

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    SimulationLogFile() = default;

    ~SimulationLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    SimulationLogFile(const SimulationLogFile&) = delete;
    SimulationLogFile& operator=(const SimulationLogFile&) = delete;

    void open() {
        m_opened = true;

        // FORMICARY_APP_NAME comes from CMake's ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("Formicary", FORMICARY_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir);

        std::tm timeinfo = localTime(std::chrono::system_clock::now());
        std::ostringstream filename;
        filename << "formicary_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << FORMICARY_APP_NAME << " simulation log ===\n"
                     << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                     << "\n\n";
            m_stream.flush();
        }
    }

    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("formicary_")) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < KEPT_LOG_FILES) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return fs::last_write_time(a) < fs::last_write_time(b);
                  });

        // Leave room for the file about to be opened
        size_t excess = logs.size() - KEPT_LOG_FILES + 1;
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_stream;
    bool m_opened = false;
    size_t m_pending = 0;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    SimulationLogFile::Instance().write(level, system, message);
}

} // namespace Formicary

#endif // ifndef DEBUG
