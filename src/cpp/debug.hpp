#pragma once

#include <iostream>
#include <string>

// Debug logging for the menu engine and host window
// Debug output is off unless enabled with --debug
class DebugLog {
public:
    static void set_enabled(bool enabled) {
        enabled_ = enabled;
    }

    // Stream-based logger, writes nothing while disabled
    class Logger {
    public:
        explicit Logger(bool newline = false) : newline_(newline) {
            if (DebugLog::enabled_) {
                std::cerr << "[spoke] ";
            }
        }

        ~Logger() {
            if (DebugLog::enabled_) {
                if (newline_) {
                    std::cerr << "\n";
                }
                std::cerr << std::flush;
            }
        }

        template<typename T>
        Logger& operator<<(const T& val) {
            if (DebugLog::enabled_) {
                std::cerr << val;
            }
            return *this;
        }

    private:
        bool newline_;
    };

private:
    static bool enabled_;
};

inline bool DebugLog::enabled_ = false;

#define DEBUG_LOGLN DebugLog::Logger(true)

// Warnings and errors are always printed
#define WARN_LOG(msg) std::cerr << "WARNING: " << msg << std::endl
#define ERROR_LOG(msg) std::cerr << "ERROR: " << msg << std::endl
