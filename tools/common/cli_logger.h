#pragma once

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <utility>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <langinfo.h>
#include <locale.h>
#include <strings.h>
#include <unistd.h>
#endif

namespace rstools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }
inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

constexpr const char* level_emoji(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "🔇";
        case VerbosityLevel::Verbose: return "🔈";
        case VerbosityLevel::Debug: return "🐞";
    }
    return "🔈";
}

// supports_utf reports whether stderr is a terminal configured for UTF-8.
inline bool supports_utf() {
    static const bool value = []() {
#if defined(_WIN32)
        return _isatty(_fileno(stderr)) && GetConsoleOutputCP() == 65001;
#else
        if (!isatty(STDERR_FILENO)) return false;
        setlocale(LC_CTYPE, "");
        const char* codeset = nl_langinfo(CODESET);
        const char* term = std::getenv("TERM");
        bool term_ok = term && term[0] && strcasecmp(term, "dumb") != 0;
        return codeset && (strcasecmp(codeset, "utf-8") == 0 || strcasecmp(codeset, "utf8") == 0) && term_ok;
#endif
    }();
    return value;
}

template <typename... Args>
void write_line(std::ostream& stream, std::string_view prefix, Args&&... args) {
    stream << prefix;
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    if (supports_utf())
        std::cerr << '[' << level_emoji(min_level) << "] ";
    else
        std::cerr << '[' << level_name(min_level) << "] ";
    write_line(std::cerr, "", std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    write_line(std::cerr, supports_utf() ? "⚠️ " : "[WARN] ", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    write_line(std::cerr, supports_utf() ? "❌ " : "[ERROR] ", std::forward<Args>(args)...);
}

} // namespace rstools::log

namespace rstools::cli {
    using namespace rstools::log;
}

#define LOGI(...) ::rstools::log::info(__VA_ARGS__)
#define LOGW(...) ::rstools::log::warn(__VA_ARGS__)
#define LOGE(...) ::rstools::log::error(__VA_ARGS__)

#if RSTOOLS_DEBUG
    #define LOGD(...) ::rstools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
