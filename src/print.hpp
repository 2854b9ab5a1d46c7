// Copyright (C) 2022 Tycho Softworks.
// This code is licensed under MIT license.

#ifndef TANDEM_PRINT_HPP_
#define TANDEM_PRINT_HPP_

#include <iostream>
#include <string>
#include <mutex>
#include <cstdlib>
#include <cstdio>

#include <fmt/ranges.h>
#include <fmt/format.h>

#if __has_include(<syslog.h>)
#define USE_SYSLOG
#include <syslog.h>
#else
constexpr auto LOG_DAEMON = 0;
constexpr auto LOG_INFO = 0;
constexpr auto LOG_WARNING = 0;
constexpr auto LOG_NOTICE = 0;
constexpr auto LOG_ERR = 0;
constexpr auto LOG_DEBUG = 0;
#endif

namespace tandem {
template<class... Args>
using format_string = const char *;

template<class... Args>
auto format(format_string<Args...> fmt, Args&&... args) {
    return fmt::format(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void print(std::ostream& out, format_string<Args...> fmt, Args&&... args) {
    out << format(fmt, std::forward<Args>(args)...);
}

template<class... Args>
void println(format_string<Args...> fmt, Args&&... args) {
    std::cout << format(fmt, std::forward<Args>(args)...) << std::endl;
}

template<class... Args>
void println(std::ostream& out, format_string<Args...> fmt, Args&&... args) {
    out << format(fmt, std::forward<Args>(args)...) << std::endl;
}

template<class... Args>
[[noreturn]] void die(int code, format_string<Args...> fmt, Args&&... args) {
    std::cerr << format(fmt, std::forward<Args>(args)...) << std::endl;
    ::exit(code);
}

// Verbosity 0 is silent on stderr, 1 shows errors and warnings, 2 adds
// notices and info. Every message reaches syslog (once opened) and the
// notify hook regardless of verbosity.
class system_logger final {
public:
    using notify_t = void (*)(const std::string&, const char *type);

    system_logger() = default;
    system_logger(const system_logger&) = delete;
    auto operator=(const system_logger&) -> auto& = delete;

    template<class... Args>
    void debug(unsigned level, format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        if(level <= this->level())
            emit(LOG_DEBUG, "debug", level, format(fmt, std::forward<Args>(args)...));
#endif
    }

    template<class... Args>
    void info(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_INFO, "info", 2, format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void notice(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_NOTICE, "notice", 2, format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void warn(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_WARNING, "warn", 1, format(fmt, std::forward<Args>(args)...));
    }

    template<class... Args>
    void error(format_string<Args...> fmt, Args&&... args) {
        emit(LOG_ERR, "error", 1, format(fmt, std::forward<Args>(args)...));
    }

    void set(unsigned level, notify_t notify = [](const std::string& str, const char *type){}) {
        const std::lock_guard lock(locking_);
        logging_ = level;
        notify_ = notify;
    }

    auto level() {
        const std::lock_guard lock(locking_);
        return logging_;
    }

#ifdef  USE_SYSLOG
    void open(const char *id, int level = LOG_INFO, int facility = LOG_DAEMON) {
        const std::lock_guard lock(locking_);
        ::openlog(id, LOG_CONS | LOG_NDELAY, facility);
        ::setlogmask(LOG_UPTO(level));
        opened_ = true;
    }

    void close() {
        const std::lock_guard lock(locking_);
        if(opened_)
            ::closelog();
        opened_ = false;
    }

    auto is_open() {
        const std::lock_guard lock(locking_);
        return opened_;
    }
#else
    void open(const char *id, int level = LOG_INFO, int facility = LOG_DAEMON) {}
    void close() {}
    auto is_open() {
        return false;
    }
#endif

private:
    std::mutex locking_;
    unsigned logging_{1};
    notify_t notify_{[](const std::string& str, const char *type){}};
#ifdef  USE_SYSLOG
    bool opened_{false};
#endif

    void emit(int priority, const char *type, unsigned verbose, const std::string& msg) {
        const std::lock_guard lock(locking_);
#ifdef  USE_SYSLOG
        if(opened_)
            ::syslog(priority, "%s", msg.c_str());
#endif
        notify_(msg, type);
        if(logging_ >= verbose)
            print(std::cerr, "{}: {}\n", type, msg);
    }
};
} // end namespace
#endif
