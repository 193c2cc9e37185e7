// hl_logger.h - HearLoop logging subsystem
//
// Verbosity levels (set via --log-level N or config yaml log-level):
//   1 = CRITICAL  - fatal errors
//   2 = ERROR     - non-fatal errors
//   3 = WARN      - warnings, degraded operation
//   4 = INFO      - normal operational events (default)
//   5 = DEBUG     - verbose trace
//
// Log files (under /var/log/hearloop/ by default):
//   error.log    - application messages at or above the configured level
//   session.log  - hearing test / profile / preset event journal
//
// Thread-safe. Multiple writers via mutex. Never call from the audio callback.
// Rotation: external logrotate or rotate() call.

#pragma once

#include <string>
#include <mutex>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#ifdef __linux__
#include <execinfo.h>
#endif

/* ── Log levels ─────────────────────────────────────────────────────────── */

enum HlLogLevel {
    HL_LOG_CRITICAL = 1,
    HL_LOG_ERROR    = 2,
    HL_LOG_WARN     = 3,
    HL_LOG_INFO     = 4,
    HL_LOG_DEBUG    = 5,
};

/* ── Logger class ───────────────────────────────────────────────────────── */

class HlLogger {
public:
    static HlLogger& instance() {
        static HlLogger inst;
        return inst;
    }

    // Configure log directory + level. Called once at startup.
    // Without init() the logger only echoes to stderr.
    void init(const std::string& log_dir, int level = HL_LOG_INFO,
              bool also_stderr = true)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        log_dir_    = log_dir;
        level_      = level;
        stderr_too_ = also_stderr;
        close_files();
        if (!log_dir_.empty()) {
            ensure_dir(log_dir_);
            open_files();
        }
    }

    int  level()    const { return level_; }
    void set_level(int l) { std::lock_guard<std::mutex> lk(mtx_); level_ = l; }
    void set_stderr(bool on) { std::lock_guard<std::mutex> lk(mtx_); stderr_too_ = on; }

    // ── Log helpers ──────────────────────────────────────────────────────

    void critical(const std::string& msg, const std::string& file = {},
                  int line = 0) { write(HL_LOG_CRITICAL, "CRIT ", msg, file, line); }

    void error   (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(HL_LOG_ERROR,    "ERROR", msg, file, line); }

    void warn    (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(HL_LOG_WARN,     "WARN ", msg, file, line); }

    void info    (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(HL_LOG_INFO,     "INFO ", msg, file, line); }

    void debug   (const std::string& msg, const std::string& file = {},
                  int line = 0) { write(HL_LOG_DEBUG,    "DEBUG", msg, file, line); }

    // ── Session event journal ────────────────────────────────────────────
    // One line per hearing-test transition, profile or preset change.

    void session(const std::string& event, const std::string& detail = {})
    {
        if (level_ < HL_LOG_INFO) return;
        std::lock_guard<std::mutex> lk(mtx_);
        std::string line = ts_now() + " " + event;
        if (!detail.empty()) line += " | " + detail;
        append(ses_f_, line);
        if (stderr_too_ && level_ >= HL_LOG_DEBUG)
            fprintf(stderr, "[session] %s %s\n", event.c_str(), detail.c_str());
    }

    // ── Rotate (reopen files) ─────────────────────────────────────────────

    void rotate() {
        std::lock_guard<std::mutex> lk(mtx_);
        close_files();
        if (!log_dir_.empty()) open_files();
    }

    // ── Stack trace (level 5 only), written to error.log ──────────────────

    void stack_trace(const std::string& ctx = {}) {
        if (level_ < HL_LOG_DEBUG) return;
#ifdef __linux__
        void* addrs[32];
        int   n = ::backtrace(addrs, 32);
        char** syms = ::backtrace_symbols(addrs, n);
        std::ostringstream ss;
        ss << "--- STACK TRACE";
        if (!ctx.empty()) ss << " [" << ctx << "]";
        ss << " ---\n";
        for (int i = 0; i < n; i++) {
            if (syms) ss << "  " << i << ": " << syms[i] << "\n";
            else      ss << "  " << i << ": " << addrs[i] << "\n";
        }
        ss << "--- END STACK TRACE ---";
        if (syms) free(syms);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            append(err_f_, ss.str());
        }
        fprintf(stderr, "%s\n", ss.str().c_str());
#endif
    }

    void log_exception(const std::exception& e, const std::string& ctx = {}) {
        std::string msg = "Exception";
        if (!ctx.empty()) msg += " [" + ctx + "]";
        msg += ": ";
        msg += e.what();
        error(msg);
        if (level_ >= HL_LOG_DEBUG) stack_trace(ctx);
    }

private:
    HlLogger() = default;
    ~HlLogger() { close_files(); }
    HlLogger(const HlLogger&) = delete;
    HlLogger& operator=(const HlLogger&) = delete;

    std::mutex  mtx_;
    std::string log_dir_;
    int         level_      = HL_LOG_INFO;
    bool        stderr_too_ = true;

    FILE* err_f_ = nullptr;   // error.log
    FILE* ses_f_ = nullptr;   // session.log

    static std::string ts_now() {
        char ts[32];
        time_t now = time(nullptr);
        struct tm tm_buf;
        strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", gmtime_r(&now, &tm_buf));
        return ts;
    }

    static void ensure_dir(const std::string& dir) {
        struct stat st;
        if (::stat(dir.c_str(), &st) != 0)
            ::mkdir(dir.c_str(), 0755);
    }

    void open_files() {
        err_f_ = fopen((log_dir_ + "/error.log").c_str(),   "a");
        ses_f_ = fopen((log_dir_ + "/session.log").c_str(), "a");
        if ((!err_f_ || !ses_f_) && stderr_too_)
            fprintf(stderr, "[log] Cannot open log files in %s\n", log_dir_.c_str());
    }

    void close_files() {
        if (err_f_) { fclose(err_f_); err_f_ = nullptr; }
        if (ses_f_) { fclose(ses_f_); ses_f_ = nullptr; }
    }

    void append(FILE*& f, const std::string& line) {
        if (!f) return;
        fprintf(f, "%s\n", line.c_str());
        fflush(f);
    }

    void write(int req_level, const char* tag,
               const std::string& msg,
               const std::string& src_file, int src_line)
    {
        if (req_level > level_) return;
        std::lock_guard<std::mutex> lk(mtx_);

        std::string entry = ts_now();
        entry += " ["; entry += tag; entry += "] ";
        entry += msg;

        if (level_ >= HL_LOG_DEBUG && !src_file.empty()) {
            size_t sl = src_file.rfind('/');
            entry += " (";
            entry += (sl == std::string::npos ? src_file : src_file.substr(sl + 1));
            entry += ":";
            entry += std::to_string(src_line);
            entry += ")";
        }

        append(err_f_, entry);

        if (stderr_too_) {
            fprintf(stderr, "%s\n", entry.c_str());
        }
    }
};

/* ── Global logger accessor + convenience macros ─────────────────────────── */

#define hllog   (HlLogger::instance())

#define HL_CRIT(msg)  hllog.critical((msg), __FILE__, __LINE__)
#define HL_ERR(msg)   hllog.error   ((msg), __FILE__, __LINE__)
#define HL_WARN(msg)  hllog.warn    ((msg), __FILE__, __LINE__)
#define HL_INFO(msg)  hllog.info    ((msg), __FILE__, __LINE__)
#define HL_DBG(msg)   hllog.debug   ((msg), __FILE__, __LINE__)

// Stream-style helper for building log messages inline
#define HL_LOG(level, ...) do { \
    std::ostringstream _hl_ss; \
    _hl_ss << __VA_ARGS__; \
    hllog.level(_hl_ss.str(), __FILE__, __LINE__); \
} while(0)
