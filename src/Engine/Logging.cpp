// Copyright (c) 2025, WH & 2026, hitcore contributors, All rights reserved.
#include "Logging.h"

#include "noinclude.h"

#include <cstdio>
#include <filesystem>
#include <system_error>

// we currently want all logging to be output, so set it to the most verbose level
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include "spdlog/common.h"
#include "spdlog/async_logger.h"

#include "spdlog/spdlog.h"
#include "spdlog/async.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/pattern_formatter.h"

#define DEFAULT_LOGGER_NAME "main"
#define RAW_LOGGER_NAME "raw"

#ifdef _DEBUG
// debug pattern: [filename:line] [function]: message
#define FANCY_LOG_PATTERN "[%s:%#] [%!]: %v"
// for file output, add timestamp (and thread, for debug) info
#define FILE_LOG_PATTERN_PREF "[%T.%e] [th:%t]"
#else
// release pattern: [function] message
#define FANCY_LOG_PATTERN "[%!] %v"
// add HH:MM:SS timestamp
#define FILE_LOG_PATTERN_PREF "[%T]"
#endif

#define LOGFILE_LOCATION "logs/"
#define LOGFILE_NAME LOGFILE_LOCATION "hitcore.log"

// the file is shared by both loggers, the logger name tells them apart
#define FILE_LOG_PATTERN FILE_LOG_PATTERN_PREF " [%n] %v"

namespace Logger {
namespace {  // static
std::shared_ptr<spdlog::async_logger> s_logger;
spdlog::async_logger *s_logger_raw_ptr{nullptr};
std::shared_ptr<spdlog::async_logger> s_raw_logger;
spdlog::async_logger *s_raw_logger_raw_ptr{nullptr};

bool s_log_initialized{false};

// custom %! (function name) formatter, because std::source_location::current().function_name()
// gives WAY too much information
class custom_srcloc_formatter : public spdlog::custom_flag_formatter {
    static forceinline void trim_funcname_inplace(std::string_view &str) {
        // Strip parameter list by finding the last '('
        if(const size_t paren_pos = str.rfind('('); paren_pos != std::string_view::npos) {
            str = str.substr(0, paren_pos);
        }

        const size_t last_scope = str.rfind("::");

        if(last_scope != std::string_view::npos) {
            // the qualified name has no spaces, so the first space we find (going backwards)
            // marks the end of the return type
            size_t name_start = last_scope;
            while(name_start > 0 && str[name_start - 1] != ' ') {
                --name_start;
            }
            if(name_start > 0) {
                str = str.substr(name_start);
            }
        } else {
            // free function like "void foo", strip the return type
            if(const size_t space_pos = str.rfind(' '); space_pos != std::string_view::npos) {
                str = str.substr(space_pos + 1);
            }
        }

#ifndef _DEBUG
        // In release mode, trim to just the function name (no class/namespace qualification)
        if(const size_t final_scope = str.rfind("::"); final_scope != std::string_view::npos) {
            str = str.substr(final_scope + 2);
        }
#endif
    }

   public:
    void format(const spdlog::details::log_msg &logmsg, const std::tm & /*tms*/, spdlog::memory_buf_t &dest) override {
        if(logmsg.source.funcname && logmsg.source.funcname[0] != '\0') {
            std::string_view funcname_view{logmsg.source.funcname};
            trim_funcname_inplace(funcname_view);
            dest.append(funcname_view.data(), funcname_view.data() + funcname_view.size());
        }
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<custom_srcloc_formatter>();
    }
};

}  // namespace

namespace _detail {

void log_int(std::source_location loc, log_level::level_enum lvl, std::string_view str) noexcept {
    // checking for wasInit for the unlikely case that we try to log something through here WHILE initializing/uninitializing
    if(likely(s_log_initialized)) {
        return s_logger_raw_ptr->log(
            spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
            (spdlog::level::level_enum)lvl, str);
    } else {
        printf("%.*s\n", static_cast<int>(str.length()), str.data());
    }
}

void logRaw_int(log_level::level_enum lvl, std::string_view str) noexcept {
    if(likely(s_log_initialized)) {
        return s_raw_logger_raw_ptr->log((spdlog::level::level_enum)lvl, str);
    } else {
        printf("%.*s\n", static_cast<int>(str.length()), str.data());
    }
}

}  // namespace _detail

// to be called in main(), for one-time setup/teardown
void init(bool log_to_file) noexcept {
    if(s_log_initialized) return;

    // make console output visible immediately
    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    // queue size: 8192 slots, 1 background thread
    spdlog::init_thread_pool(8192, 1);

    using mt_stdout_sink_t = spdlog::sinks::stdout_color_sink_mt;

    auto stdout_sink{std::make_shared<mt_stdout_sink_t>()};
    {
        auto tempformatter = std::make_unique<spdlog::pattern_formatter>();
        tempformatter->add_flag<custom_srcloc_formatter>('!').set_pattern(FANCY_LOG_PATTERN);
        stdout_sink->set_formatter(std::move(tempformatter));
    }

    // unformatted stdout sink
    auto raw_stdout_sink{std::make_shared<mt_stdout_sink_t>()};
    raw_stdout_sink->set_pattern("%v");  // just the message

    std::vector<spdlog::sink_ptr> main_sinks{std::move(stdout_sink)};
    std::vector<spdlog::sink_ptr> raw_sinks{std::move(raw_stdout_sink)};

    if(log_to_file) {
        std::error_code ec;
        std::filesystem::create_directories(LOGFILE_LOCATION, ec);
        if(ec) {
            printf("Logger: couldn't create %s: %s\n", LOGFILE_LOCATION, ec.message().c_str());
        } else {
            try {
                auto file_sink{std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOGFILE_NAME, true /* truncate */)};
                file_sink->set_pattern(FILE_LOG_PATTERN);
                main_sinks.push_back(file_sink);
                raw_sinks.push_back(std::move(file_sink));
            } catch(const spdlog::spdlog_ex &e) {
                printf("Logger: couldn't open %s: %s\n", LOGFILE_NAME, e.what());
            }
        }
    }

    s_logger =
        std::make_shared<spdlog::async_logger>(DEFAULT_LOGGER_NAME, main_sinks.begin(), main_sinks.end(),
                                               spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    s_logger_raw_ptr = s_logger.get();

    s_raw_logger =
        std::make_shared<spdlog::async_logger>(RAW_LOGGER_NAME, raw_sinks.begin(), raw_sinks.end(),
                                               spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    s_raw_logger_raw_ptr = s_raw_logger.get();

    // set to trace level so we print out all messages
    s_logger->set_level(spdlog::level::trace);
    s_raw_logger->set_level(spdlog::level::trace);

    // warnings and up are flushed right away, the rest by the periodic flusher
    s_logger->flush_on(spdlog::level::warn);
    s_raw_logger->flush_on(spdlog::level::off);

    spdlog::register_logger(s_logger);
    spdlog::register_logger(s_raw_logger);

    spdlog::flush_every(std::chrono::milliseconds(500));
    spdlog::set_default_logger(s_logger);

    s_log_initialized = true;
};

// spdlog::shutdown() explodes if its called at program exit (by global atexit handler), so we need to manually shut it down
void shutdown() noexcept {
    if(!s_log_initialized) return;
    flush();
    s_log_initialized = false;

    s_raw_logger.reset();
    s_logger.reset();
    s_logger_raw_ptr = nullptr;
    s_raw_logger_raw_ptr = nullptr;

    // for async loggers, this waits for the background thread to finish processing queued messages
    spdlog::shutdown();
}

void flush() noexcept {
    if(likely(s_log_initialized)) {
        s_logger->flush();
        s_raw_logger->flush();
    } else {
        fflush(stdout);
        fflush(stderr);
    }
}

}  // namespace Logger
