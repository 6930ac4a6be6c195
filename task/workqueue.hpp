#pragma once

#include "usrlist.hpp"
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifndef CONVGATE_ENABLE_LOGGING
#define CONVGATE_ENABLE_LOGGING 1
#endif

#if CONVGATE_ENABLE_LOGGING
#include <fmt/printf.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifndef CONVGATE_LOGGER_NAME
#define CONVGATE_LOGGER_NAME "convgate"
#endif

#define CONVGATE_LOG_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v"

namespace convgate::log {
inline std::shared_ptr<spdlog::logger>& logger_storage()
{
    static std::shared_ptr<spdlog::logger> storage;
    return storage;
}

inline void trim_trailing_newlines(std::string& message)
{
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
}

inline spdlog::logger* ensure_logger()
{
    auto& storage = logger_storage();
    if (!storage) {
        if (auto named = spdlog::get(CONVGATE_LOGGER_NAME)) {
            storage = named;
        } else {
            auto created = spdlog::stdout_color_mt(CONVGATE_LOGGER_NAME);
            created->set_level(spdlog::level::info);
            created->set_pattern(CONVGATE_LOG_PATTERN);
            storage = std::move(created);
        }
        spdlog::set_default_logger(storage);
    }
    return storage.get();
}

inline void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    logger_storage() = std::move(logger);
    if (logger_storage())
        spdlog::set_default_logger(logger_storage());
}

inline void set_level(spdlog::level::level_enum level)
{
    if (auto* logger = ensure_logger()) {
        logger->set_level(level);
        logger->flush_on(level > spdlog::level::warn ? level : spdlog::level::warn);
    }
}

/**
 * @brief Replace the process logger with one writing to @p path, optionally mirrored to stdout.
 * @throws spdlog::spdlog_ex when the file cannot be opened.
 */
inline void configure_file_logging(const std::string& path, bool truncate, bool also_console)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, truncate));
    if (also_console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    auto level = spdlog::level::info;
    if (auto* current = logger_storage().get())
        level = current->level();
    spdlog::drop(CONVGATE_LOGGER_NAME);

    auto logger = std::make_shared<spdlog::logger>(CONVGATE_LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(CONVGATE_LOG_PATTERN);
    logger->set_level(level);
    spdlog::register_logger(logger);
    set_logger(std::move(logger));
}

template <typename... Args> inline void log_message(spdlog::level::level_enum level, const char* fmt, Args&&... args)
{
    if (auto* logger = ensure_logger()) {
        if (!logger->should_log(level))
            return;
        auto message = fmt::sprintf(fmt, std::forward<Args>(args)...);
        trim_trailing_newlines(message);
        logger->log(level, message);
    }
}

template <typename... Args> inline void log_trace(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_debug(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_info(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_warn(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_error(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::err, fmt, std::forward<Args>(args)...);
}
} // namespace convgate::log

#define CONVGATE_LOG_TRACE(...) ::convgate::log::log_trace(__VA_ARGS__)
#define CONVGATE_LOG_DEBUG(...) ::convgate::log::log_debug(__VA_ARGS__)
#define CONVGATE_LOG_INFO(...)  ::convgate::log::log_info(__VA_ARGS__)
#define CONVGATE_LOG_WARN(...)  ::convgate::log::log_warn(__VA_ARGS__)
#define CONVGATE_LOG_ERROR(...) ::convgate::log::log_error(__VA_ARGS__)
#else
#define CONVGATE_LOG_TRACE(...) ((void)0)
#define CONVGATE_LOG_DEBUG(...) ((void)0)
#define CONVGATE_LOG_INFO(...)  ((void)0)
#define CONVGATE_LOG_WARN(...)  ((void)0)
#define CONVGATE_LOG_ERROR(...) ((void)0)
#endif

namespace convgate {

template <typename T>
concept lockable = requires(T a) {
    { a.lock() } -> std::same_as<void>;
    { a.unlock() } -> std::same_as<void>;
};

struct SpinLock {
    std::atomic_flag locked = ATOMIC_FLAG_INIT;

public:
    void lock()
    {
        while (locked.test_and_set(std::memory_order_acquire)) {
            ;
        }
    }
    void unlock() { locked.clear(std::memory_order_release); }
};

struct worknode {
    typedef void (*work_func_t)(struct worknode* work);

    struct list_head ws_node;
    work_func_t      func { nullptr };
};

/**
 * @brief FIFO of work nodes. `trig` is invoked after every post so an executor can wake a
 * sleeping worker; a null trig means the owner drains the queue itself with work_once().
 */
template <lockable Lock> struct workqueue {
    explicit workqueue() { }
    virtual ~workqueue() = default;
    typedef void (*wq_trig)(struct workqueue* work);

    struct list_head ws_head;
    wq_trig          trig { nullptr };
    Lock             lk;

    int work_once()
    {
        lk.lock();
        struct worknode* pnod = get_work_node(*this);
        lk.unlock();

        if (pnod) {
            if (auto fn = pnod->func) {
                fn(pnod);
            } else {
                CONVGATE_LOG_WARN("[workqueue] null func for node %p", static_cast<void*>(pnod));
            }
            return 1;
        }
        return 0;
    }

    void post(struct worknode& pnode)
    {
        lk.lock();
        list_del(&pnode.ws_node);
        list_add_tail(&pnode.ws_node, &ws_head);
        lk.unlock();
        if (trig) {
            trig(this);
        }
    }

    // Append a prepared batch (linked through ws_node) and trigger once.
    void post(struct list_head& batch_head)
    {
        if (list_empty(&batch_head))
            return;
        lk.lock();
        list_splice_tail_init(&batch_head, &ws_head);
        lk.unlock();
        if (trig) {
            trig(this);
        }
    }

    void lock() { lk.lock(); }
    void unlock() { lk.unlock(); }

protected:
    virtual struct worknode* get_work_node(struct workqueue& wq)
    {
        struct worknode* pnod = nullptr;
        if (!list_empty(&wq.ws_head)) {
            pnod = list_first_entry(&wq.ws_head, worknode, ws_node);
            list_del(&pnod->ws_node);
        }
        return pnod;
    }
};

} // namespace convgate
