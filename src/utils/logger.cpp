/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "rsd_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace residency::format_tools;

namespace residency::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

namespace
{

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread, away from the worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher()
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                // The callback is the error channel; report its own failure to stderr.
                fmt::print(stderr, "[RSD] logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                 SetErrorCallbackCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &e)
    {
        // Already satisfied; nothing is waiting on a second value.
        RSD_DEBUG("Logger: promise already satisfied: {}", e.what());
    }
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    static void reject_command(Command &cmd);
    void write_to_sink(const LogMessage &msg);
    void report_error(std::string message);
    bool switch_sink(std::unique_ptr<Sink> sink);
    void shutdown();

    std::function<void(const std::string &)> error_callback_; // worker thread only
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    std::atomic<size_t> m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    std::mutex m_lifecycle_mutex; // serializes start_worker() and shutdown()
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    // The singleton is destroyed during static teardown; a worker that was never shut
    // down must still be joined or std::thread's destructor terminates the process.
    if (worker_thread_.joinable())
    {
        RSD_DEBUG("Logger destroyed without shutdown(); draining now.");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    LoggerState expected = LoggerState::Uninitialized;
    if (!g_logger_state.compare_exchange_strong(expected, LoggerState::Initialized,
                                                std::memory_order_acq_rel))
    {
        return;
    }
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t max_queue_size_soft = m_max_queue_size.load(std::memory_order_relaxed);
        const size_t max_queue_size_hard = max_queue_size_soft * 2;
        const bool is_message = std::holds_alternative<LogMessage>(cmd);

        // Control commands may use the headroom between the soft and hard limits.
        if (queue_.size() >= max_queue_size_hard ||
            (is_message && queue_.size() >= max_queue_size_soft))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[RSD] logger error: {}\n", message);
    }
}

void Logger::Impl::write_to_sink(const LogMessage &msg)
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    if (sink_ && msg.level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
    {
        sink_->write(msg, Sink::ASYNC_WRITE);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;
        bool stop_after_batch = false;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stop_after_batch = shutdown_requested_.load() && local_queue.empty();

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration<double>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
        }

        for (auto &command : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&command))
                {
                    write_to_sink(*msg);
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            promise_set_safe(arg.promise, switch_sink(std::move(arg.new_sink)));
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                    sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    command);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                reject_command(command);
            }
        }

        if (dropped_count > 0)
        {
            try
            {
                write_to_sink(make_message(
                    Logger::Level::L_WARNING,
                    make_buffer("Logger dropped {} messages over {:.2f}s due to a full queue.",
                                dropped_count, dropping_duration_s)));
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        local_queue.clear();

        if (stop_after_batch)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    fmt::print(stderr, "[RSD] logger final flush failed: {}\n", e.what());
                }
            }
            break;
        }
    }
}

bool Logger::Impl::switch_sink(std::unique_ptr<Sink> sink)
{
    if (!sink)
    {
        return false;
    }
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    const std::string new_desc = sink->description();
    if (sink_)
    {
        sink_->write(make_message(Logger::Level::L_SYSTEM,
                                  make_buffer("Switching log sink to: {}", new_desc)),
                     Sink::ASYNC_WRITE);
        sink_->flush();
    }
    const std::string old_desc = sink_ ? sink_->description() : "null";
    sink_ = std::move(sink);
    m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
    sink_->write(
        make_message(Logger::Level::L_SYSTEM, make_buffer("Log sink switched from: {}", old_desc)),
        Sink::ASYNC_WRITE);
    return true;
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
    {
        return;
    }
    g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
    {
        std::lock_guard<std::mutex> qlock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::start()
{
    pImpl->start_worker();
}

bool Logger::is_running() const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

namespace
{
// Configuration calls before start() are programming errors: nothing would consume
// the command and the caller would block forever on its future.
void require_started(const char *function_name)
{
    if (g_logger_state.load(std::memory_order_acquire) == LoggerState::Uninitialized)
    {
        RSD_PANIC("Logger method '{}' was called before Logger::start(). Aborting.",
                  function_name);
    }
}
} // namespace

bool Logger::set_console()
{
    require_started("Logger::set_console");
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::filesystem::path &path, bool use_flock)
{
    require_started("Logger::set_logfile");
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    return future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!is_running())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    pImpl->m_max_queue_size.store(std::max<size_t>(max_size, 1), std::memory_order_relaxed);
}

size_t Logger::get_max_queue_size() const
{
    return pImpl->m_max_queue_size.load(std::memory_order_relaxed);
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    require_started("Logger::set_write_error_callback");
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        const auto state = g_logger_state.load(std::memory_order_acquire);
        if (state == LoggerState::Initialized)
        {
            return pImpl->enqueue_command(make_message(lvl, std::move(body)));
        }
        if (state == LoggerState::ShuttingDown || state == LoggerState::Shutdown)
        {
            // No worker any more; write straight to stderr.
            fmt::print(stderr, "{}",
                       Sink::format_logmsg(make_message(lvl, std::move(body)), Sink::SYNC_WRITE));
            return true;
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[RSD] failed to log message: %s\n", e.what());
    }
    return false;
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    try
    {
        return enqueue_log(lvl, make_buffer("{}", body_str));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[RSD] failed to log message: %s\n", e.what());
        return false;
    }
}

bool Logger::write_sync(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!should_log(lvl))
        return false;
    try
    {
        std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
        if (pImpl->sink_)
        {
            pImpl->sink_->write(make_message(lvl, std::move(body)), Sink::SYNC_WRITE);
            return true;
        }
    }
    catch (const std::exception &e)
    {
        // Cannot log here without recursing into the same sink.
        std::fprintf(stderr, "[RSD] write_sync failed: %s\n", e.what());
    }
    return false;
}

Logger::Level parse_log_level(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace")
        return Logger::Level::L_TRACE;
    if (lowered == "debug")
        return Logger::Level::L_DEBUG;
    if (lowered == "info")
        return Logger::Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Logger::Level::L_WARNING;
    if (lowered == "error")
        return Logger::Level::L_ERROR;
    if (lowered == "system")
        return Logger::Level::L_SYSTEM;
    throw std::invalid_argument(fmt::format("unknown log level '{}'", text));
}

const char *to_string(Logger::Level lvl) noexcept
{
    return Sink::level_to_string_internal(static_cast<int>(lvl));
}

} // namespace residency::utils
