/**
 * @file residency_demo_main.cpp
 * @brief residency-demo: scripted assistant session showing on-demand residency.
 *
 * ## Usage
 *
 *     residency-demo                          # Run the scripted session with defaults
 *     residency-demo --config <path.json>     # Use a configuration file
 *     residency-demo --wait                   # Also wait for idle eviction to kick in
 *     residency-demo --status-only            # Register, print status, exit
 *
 * The configuration file format is documented in utils/residency_config.hpp. A short
 * `default_idle_timeout_s` together with per-component overrides makes `--wait`
 * finish quickly, e.g.
 *
 *     { "components": { "chat_model": { "idle_timeout_s": 2 },
 *                       "search_engine": { "idle_timeout_s": 1 } } }
 */
#include "simulated_components.hpp"

#include "rsd_service.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

using namespace residency::utils;
using residency::demo::Assistant;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // second signal
    g_shutdown.store(true, std::memory_order_relaxed);
}

namespace
{

struct DemoArgs
{
    std::string config_path;
    bool wait_for_eviction{false};
    bool status_only{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " [--config <path.json>] [--wait] [--status-only]\n\n"
              << "Options:\n"
              << "  --config <path>   JSON configuration (see RESIDENCY_CONFIG_FILE)\n"
              << "  --wait            After the session, wait until idle components are evicted\n"
              << "  --status-only     Register the components, print their status and exit\n"
              << "  --help            Show this message\n";
}

DemoArgs parse_args(int argc, char *argv[])
{
    DemoArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--wait")
        {
            args.wait_for_eviction = true;
        }
        else if (arg == "--status-only")
        {
            args.status_only = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

void print_status(const ResidencyManager &manager, std::string_view heading)
{
    fmt::print("\n── {} ──\n", heading);
    fmt::print("{:<20} {:<10} {:>9} {:>6} {:>9}\n", "component", "state", "idle", "uses",
               "est. MB");
    for (const auto &[name, st] : manager.status())
    {
        const auto idle = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(st.idle_seconds));
        fmt::print("{:<20} {:<10} {:>9} {:>6} {:>9.0f}\n", name, to_string(st.state),
                   st.access_count ? residency::format_tools::human_duration(idle) : "-",
                   st.access_count, st.estimated_memory_mb);
    }
    const double rss = residency::platform::resident_set_mb();
    fmt::print("resident estimate: {:.0f} MB   process RSS: {}\n", manager.resident_memory_mb(),
               rss < 0 ? std::string("n/a") : fmt::format("{:.1f} MB", rss));
}

/// Idle timeout that schedule_eviction(name) will use for `c`.
std::chrono::milliseconds effective_idle_timeout(const ResidencyOptions &options,
                                                 const residency::demo::DemoComponent &c)
{
    auto it = options.component_overrides.find(c.name);
    if (it != options.component_overrides.end() && it->second.idle_timeout)
        return *it->second.idle_timeout;
    return c.idle_timeout;
}

bool sleep_unless_interrupted(std::chrono::milliseconds total)
{
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (g_shutdown.load(std::memory_order_relaxed))
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

void run_session(Assistant &assistant)
{
    struct Step
    {
        const char *label;
        std::function<std::string()> action;
    };
    auto or_unavailable = [](auto &&opt, auto &&render) -> std::string
    { return opt ? render(*opt) : std::string("<unavailable>"); };
    auto as_is = [](const auto &v) { return fmt::format("{}", v); };

    const std::vector<Step> steps{
        {"chat", [&] { return or_unavailable(assistant.chat("hello there"), as_is); }},
        {"voice", [&] { return or_unavailable(assistant.transcribe("clip-001.wav"), as_is); }},
        {"chat", [&] { return or_unavailable(assistant.chat("what is on my screen?"), as_is); }},
        {"vision", [&] { return or_unavailable(assistant.describe_screen(), as_is); }},
        {"detect",
         [&] {
             return or_unavailable(assistant.detect_objects(),
                                   [](int n) { return fmt::format("{} objects", n); });
         }},
        {"ocr", [&] { return or_unavailable(assistant.read_screen_text(), as_is); }},
        {"automation", [&] { return or_unavailable(assistant.click(640, 360), as_is); }},
        {"search",
         [&]
         {
             return or_unavailable(assistant.search("weather tomorrow"),
                                   [](const std::vector<std::string> &hits)
                                   { return fmt::format("{} hit(s)", hits.size()); });
         }},
        {"chat", [&] { return or_unavailable(assistant.chat("thanks"), as_is); }},
    };

    for (const auto &step : steps)
    {
        if (g_shutdown.load(std::memory_order_relaxed))
        {
            fmt::print("interrupted\n");
            return;
        }
        const auto start = residency::platform::monotonic_time_ns();
        const std::string outcome = step.action();
        fmt::print("[{:<10}] {} ({})\n", step.label, outcome,
                   residency::format_tools::human_duration(std::chrono::nanoseconds(
                       residency::platform::elapsed_time_ns(start))));
    }
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const DemoArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    ResidencyConfig config;
    try
    {
        config = args.config_path.empty() ? load_residency_config()
                                          : load_residency_config(args.config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // ── Logger ────────────────────────────────────────────────────────────────
    auto &logger = Logger::instance();
    logger.start();
    auto logger_guard = residency::basics::make_scope_guard([&logger] { logger.shutdown(); });
    logger.set_level(config.logging.level);
    if (!config.logging.file.empty() &&
        !logger.set_logfile(config.logging.file, config.logging.use_flock))
    {
        std::cerr << "Cannot open log file '" << config.logging.file << "'\n";
        return 1;
    }
    if (!config.source.empty())
    {
        LOGGER_INFO("residency-demo: configuration from '{}'", config.source.string());
    }

    // ── Manager + collaborators ──────────────────────────────────────────────
    try
    {
        ResidencyManager manager(config.residency);
        residency::demo::register_demo_components(manager);

        if (args.status_only)
        {
            print_status(manager, "registered components");
            return 0;
        }

        Assistant assistant(manager);
        run_session(assistant);
        print_status(manager, "after session");

        if (args.wait_for_eviction && !g_shutdown.load(std::memory_order_relaxed))
        {
            std::chrono::milliseconds longest{0};
            for (const auto &c : residency::demo::demo_components())
            {
                if (manager.component_state(c.name) == ComponentState::Loaded)
                    longest = std::max(longest, effective_idle_timeout(manager.options(), c));
            }
            fmt::print("\nwaiting {} for idle eviction (Ctrl-C to stop)...\n",
                       residency::format_tools::human_duration(longest));
            if (sleep_unless_interrupted(longest + std::chrono::milliseconds(500)))
            {
                print_status(manager, "after idle timeout");
            }
        }

        manager.evict_all();
        print_status(manager, "after evict_all");
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("residency-demo: {}", e.what());
        return 1;
    }
    return 0;
}
