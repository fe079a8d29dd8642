// tests/test_framework/test_process_utils.h
#pragma once

#include "rsd_platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

#if defined(RESIDENCY_PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

/**
 * @file test_process_utils.h
 * @brief Spawning and inspecting worker processes from tests.
 *
 * A worker is this same test executable re-run with a "module.scenario" argument; see
 * test_entrypoint.cpp.
 */
namespace residency::tests::helper
{
namespace fs = std::filesystem;

#if defined(RESIDENCY_PLATFORM_WIN64)
using ProcessHandle = HANDLE;
static constexpr HANDLE NULL_PROC_HANDLE = NULL;
#else
using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/**
 * @class WorkerProcess
 * @brief Owns one worker process and captures its stdout and stderr in temp files.
 *
 * The destructor waits for a process that was never waited for and removes the
 * capture files.
 */
class WorkerProcess
{
  public:
    /**
     * @param exe_path The test executable (g_self_exe_path).
     * @param mode     Worker scenario, e.g. "residency.teardown_cancels_timers".
     * @param args     Extra arguments passed after the scenario.
     * @param redirect_stderr_to_console Leave stderr on the console instead of capturing.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args, bool redirect_stderr_to_console = false);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /// Blocks until the worker exits. Returns its exit code, -1 if it did not exit normally.
    int wait_for_exit();

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

    int exit_code() const { return exit_code_; }
    bool valid() const { return spawned_; }

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    bool spawned_ = false;
    int exit_code_ = -1;
    fs::path stdout_path_;
    fs::path stderr_path_;
    mutable std::string stdout_content_;
    mutable std::string stderr_content_;
    bool waited_ = false;
    bool redirect_stderr_to_console_ = false;
};

/**
 * @brief Asserts that a finished worker exited with 0 and its stderr looks clean.
 *
 * @param expected_stderr_substrings Strings that must appear in stderr.
 * @param allow_expected_logger_errors Skip the "no ERROR in stderr" check, for workers
 *        that log errors on purpose (failing unloaders, timeouts).
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings = {},
                      bool allow_expected_logger_errors = false);

} // namespace residency::tests::helper
