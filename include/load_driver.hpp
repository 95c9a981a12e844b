/*
 * Chaos Load - Load Driver
 *
 * Runs one worker thread per virtual user until the configured duration
 * elapses, then gives in-flight requests the grace period before aborting.
 */

#pragma once

#include "http_client.hpp"
#include "result_recorder.hpp"
#include "run_config.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

class LoadDriver {
public:
    LoadDriver(ClientFactory factory, ResultRecorder& recorder);
    virtual ~LoadDriver();

    // Blocks until the run finishes or request_stop() is called.
    // If a worker thread cannot be started, the users already running are
    // aborted and the error is rethrown.
    void run(const RunConfig& config);
    void stop();
    bool is_running() const { return running; }

    // Called from signal handlers. The first call ends the run; a call after
    // that also aborts in-flight requests instead of waiting out the grace period.
    static void request_stop();

protected:
    virtual std::thread spawn_worker(int vu);

private:
    void run_virtual_user(int vu);
    void wait_for_deadline();
    void print_progress(long long elapsed_ms);

    ClientFactory factory;
    ResultRecorder& recorder;
    const RunConfig* config = nullptr;

    static std::atomic<bool> running;
    static std::atomic<bool> abort_transfers;
    std::atomic<int> active_users{0};

    std::mutex wake_mutex;
    std::condition_variable wake;
    std::vector<std::thread> workers;
};
