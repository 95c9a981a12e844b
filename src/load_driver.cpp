/*
 * Chaos Load - Load Driver
 */

#include "load_driver.hpp"
#include "chaos_spec.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>

std::atomic<bool> LoadDriver::running{false};
std::atomic<bool> LoadDriver::abort_transfers{false};

namespace {

long long wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

LoadDriver::LoadDriver(ClientFactory f, ResultRecorder& r)
    : factory(std::move(f)), recorder(r) {
}

LoadDriver::~LoadDriver() {
    stop();
}

void LoadDriver::request_stop() {
    // Already stopping: give up on the grace period
    if (!running.exchange(false)) {
        abort_transfers = true;
    }
}

std::thread LoadDriver::spawn_worker(int vu) {
    return std::thread(&LoadDriver::run_virtual_user, this, vu);
}

void LoadDriver::run(const RunConfig& cfg) {
    config = &cfg;

    // Set up signal handlers, restored once the run is over
    auto prev_term = std::signal(SIGTERM, [](int) { LoadDriver::request_stop(); });
    auto prev_int = std::signal(SIGINT, [](int) { LoadDriver::request_stop(); });

    running = true;
    abort_transfers = false;
    active_users = 0;
    try {
        workers.reserve(cfg.users);
        for (int vu = 0; vu < cfg.users; ++vu) {
            active_users += 1;
            try {
                workers.push_back(spawn_worker(vu));
            } catch (const std::exception&) {
                active_users -= 1;
                throw;
            }
        }
    } catch (const std::exception&) {
        // Users already started have sent traffic; cut them off without a grace wait
        abort_transfers = true;
        stop();
        std::signal(SIGTERM, prev_term);
        std::signal(SIGINT, prev_int);
        throw;
    }

    std::cout << "\nRunning " << cfg.users << " virtual user(s) for "
              << cfg.duration_text << " against " << cfg.url << "\n" << std::endl;

    wait_for_deadline();
    stop();
    std::signal(SIGTERM, prev_term);
    std::signal(SIGINT, prev_int);

    std::cout << std::endl;
    std::cout << "Issued " << recorder.requests() << " request(s), "
              << recorder.failures() << " failed" << std::endl;
}

void LoadDriver::wait_for_deadline() {
    auto start_time = std::chrono::steady_clock::now();
    auto deadline = start_time + config->duration;

    while (running) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            running = false;
            break;
        }

        auto step = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::seconds(1));
        {
            // Signal handlers cannot notify, so this also polls running
            std::unique_lock<std::mutex> lock(wake_mutex);
            wake.wait_for(lock, step, [] { return !running; });
        }

        long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        print_progress(elapsed);
    }
}

void LoadDriver::print_progress(long long elapsed_ms) {
    double pct = std::min(100.0 * static_cast<double>(elapsed_ms) /
                          static_cast<double>(config->duration.count()), 100.0);

    std::cout << "\r" << std::fixed << std::setprecision(1) << pct << "%  "
              << "VUs: " << active_users.load() << "  "
              << "requests: " << recorder.requests() << "  "
              << "failed: " << recorder.failures() << "  "
              << std::flush;
}

void LoadDriver::stop() {
    if (!running && workers.empty()) return;
    running = false;

    {
        std::unique_lock<std::mutex> lock(wake_mutex);
        wake.notify_all();

        auto grace = config ? config->grace_period : std::chrono::milliseconds(0);
        if (!wake.wait_for(lock, grace, [this] { return active_users.load() == 0; }) &&
            !abort_transfers) {
            std::cerr << "\nWarning: Grace period expired, aborting "
                      << active_users.load() << " in-flight request(s)" << std::endl;
            abort_transfers = true;
        }
    }

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    workers.clear();
}

void LoadDriver::run_virtual_user(int vu) {
    std::unique_ptr<HttpClient> client;
    try {
        client = factory();
    } catch (const std::exception& e) {
        std::cerr << "\nVU " << vu << " error: " << e.what() << std::endl;
    }

    long iteration = 0;
    while (client && running) {
        RequestOutcome outcome;
        outcome.vu = vu;
        outcome.iteration = iteration++;
        outcome.started_at = wall_clock_ms();

        auto t0 = std::chrono::steady_clock::now();
        try {
            std::string target = ChaosSpec::build_target(config->url, config->chaos);
            HttpResponse response = client->get(target, abort_transfers);
            outcome.status = response.status;
            outcome.error = response.error;
            outcome.duration_ms = response.elapsed_ms;
        } catch (const std::exception& e) {
            outcome.error = e.what();
            outcome.duration_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - t0).count();
        }
        recorder.record(outcome);

        // Pacing interval, cut short when the run stops
        std::unique_lock<std::mutex> lock(wake_mutex);
        wake.wait_for(lock, config->pacing_interval, [] { return !running; });
    }

    std::lock_guard<std::mutex> lock(wake_mutex);
    active_users -= 1;
    wake.notify_all();
}
