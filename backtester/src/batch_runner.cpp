#include "batch_runner.hpp"
#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace backtester {

    BatchRunner::BatchRunner(std::size_t max_workers)
        : max_workers_(max_workers)
    {
        if (max_workers_ == 0) {
            max_workers_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
    }

    std::vector<BatchResult> BatchRunner::run(const std::vector<BacktestJob>& jobs) const {
        auto logger = core::logging::getLogger();
        std::vector<BatchResult> results(jobs.size());
        if (jobs.empty()) {
            return results;
        }

        const std::size_t worker_count = std::min(max_workers_, jobs.size());
        logger->info("Running {} backtest job(s) on {} worker(s)", jobs.size(), worker_count);

        std::atomic<std::size_t> next_job{0};
        std::exception_ptr first_failure;
        std::mutex failure_mutex;

        auto worker_loop = [&]() {
            for (std::size_t i = next_job.fetch_add(1); i < jobs.size(); i = next_job.fetch_add(1)) {
                const BacktestJob& job = jobs[i];
                BatchResult& slot = results[i];
                slot.name = job.name;
                try {
                    Backtester backtester(job.config);
                    slot.result = backtester.run(job.series);
                } catch (const core::ConfigException& e) {
                    slot.error = e.what();
                    logger->error("Job '{}' rejected (config): {}", job.name, e.what());
                } catch (const core::InvalidSeriesException& e) {
                    slot.error = e.what();
                    logger->error("Job '{}' rejected (series): {}", job.name, e.what());
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!first_failure) {
                        first_failure = std::current_exception();
                    }
                    next_job = jobs.size(); // Stop handing out work
                    return;
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back(worker_loop);
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (first_failure) {
            std::rethrow_exception(first_failure);
        }

        const auto succeeded = std::count_if(results.begin(), results.end(),
                                             [](const BatchResult& r) { return r.ok(); });
        logger->info("Batch finished: {}/{} job(s) succeeded", succeeded, results.size());
        return results;
    }

} // namespace backtester
