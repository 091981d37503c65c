#include "pipeline.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

bool run_analysis(
    const std::vector<TranslationUnit>& units,
    const QualityThresholds& thresholds,
    AnalysisResult& out_result,
    std::string& error
) {
    out_result = AnalysisResult{};
    out_result.stats.units_total = units.size();

    std::atomic<bool> failed{false};
    std::mutex error_mutex;

    auto guarded = [&](const std::function<void()>& task) {
        return [&, task]() {
            try {
                task();
            } catch (const std::exception& ex) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!failed.exchange(true, std::memory_order_relaxed)) {
                    error = ex.what();
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!failed.exchange(true, std::memory_order_relaxed)) {
                    error = "Unknown analysis error";
                }
            }
        };
    };

    const auto started = std::chrono::steady_clock::now();

    {
        std::vector<std::jthread> pool;
        pool.reserve(2);
        pool.emplace_back(guarded([&]() {
            analyze_units(units, thresholds, out_result.reports, out_result.summary);
        }));
        pool.emplace_back(guarded([&]() {
            build_glossary(units, out_result.glossary);
        }));
        out_result.stats.workers_used = pool.size();
    }

    if (failed.load(std::memory_order_relaxed)) {
        return false;
    }

    const auto ended = std::chrono::steady_clock::now();
    out_result.stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);

    const double wall_seconds = static_cast<double>(out_result.stats.wall_time.count()) / 1000.0;
    if (wall_seconds > 0.0) {
        out_result.stats.units_per_second = static_cast<double>(units.size()) / wall_seconds;
    }

    return true;
}
