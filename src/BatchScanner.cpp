#include "DocShield/BatchScanner.hpp"

#include "DocShield/ScanDeadline.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace docshield {

BatchScanner::BatchScanner(std::shared_ptr<const DocumentScanner> scanner, unsigned workers,
                           std::chrono::milliseconds timeout)
    : scanner(std::move(scanner)), workers(workers == 0 ? 1 : workers), timeout(timeout) {}

BatchResult BatchScanner::scanOne(const BatchItem &item) const {
    BatchResult result;
    result.filename = item.filename;

    const auto expiry = ScanDeadline::Clock::now() + timeout;
    try {
        const ScanDeadline deadline(expiry);
        auto report = scanner->scan(item.bytes, item.filename, item.declaredContentType);
        ScanDeadline::check("report");
        result.report = std::move(report);
        result.completed = true;
    } catch (const ScanTimedOut &stop) {
        result.timedOut = true;
        result.errorMessage =
            "Scan exceeded the " + std::to_string(timeout.count()) + " ms timeout during " + stop.where();
    }
    return result;
}

std::vector<BatchResult> BatchScanner::run(const std::vector<BatchItem> &items) const {
    std::vector<BatchResult> results(items.size());
    std::atomic<std::size_t> next{0};
    auto work = [&]() {
        for (auto index = next.fetch_add(1); index < items.size(); index = next.fetch_add(1)) {
            results[index] = scanOne(items[index]);
        }
    };

    const auto poolSize = std::min<std::size_t>(workers, items.size());
    std::vector<std::thread> pool;
    for (std::size_t i = 1; i < poolSize; ++i) {
        pool.emplace_back(work);
    }
    work();
    for (auto &thread : pool) {
        thread.join();
    }
    return results;
}

} // namespace docshield
