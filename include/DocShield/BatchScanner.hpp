#pragma once

#include "DocumentScanner.hpp"
#include "ScanTypes.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

struct BatchItem {
    std::string filename;
    std::string bytes;
    std::optional<std::string> declaredContentType;
};

struct BatchResult {
    std::string filename;
    bool completed{false};
    bool timedOut{false};
    std::string errorMessage;
    ScanReport report;
};

// Scans independent artifacts on a fixed pool of workers, all joined before
// run() returns. Each scan carries a ScanDeadline; one that passes it stops
// at the next check and is reported as timed out.
class BatchScanner {
  public:
    BatchScanner(std::shared_ptr<const DocumentScanner> scanner, unsigned workers, std::chrono::milliseconds timeout);

    std::vector<BatchResult> run(const std::vector<BatchItem> &items) const;

  private:
    BatchResult scanOne(const BatchItem &item) const;

    std::shared_ptr<const DocumentScanner> scanner;
    unsigned workers;
    std::chrono::milliseconds timeout;
};

} // namespace docshield
