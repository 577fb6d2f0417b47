#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

struct ScanSettings {
    std::uint64_t maxArtifactBytes{30ull * 1024 * 1024};
    std::size_t maxPdfObjects{1000};
    std::size_t maxZipEntries{4096};
    std::uint64_t maxInflatedEntryBytes{64ull * 1024 * 1024};
    std::uint64_t maxInflatedTotalBytes{256ull * 1024 * 1024};
    std::size_t maxRtfGroups{200000};
    std::size_t maxRtfControlWords{2000000};
    std::size_t textScanWindow{300000};
    std::size_t entropyWindow{65536};
    std::size_t entropyChunkSize{4096};
    double entropyThreshold{0.9};
    std::optional<std::string> modelPath;
    unsigned scanTimeoutSeconds{30};
    unsigned workerThreads{1};

    // Unknown keys are skipped and reported through diagnostics.
    static ScanSettings loadFromFile(const std::string &path, std::vector<std::string> *diagnostics = nullptr);
};

} // namespace docshield
