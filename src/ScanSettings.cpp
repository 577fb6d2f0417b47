#include "DocShield/ScanSettings.hpp"

#include <fstream>
#include <stdexcept>

namespace docshield {

namespace {

std::string trim(const std::string &value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsigned(const std::string &key, const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    return std::stoull(value);
}

double parseRatio(const std::string &key, const std::string &value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception &) {
        throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    if (consumed != value.size() || parsed < 0.0 || parsed > 1.0) {
        throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    return parsed;
}

} // namespace

ScanSettings ScanSettings::loadFromFile(const std::string &path, std::vector<std::string> *diagnostics) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open settings file: " + path);
    }

    ScanSettings settings;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        const auto separator = line.find('=');
        if (separator == std::string::npos) {
            if (diagnostics != nullptr) {
                diagnostics->push_back(path + ":" + std::to_string(lineNumber) + ": expected key=value");
            }
            continue;
        }
        const auto key = trim(line.substr(0, separator));
        const auto value = trim(line.substr(separator + 1));

        if (key == "max_artifact_bytes") {
            settings.maxArtifactBytes = parseUnsigned(key, value);
        } else if (key == "max_pdf_objects") {
            settings.maxPdfObjects = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "max_zip_entries") {
            settings.maxZipEntries = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "max_inflated_entry_bytes") {
            settings.maxInflatedEntryBytes = parseUnsigned(key, value);
        } else if (key == "max_inflated_total_bytes") {
            settings.maxInflatedTotalBytes = parseUnsigned(key, value);
        } else if (key == "max_rtf_groups") {
            settings.maxRtfGroups = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "max_rtf_control_words") {
            settings.maxRtfControlWords = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "text_scan_window") {
            settings.textScanWindow = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "entropy_window") {
            settings.entropyWindow = static_cast<std::size_t>(parseUnsigned(key, value));
        } else if (key == "entropy_chunk_size") {
            settings.entropyChunkSize = static_cast<std::size_t>(parseUnsigned(key, value));
            if (settings.entropyChunkSize == 0) {
                throw std::runtime_error("entropy_chunk_size must be positive");
            }
        } else if (key == "entropy_threshold") {
            settings.entropyThreshold = parseRatio(key, value);
        } else if (key == "model_path") {
            if (value.empty() || value == "none") {
                settings.modelPath.reset();
            } else {
                settings.modelPath = value;
            }
        } else if (key == "scan_timeout_seconds") {
            settings.scanTimeoutSeconds = static_cast<unsigned>(parseUnsigned(key, value));
        } else if (key == "worker_threads") {
            settings.workerThreads = static_cast<unsigned>(parseUnsigned(key, value));
            if (settings.workerThreads == 0) {
                settings.workerThreads = 1;
            }
        } else if (diagnostics != nullptr) {
            diagnostics->push_back(path + ":" + std::to_string(lineNumber) + ": unknown key " + key);
        }
    }
    return settings;
}

} // namespace docshield
