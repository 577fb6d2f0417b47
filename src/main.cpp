#include "DocShield/BatchScanner.hpp"
#include "DocShield/DocumentScanner.hpp"
#include "DocShield/ScanSettings.hpp"
#include "DocShield/ThreatClassifier.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string joinVector(const std::vector<std::string> &values, const std::string &separator = ", ") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << values[i];
    }
    return oss.str();
}

std::string jsonEscape(const std::string &value) {
    std::ostringstream oss;
    for (char ch : value) {
        switch (ch) {
        case '\\':
            oss << "\\\\";
            break;
        case '\"':
            oss << "\\\"";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(ch) << std::dec
                    << std::setfill(' ');
            } else {
                oss << ch;
            }
        }
    }
    return oss.str();
}

std::string formatScore(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string jsonStringArray(const std::vector<std::string> &values) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << '"' << jsonEscape(values[i]) << '"';
    }
    oss << ']';
    return oss.str();
}

std::optional<std::string> readFile(const std::string &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::optional<fs::path> writeSanitizedCopy(const fs::path &outputDir, const std::string &filename, const std::string &bytes) {
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return std::nullopt;
    }
    const fs::path source(filename);
    const auto target = outputDir / (source.stem().string() + ".sanitized" + source.extension().string());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::nullopt;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return out ? std::optional<fs::path>(target) : std::nullopt;
}

std::string assessmentJson(const docshield::RiskAssessment &assessment) {
    std::ostringstream out;
    out << "{\"verdict\":\"" << docshield::toString(assessment.verdict) << "\",\"composite_score\":"
        << formatScore(assessment.compositeScore) << ",\"rule_score\":" << formatScore(assessment.ruleScore)
        << ",\"classifier_probability\":";
    if (assessment.classifierProbability) {
        out << formatScore(*assessment.classifierProbability);
    } else {
        out << "null";
    }
    out << '}';
    return out.str();
}

std::string findingsJson(const std::vector<docshield::Finding> &findings, bool detailed) {
    std::ostringstream out;
    out << '[';
    for (std::size_t i = 0; i < findings.size(); ++i) {
        const auto &finding = findings[i];
        if (i > 0) {
            out << ',';
        }
        out << "{\"id\":\"" << jsonEscape(finding.id) << "\",\"severity\":\"" << docshield::toString(finding.severity)
            << "\",\"message\":\"" << jsonEscape(finding.message) << "\"";
        if (!finding.locator.empty()) {
            out << ",\"locator\":\"" << jsonEscape(finding.locator) << "\"";
        }
        if (detailed) {
            const auto explanation = docshield::explainFinding(finding);
            if (!explanation.empty()) {
                out << ",\"explain\":\"" << jsonEscape(explanation) << "\"";
            }
        }
        out << '}';
    }
    out << ']';
    return out.str();
}

void printReportJson(const docshield::BatchResult &result, const std::optional<fs::path> &sanitizedPath, bool detailed,
                     bool last) {
    const auto &report = result.report;
    std::cout << "{\"file\":\"" << jsonEscape(result.filename) << "\",\"completed\":" << (result.completed ? "true" : "false");
    if (!result.completed) {
        std::cout << ",\"error\":\"" << jsonEscape(result.errorMessage) << "\"}" << (last ? "\n" : ",\n");
        return;
    }
    std::cout << ",\"meta\":{\"filename\":\"" << jsonEscape(report.artifact.filename) << "\",\"ext\":\""
              << jsonEscape(report.artifact.extension) << "\",\"mime\":\"" << jsonEscape(report.artifact.mime)
              << "\",\"size\":" << report.artifact.size << ",\"sha256\":\"" << report.artifact.sha256 << "\"}";
    std::cout << ",\"format\":\"" << jsonEscape(docshield::describe(report.format)) << "\"";
    std::cout << ",\"assessment\":" << assessmentJson(report.assessment);
    std::cout << ",\"findings\":" << findingsJson(report.findings, detailed);
    std::cout << ",\"recommendations\":" << jsonStringArray(report.recommendations);
    std::cout << ",\"sanitized\":" << (report.sanitized() ? "true" : "false");
    if (report.sanitization) {
        const auto &outcome = *report.sanitization;
        std::cout << ",\"sanitization\":{\"engine\":\"" << jsonEscape(outcome.engineUsed)
                  << "\",\"attempted\":" << jsonStringArray(outcome.fallbackChainAttempted)
                  << ",\"succeeded\":" << (outcome.succeeded ? "true" : "false")
                  << ",\"bytes_changed\":" << (outcome.bytesChanged ? "true" : "false")
                  << ",\"marker_injected\":" << (outcome.markerInjected ? "true" : "false") << ",\"removed\":"
                  << jsonStringArray({outcome.removedConstructs.begin(), outcome.removedConstructs.end()})
                  << ",\"reason\":\"" << jsonEscape(outcome.reason) << "\"";
        if (sanitizedPath) {
            std::cout << ",\"output\":\"" << jsonEscape(sanitizedPath->string()) << "\"";
        }
        std::cout << '}';
    }
    if (report.verification) {
        std::cout << ",\"verification\":{\"assessment\":" << assessmentJson(report.verification->assessment)
                  << ",\"delta_risk\":" << formatScore(report.verification->deltaRisk) << '}';
    }
    if (detailed) {
        std::cout << ",\"diagnostics\":" << jsonStringArray(report.diagnostics);
    }
    std::cout << '}' << (last ? "\n" : ",\n");
}

void printReportText(const docshield::BatchResult &result, const std::optional<fs::path> &sanitizedPath, bool detailed) {
    std::cout << "[*] " << result.filename << "\n";
    if (!result.completed) {
        std::cout << "[!] Scan failed: " << result.errorMessage << "\n";
        return;
    }
    const auto &report = result.report;
    std::cout << "[i] Format " << docshield::describe(report.format) << ", " << report.artifact.size << " bytes, sha256 "
              << report.artifact.sha256 << "\n";

    const auto &assessment = report.assessment;
    const char *marker = assessment.verdict == docshield::Verdict::Benign ? "[+]" : "[!]";
    std::cout << marker << " Verdict: " << docshield::toString(assessment.verdict) << " (composite "
              << formatScore(assessment.compositeScore) << ", rules " << formatScore(assessment.ruleScore) << ", classifier "
              << (assessment.classifierProbability ? formatScore(*assessment.classifierProbability) : std::string("n/a"))
              << ")\n";

    for (const auto &finding : report.findings) {
        std::cout << "  [" << docshield::toString(finding.severity) << "] " << finding.id << ": " << finding.message;
        if (!finding.locator.empty()) {
            std::cout << " (" << finding.locator << ')';
        }
        std::cout << "\n";
        if (detailed) {
            const auto explanation = docshield::explainFinding(finding);
            if (!explanation.empty()) {
                std::cout << "      " << explanation << "\n";
            }
        }
    }

    if (report.sanitization) {
        const auto &outcome = *report.sanitization;
        if (outcome.succeeded) {
            std::cout << "[+] Sanitized by " << outcome.engineUsed;
            if (!outcome.removedConstructs.empty()) {
                std::cout << ", removed "
                          << joinVector({outcome.removedConstructs.begin(), outcome.removedConstructs.end()});
            }
            if (outcome.markerInjected) {
                std::cout << " (marker injected)";
            }
            std::cout << "\n";
        } else {
            std::cout << "[!] Sanitization failed: " << outcome.reason << "\n";
        }
        if (detailed) {
            std::cout << "[i] Chain attempted: " << joinVector(outcome.fallbackChainAttempted, " -> ") << "\n";
        }
        if (sanitizedPath) {
            std::cout << "[+] Sanitized copy written to " << sanitizedPath->string() << "\n";
        }
    }
    if (report.verification) {
        std::cout << "[i] Rescan of sanitized output: " << docshield::toString(report.verification->assessment.verdict)
                  << " (composite " << formatScore(report.verification->assessment.compositeScore) << ", delta "
                  << formatScore(report.verification->deltaRisk) << ")\n";
    }
    for (const auto &recommendation : report.recommendations) {
        std::cout << "  - " << recommendation << "\n";
    }
    if (detailed) {
        for (const auto &diagnostic : report.diagnostics) {
            std::cout << "[i] " << diagnostic << "\n";
        }
    }
}

void usage(const std::string &program) {
    std::cout << "Usage: " << program << " [options] --scan <file>...\n"
              << "  --scan <file>...          Scan documents (PDF, OOXML, RTF) and disarm malicious ones\n"
              << "  --json                    Emit reports as JSON\n"
              << "  --detailed                Include explanations, fallback chain and diagnostics\n"
              << "  --output-dir <dir>        Write sanitized copies into directory\n"
              << "  --config <file>           Load key=value scan settings\n"
              << "  --model <file>            Load classifier model (overrides model_path)\n"
              << "  --jobs <n>                Number of concurrent scans (default 1)\n"
              << "  --timeout <seconds>       Per-document scan timeout (default 30)\n"
              << "  --help                    Show this help message\n";
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc == 1) {
        usage(argv[0]);
        return 0;
    }

    bool jsonOutput = false;
    bool detailedOutput = false;
    std::optional<fs::path> outputDir;
    std::optional<std::string> configPath;
    std::optional<std::string> modelPath;
    std::optional<unsigned> jobs;
    std::optional<unsigned> timeoutSeconds;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            usage(argv[0]);
            return 0;
        }

        if (arg == "--json") {
            jsonOutput = true;
            continue;
        }

        if (arg == "--detailed") {
            detailedOutput = true;
            continue;
        }

        if (arg == "--scan") {
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                files.emplace_back(argv[++i]);
            }
            if (files.empty()) {
                std::cerr << "--scan requires at least one file" << std::endl;
                return 1;
            }
            continue;
        }

        if (arg == "--output-dir" || arg == "--config" || arg == "--model" || arg == "--jobs" || arg == "--timeout") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value" << std::endl;
                return 1;
            }
            const std::string value = argv[++i];
            try {
                if (arg == "--output-dir") {
                    outputDir = fs::path(value);
                } else if (arg == "--config") {
                    configPath = value;
                } else if (arg == "--model") {
                    modelPath = value;
                } else if (arg == "--jobs") {
                    jobs = static_cast<unsigned>(std::stoul(value));
                } else {
                    timeoutSeconds = static_cast<unsigned>(std::stoul(value));
                }
            } catch (const std::exception &) {
                std::cerr << arg << " expects a number, got '" << value << "'" << std::endl;
                return 1;
            }
            continue;
        }

        std::cerr << "Unknown option: " << arg << std::endl;
        usage(argv[0]);
        return 1;
    }

    if (files.empty()) {
        std::cerr << "No files given; use --scan <file>..." << std::endl;
        return 1;
    }

    docshield::ScanSettings settings;
    if (configPath) {
        std::vector<std::string> diagnostics;
        try {
            settings = docshield::ScanSettings::loadFromFile(*configPath, &diagnostics);
        } catch (const std::exception &ex) {
            std::cerr << "Failed to load settings: " << ex.what() << std::endl;
            return 1;
        }
        for (const auto &message : diagnostics) {
            std::cerr << "[i] " << message << "\n";
        }
    }
    if (modelPath) {
        settings.modelPath = modelPath;
    }
    if (jobs) {
        settings.workerThreads = *jobs;
    }
    if (timeoutSeconds) {
        settings.scanTimeoutSeconds = *timeoutSeconds;
    }

    auto classifier = docshield::loadClassifier(settings.modelPath);
    if (const auto *model = dynamic_cast<const docshield::LogisticModelClassifier *>(classifier.get())) {
        if (!model->available()) {
            std::cerr << "[!] Classifier unavailable: " << model->loadError() << "\n";
        }
    }
    auto scanner = std::make_shared<const docshield::DocumentScanner>(settings, classifier);

    int exitCode = 0;
    std::vector<docshield::BatchItem> items;
    for (const auto &file : files) {
        auto bytes = readFile(file);
        if (!bytes) {
            std::cerr << "[!] Unable to read " << file << std::endl;
            exitCode = 1;
            continue;
        }
        items.push_back({file, std::move(*bytes), std::nullopt});
    }

    const docshield::BatchScanner batch(scanner, settings.workerThreads, std::chrono::seconds(settings.scanTimeoutSeconds));
    const auto results = batch.run(items);

    if (jsonOutput) {
        std::cout << "[\n";
    }
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto &result = results[i];
        std::optional<fs::path> sanitizedPath;
        if (result.completed && outputDir && result.report.sanitized()) {
            sanitizedPath = writeSanitizedCopy(*outputDir, result.filename, result.report.sanitization->output);
            if (!sanitizedPath) {
                std::cerr << "[!] Unable to write sanitized copy of " << result.filename << std::endl;
                exitCode = 1;
            }
        }
        if (!result.completed) {
            exitCode = 1;
        }
        if (jsonOutput) {
            printReportJson(result, sanitizedPath, detailedOutput, i + 1 == results.size());
        } else {
            printReportText(result, sanitizedPath, detailedOutput);
        }
    }
    if (jsonOutput) {
        std::cout << "]\n";
    }
    return exitCode;
}
