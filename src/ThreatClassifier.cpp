#include "DocShield/ThreatClassifier.hpp"

#include "DocShield/ContentHeuristics.hpp"
#include "DocShield/ZipArchive.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace docshield {

namespace {

std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> splitFields(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

double parseNumber(const std::string &text) {
    std::size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != text.size() || !std::isfinite(value)) {
        throw std::invalid_argument("not a finite number: " + text);
    }
    return value;
}

std::size_t countPageObjects(const std::string &bytes) {
    std::size_t count = 0;
    for (const std::string marker : {"/Type/Page", "/Type /Page"}) {
        std::size_t pos = 0;
        while ((pos = bytes.find(marker, pos)) != std::string::npos) {
            pos += marker.size();
            if (pos >= bytes.size() || bytes[pos] != 's') {
                ++count;
            }
        }
    }
    return count;
}

} // namespace

const std::vector<std::string> &featureNames() {
    static const std::vector<std::string> names = {
        "size_bytes", "entropy", "pdf_has_javascript", "has_vba_project",
        "embedded_ole_count", "page_count", "has_embedded_objects"
    };
    return names;
}

FeatureMap FeatureExtractor::extract(const std::string &bytes, const FormatKind &format) const {
    FeatureMap features;
    for (const auto &name : featureNames()) {
        features[name] = 0.0;
    }
    features["size_bytes"] = static_cast<double>(bytes.size());
    features["entropy"] = heuristics::shannonEntropy(bytes.substr(0, std::min(bytes.size(), settings.entropyWindow)));

    switch (format.effectiveFamily()) {
    case FormatFamily::Pdf: {
        static const std::vector<std::string> markers = {"/JavaScript", "/OpenAction", "/AA", "/Launch"};
        features["pdf_has_javascript"] = std::any_of(markers.begin(), markers.end(), [&](const std::string &marker) {
            return bytes.find(marker) != std::string::npos;
        }) ? 1.0 : 0.0;
        features["page_count"] = static_cast<double>(countPageObjects(bytes));
        break;
    }
    case FormatFamily::Ooxml:
        try {
            const auto reader = ZipReader::open(bytes, zipLimitsFor(settings));
            double embedded = 0.0;
            for (const auto &entry : reader.entries()) {
                if (entry.name.find("vbaProject.bin") != std::string::npos) {
                    features["has_vba_project"] = 1.0;
                }
                if (entry.name.find("/embeddings/") != std::string::npos || entry.name.find("oleObject") != std::string::npos) {
                    embedded += 1.0;
                }
            }
            features["embedded_ole_count"] = embedded;
        } catch (const std::runtime_error &) {
            // An unreadable package contributes no container features.
            features["has_vba_project"] = 0.0;
            features["embedded_ole_count"] = 0.0;
        }
        break;
    case FormatFamily::Rtf: {
        const auto text = bytes.substr(0, std::min<std::size_t>(bytes.size(), 100000));
        features["has_embedded_objects"] =
            text.find("\\objdata") != std::string::npos || text.find("\\object") != std::string::npos ? 1.0 : 0.0;
        break;
    }
    case FormatFamily::Unknown:
        break;
    }
    return features;
}

ClassifierSignal ThreatClassifier::signal(const FeatureMap &features) const {
    ClassifierSignal result;
    const auto probability = score(features);
    if (probability && std::isfinite(*probability)) {
        result.available = true;
        result.probability = std::min(1.0, std::max(0.0, *probability));
    }
    return result;
}

LogisticModelClassifier::LogisticModelClassifier(std::string path) : path(std::move(path)) {}

void LogisticModelClassifier::load() const {
    std::ifstream input(path);
    if (!input) {
        error = "Unable to open model file " + path;
        return;
    }

    std::string schema;
    double parsedBias = 0.0;
    std::map<std::string, double> parsedWeights;
    const auto &known = featureNames();
    std::string line;
    std::size_t lineNumber = 0;
    try {
        while (std::getline(input, line)) {
            ++lineNumber;
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            const auto fields = splitFields(line);
            if (fields[0] == "schema" && fields.size() == 2) {
                schema = fields[1];
            } else if (fields[0] == "bias" && fields.size() == 2) {
                parsedBias = parseNumber(fields[1]);
            } else if (fields[0] == "weight" && fields.size() == 3) {
                if (std::find(known.begin(), known.end(), fields[1]) == known.end()) {
                    error = "Model references unknown feature '" + fields[1] + "'";
                    return;
                }
                parsedWeights[fields[1]] = parseNumber(fields[2]);
            } else {
                error = "Malformed model line " + std::to_string(lineNumber);
                return;
            }
        }
    } catch (const std::exception &ex) {
        error = "Malformed model line " + std::to_string(lineNumber) + ": " + ex.what();
        return;
    }

    if (schema != kFeatureSchema) {
        error = "Model schema '" + schema + "' does not match " + kFeatureSchema;
        return;
    }
    bias = parsedBias;
    weights = std::move(parsedWeights);
    loaded = true;
}

std::optional<double> LogisticModelClassifier::score(const FeatureMap &features) const {
    std::call_once(loadOnce, [this]() { load(); });
    if (!loaded) {
        return std::nullopt;
    }
    double z = bias;
    for (const auto &[name, weight] : weights) {
        const auto it = features.find(name);
        if (it != features.end()) {
            z += weight * it->second;
        }
    }
    return 1.0 / (1.0 + std::exp(-z));
}

bool LogisticModelClassifier::available() const {
    std::call_once(loadOnce, [this]() { load(); });
    return loaded;
}

std::string LogisticModelClassifier::loadError() const {
    std::call_once(loadOnce, [this]() { load(); });
    return error;
}

} // namespace docshield
