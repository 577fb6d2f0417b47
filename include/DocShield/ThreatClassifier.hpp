#pragma once

#include "ScanSettings.hpp"
#include "ScanTypes.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docshield {

constexpr const char *kFeatureSchema = "docshield-features-v1";

const std::vector<std::string> &featureNames();

class FeatureExtractor {
  public:
    explicit FeatureExtractor(const ScanSettings &settings) : settings(settings) {}

    // Derived from raw bytes only; independent of the structural analyzers.
    FeatureMap extract(const std::string &bytes, const FormatKind &format) const;

  private:
    const ScanSettings &settings;
};

class ThreatClassifier {
  public:
    virtual ~ThreatClassifier() = default;

    // Probability in [0, 1], or nullopt when no model is available.
    virtual std::optional<double> score(const FeatureMap &features) const = 0;

    ClassifierSignal signal(const FeatureMap &features) const;
};

// Logistic model read from a line-oriented file:
//   schema,docshield-features-v1
//   bias,<value>
//   weight,<feature>,<value>
// The file is loaded on first use; afterwards the model is read-only.
class LogisticModelClassifier : public ThreatClassifier {
  public:
    explicit LogisticModelClassifier(std::string path);

    std::optional<double> score(const FeatureMap &features) const override;

    bool available() const;
    std::string loadError() const;

  private:
    void load() const;

    std::string path;
    mutable std::once_flag loadOnce;
    mutable bool loaded{false};
    mutable std::string error;
    mutable double bias{0.0};
    mutable std::map<std::string, double> weights;
};

} // namespace docshield
