#include "DocShield/ScanSettings.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace docshield;

TEST(ScanSettingsTest, Defaults) {
    const ScanSettings settings;
    EXPECT_EQ(settings.maxArtifactBytes, 30ull * 1024 * 1024);
    EXPECT_EQ(settings.maxPdfObjects, 1000u);
    EXPECT_EQ(settings.textScanWindow, 300000u);
    EXPECT_DOUBLE_EQ(settings.entropyThreshold, 0.9);
    EXPECT_FALSE(settings.modelPath.has_value());
}

TEST(ScanSettingsTest, LoadsKeyValueFile) {
    const fixtures::TempFile file("# limits\n"
                                  "max_artifact_bytes = 1048576\n"
                                  "max_pdf_objects=50\n"
                                  "max_rtf_groups=5000\n"
                                  "entropy_threshold=0.85\n"
                                  "model_path=/opt/docshield/model.csv\n"
                                  "worker_threads=4\n"
                                  "colour=blue\n"
                                  "not a pair\n");
    std::vector<std::string> diagnostics;
    const auto settings = ScanSettings::loadFromFile(file.name(), &diagnostics);

    EXPECT_EQ(settings.maxArtifactBytes, 1048576u);
    EXPECT_EQ(settings.maxPdfObjects, 50u);
    EXPECT_EQ(settings.maxRtfGroups, 5000u);
    EXPECT_EQ(settings.maxRtfControlWords, ScanSettings{}.maxRtfControlWords);
    EXPECT_DOUBLE_EQ(settings.entropyThreshold, 0.85);
    ASSERT_TRUE(settings.modelPath.has_value());
    EXPECT_EQ(*settings.modelPath, "/opt/docshield/model.csv");
    EXPECT_EQ(settings.workerThreads, 4u);
    EXPECT_EQ(diagnostics.size(), 2u);
}

TEST(ScanSettingsTest, RejectsInvalidValues) {
    const fixtures::TempFile file("max_pdf_objects=lots\n");
    EXPECT_THROW(ScanSettings::loadFromFile(file.name()), std::runtime_error);
    EXPECT_THROW(ScanSettings::loadFromFile("/nonexistent/docshield.conf"), std::runtime_error);
}
