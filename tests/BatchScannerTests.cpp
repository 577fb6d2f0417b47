#include "DocShield/BatchScanner.hpp"
#include "DocShield/ScanDeadline.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace docshield;
using namespace std::chrono_literals;

namespace {

class SlowClassifier : public ThreatClassifier {
  public:
    std::optional<double> score(const FeatureMap &) const override {
        std::this_thread::sleep_for(200ms);
        return 0.0;
    }
};

} // namespace

TEST(BatchScannerTest, ScansEveryItemInOrder) {
    auto scanner = std::make_shared<const DocumentScanner>();
    const BatchScanner batch(scanner, 3, 10s);

    std::vector<BatchItem> items = {
        {"a.pdf", fixtures::benignPdf(), std::nullopt},
        {"b.pdf", fixtures::javascriptOpenActionPdf(), std::nullopt},
        {"c.rtf", fixtures::embeddedObjectRtf(), std::nullopt},
        {"d.docx", fixtures::buildDocx(), std::string("application/vnd.openxmlformats-officedocument.wordprocessingml.document")},
    };
    const auto results = batch.run(items);

    ASSERT_EQ(results.size(), items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(results[i].filename, items[i].filename);
        EXPECT_TRUE(results[i].completed) << results[i].errorMessage;
        EXPECT_FALSE(results[i].timedOut);
    }
    EXPECT_EQ(results[0].report.assessment.verdict, Verdict::Benign);
    EXPECT_EQ(results[1].report.assessment.verdict, Verdict::Malicious);
    EXPECT_EQ(results[2].report.assessment.verdict, Verdict::Malicious);
    EXPECT_EQ(results[3].report.assessment.verdict, Verdict::Benign);
}

TEST(BatchScannerTest, TimeoutIsReportedAsFailure) {
    auto scanner = std::make_shared<const DocumentScanner>(ScanSettings{}, std::make_shared<SlowClassifier>());
    const BatchScanner batch(scanner, 1, 20ms);

    const auto results = batch.run({{"slow.pdf", fixtures::benignPdf(), std::nullopt}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].completed);
    EXPECT_TRUE(results[0].timedOut);
    EXPECT_NE(results[0].errorMessage.find("timeout"), std::string::npos);
}

TEST(BatchScannerTest, TimedOutItemDoesNotBlockTheRest) {
    auto scanner = std::make_shared<const DocumentScanner>(ScanSettings{}, std::make_shared<SlowClassifier>());
    const BatchScanner batch(scanner, 2, 20ms);

    const auto results = batch.run({{"one.pdf", fixtures::benignPdf(), std::nullopt},
                                    {"two.rtf", fixtures::benignRtf(), std::nullopt},
                                    {"three.pdf", fixtures::benignPdf(), std::nullopt}});
    ASSERT_EQ(results.size(), 3u);
    for (const auto &result : results) {
        EXPECT_TRUE(result.timedOut) << result.filename;
        EXPECT_FALSE(result.completed);
    }
}

TEST(BatchScannerTest, DeadlineStopsLongParsing) {
    std::string text = "{\\rtf1\\ansi ";
    for (int i = 0; i < 20000; ++i) {
        text += "{\\b x}";
    }
    text += "}";
    const DocumentScanner scanner;

    const ScanDeadline deadline(ScanDeadline::Clock::now() - 1ms);
    EXPECT_THROW(scanner.scan(text, "long.rtf"), ScanTimedOut);
}

TEST(BatchScannerTest, EmptyBatch) {
    const BatchScanner batch(std::make_shared<const DocumentScanner>(), 4, 1s);
    EXPECT_TRUE(batch.run({}).empty());
}
