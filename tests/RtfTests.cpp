#include "DocShield/RtfAnalyzer.hpp"
#include "DocShield/RtfDocument.hpp"
#include "DocShield/RtfSanitizer.hpp"
#include "DocShield/ScanSettings.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace docshield;

TEST(RtfDocumentTest, ParsesGroupsAndControlWords) {
    const auto text = fixtures::embeddedObjectRtf();
    const auto document = rtf::Document::parse(text, true);

    bool sawObject = false;
    bool sawObjdata = false;
    for (const auto &group : document.groups()) {
        sawObject = sawObject || group.destination == "object";
        if (group.destination == "objdata") {
            sawObjdata = true;
            EXPECT_TRUE(group.ignorable);
            EXPECT_TRUE(group.closed);
        }
    }
    EXPECT_TRUE(sawObject);
    EXPECT_TRUE(sawObjdata);

    bool sawWidth = false;
    for (const auto &word : document.controlWords()) {
        if (word.word == "objw") {
            sawWidth = true;
            EXPECT_TRUE(word.hasParameter);
            EXPECT_EQ(word.parameter, 100);
        }
    }
    EXPECT_TRUE(sawWidth);
}

TEST(RtfDocumentTest, StrictParsingRejectsDamage) {
    EXPECT_THROW(rtf::Document::parse("{\\rtf1 unbalanced", true), MalformedContainer);
    EXPECT_THROW(rtf::Document::parse("plain text}", true), MalformedContainer);
    EXPECT_NO_THROW(rtf::Document::parse("{\\rtf1 unbalanced", false));
}

TEST(RtfDocumentTest, FieldInstructions) {
    const auto text = fixtures::ddeFieldRtf();
    const auto document = rtf::Document::parse(text, true);
    for (const auto &group : document.groups()) {
        if (group.destination == "field") {
            EXPECT_EQ(rtf::classifyField(document.fieldInstruction(group)), rtf::FieldKind::Dde);
        }
    }
    EXPECT_EQ(rtf::classifyField("INCLUDETEXT \"c:/a.txt\""), rtf::FieldKind::Include);
    EXPECT_EQ(rtf::classifyField(" PAGE "), rtf::FieldKind::Plain);
    EXPECT_EQ(document.plainText(0, text.size()).find("fldinst"), std::string::npos);
}

TEST(RtfDocumentTest, FieldRecordsItsInstructionGroup) {
    const auto text = fixtures::ddeFieldRtf();
    const auto document = rtf::Document::parse(text, true);
    std::size_t fields = 0;
    for (const auto &group : document.groups()) {
        if (group.destination == "field") {
            ++fields;
            ASSERT_LT(group.instruction, document.groups().size());
            EXPECT_EQ(document.groups()[group.instruction].destination, "fldinst");
        } else {
            EXPECT_EQ(group.instruction, std::string::npos);
        }
    }
    EXPECT_EQ(fields, 1u);
}

TEST(RtfDocumentTest, InstructionTextIsBounded) {
    const std::string text = "{\\rtf1{\\field{\\*\\fldinst PAGE " + std::string(5000, 'x') + "}{\\fldrslt 1}}}";
    const auto document = rtf::Document::parse(text, true);
    for (const auto &group : document.groups()) {
        if (group.destination == "field") {
            EXPECT_LE(document.fieldInstruction(group).size(), rtf::Document::kInstructionBytes);
        }
    }
}

TEST(RtfDocumentTest, ParseStopsAtLimits) {
    rtf::ParseLimits limits;
    limits.maxGroups = 3;
    const auto document = rtf::Document::parse("{\\rtf1{\\b a}{\\i b}{\\ul c}}", true, limits);
    EXPECT_TRUE(document.truncated());
    EXPECT_EQ(document.groups().size(), 3u);

    limits = rtf::ParseLimits{};
    limits.maxControlWords = 2;
    EXPECT_TRUE(rtf::Document::parse("{\\rtf1\\ansi\\b bold}", true, limits).truncated());
    EXPECT_FALSE(rtf::Document::parse("{\\rtf1\\ansi\\b bold}", true).truncated());
}

TEST(RtfDocumentTest, DecodesHexEscapes) {
    const std::string text = "{\\rtf1 caf\\'e9}";
    const auto document = rtf::Document::parse(text, true);
    EXPECT_NE(document.plainText(0, text.size()).find("caf\xE9"), std::string::npos);
}

TEST(RtfAnalyzerTest, BenignDocument) {
    const ScanSettings settings;
    const RtfAnalyzer analyzer(settings);
    EXPECT_TRUE(analyzer.detectFindings(fixtures::benignRtf()).findings.empty());
}

TEST(RtfAnalyzerTest, EmbeddedObjects) {
    const ScanSettings settings;
    const RtfAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings(fixtures::embeddedObjectRtf());
    EXPECT_TRUE(result.hasFinding("rtf_object"));
    EXPECT_TRUE(result.hasFinding("rtf_objdata"));
    EXPECT_DOUBLE_EQ(result.ruleScore(), 1.0);

    std::size_t objectFindings = 0;
    for (const auto &finding : result.findings) {
        objectFindings += finding.id == "rtf_object" ? 1 : 0;
    }
    EXPECT_EQ(objectFindings, 1u);
}

TEST(RtfAnalyzerTest, FieldKinds) {
    const ScanSettings settings;
    const RtfAnalyzer analyzer(settings);
    EXPECT_TRUE(analyzer.detectFindings(fixtures::ddeFieldRtf()).hasFinding("rtf_dde_field"));
    EXPECT_TRUE(analyzer.detectFindings(fixtures::includePictureRtf()).hasFinding("rtf_include_field"));

    const auto plain = analyzer.detectFindings(fixtures::pageFieldRtf());
    EXPECT_TRUE(plain.hasFinding("rtf_field"));
    EXPECT_DOUBLE_EQ(plain.ruleScore(), 0.1);
}

TEST(RtfAnalyzerTest, ReportsGroupLimit) {
    ScanSettings settings;
    settings.maxRtfGroups = 2;
    const RtfAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings(fixtures::embeddedObjectRtf());
    EXPECT_TRUE(result.hasFinding("resource_limit"));
}

TEST(RtfAnalyzerTest, ManyFieldsStayLinear) {
    std::string text = "{\\rtf1\\ansi ";
    for (int i = 0; i < 20000; ++i) {
        text += "{\\field{\\*\\fldinst PAGE}{\\fldrslt 1}}";
    }
    text += "{\\field{\\*\\fldinst DDEAUTO excel \"s!R1C1\"}{\\fldrslt 2}}}";

    const ScanSettings settings;
    const RtfAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings(text);
    EXPECT_TRUE(result.hasFinding("rtf_field"));
    EXPECT_TRUE(result.hasFinding("rtf_dde_field"));
    EXPECT_FALSE(result.hasFinding("resource_limit"));

    const auto cleaned = RtfGroupStage(settings).attempt(text);
    ASSERT_TRUE(cleaned.succeeded) << cleaned.errorMessage;
    EXPECT_EQ(cleaned.removed.count("dde_field"), 1u);
    EXPECT_EQ(cleaned.output.find("DDEAUTO"), std::string::npos);
}

TEST(RtfSanitizerTest, StagesFailWhenLimitsAreReached) {
    ScanSettings settings;
    settings.maxRtfControlWords = 3;
    const auto input = fixtures::embeddedObjectRtf();
    EXPECT_FALSE(RtfGroupStage(settings).attempt(input).succeeded);
    EXPECT_FALSE(RtfLenientStage(settings).attempt(input).succeeded);
}

TEST(RtfSanitizerTest, GroupStageExcisesObject) {
    const ScanSettings settings;
    const auto input = fixtures::embeddedObjectRtf();
    const auto result = RtfGroupStage(settings).attempt(input);
    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.removed.count("embedded_object"), 1u);
    EXPECT_EQ(result.output.find("\\object"), std::string::npos);
    EXPECT_EQ(result.output.find("\\objdata"), std::string::npos);
    EXPECT_NE(result.output.find("Summary"), std::string::npos);
    EXPECT_NO_THROW(rtf::Document::parse(result.output, true));
}

TEST(RtfSanitizerTest, GroupStageRemovesDdeField) {
    const ScanSettings settings;
    const auto result = RtfGroupStage(settings).attempt(fixtures::ddeFieldRtf());
    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.removed.count("dde_field"), 1u);
    EXPECT_EQ(result.output.find("DDEAUTO"), std::string::npos);
}

TEST(RtfSanitizerTest, LenientStageHandlesBrokenDocuments) {
    const ScanSettings settings;
    const std::string broken = "{\\rtf1 text {\\object\\objemb{\\*\\objdata 0102";
    EXPECT_THROW(RtfGroupStage(settings).attempt(broken), MalformedContainer);

    const auto result = RtfLenientStage(settings).attempt(broken);
    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.output.find("objdata"), std::string::npos);
    EXPECT_FALSE(result.removed.empty());
}

TEST(RtfSanitizerTest, CleanDocumentIsNoOp) {
    const ScanSettings settings;
    const auto input = fixtures::pageFieldRtf();
    const auto result = RtfGroupStage(settings).attempt(input);
    ASSERT_TRUE(result.succeeded);
    EXPECT_TRUE(result.removed.empty());
    EXPECT_EQ(result.output, input);
}
