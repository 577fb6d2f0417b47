#include "DocShield/OoxmlAnalyzer.hpp"
#include "DocShield/OoxmlPackage.hpp"
#include "DocShield/OoxmlSanitizer.hpp"
#include "DocShield/ScanSettings.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace docshield;

namespace {

std::string memberOf(const std::string &package, const std::string &name) {
    auto reader = ZipReader::open(package);
    const auto *entry = reader.find(name);
    return entry == nullptr ? std::string() : reader.read(*entry);
}

} // namespace

TEST(OoxmlPackageTest, PartHelpers) {
    EXPECT_TRUE(ooxml::isDangerousPart("word/vbaProject.bin"));
    EXPECT_TRUE(ooxml::isDangerousPart("ppt/embeddings/oleObject2.bin"));
    EXPECT_FALSE(ooxml::isDangerousPart("word/document.xml"));
    EXPECT_EQ(ooxml::constructForPart("xl/vbaProject.bin"), "vba_macro");
    EXPECT_EQ(ooxml::sourcePartOf("word/_rels/document.xml.rels"), "word/document.xml");
    EXPECT_EQ(ooxml::sourcePartOf("_rels/.rels"), "");
    EXPECT_EQ(ooxml::resolveTarget("word/_rels/document.xml.rels", "../customXml/item1.xml"), "customXml/item1.xml");
    EXPECT_EQ(ooxml::resolveTarget("word/_rels/document.xml.rels", "media/image1.png"), "word/media/image1.png");
}

TEST(OoxmlPackageTest, RelationshipCleaning) {
    const std::string xml =
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://x/relationships/styles\" Target=\"styles.xml\"/>"
        "<Relationship Id=\"rId2\" Type=\"http://x/relationships/vbaProject\" Target=\"vbaProject.bin\"/>"
        "<Relationship Id=\"rId3\" Type=\"http://x/relationships/hyperlink\" Target=\"https://a.example\" "
        "TargetMode=\"External\"/>"
        "</Relationships>";

    const auto parsed = ooxml::parseRelationships(xml);
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_TRUE(parsed[2].isExternal());
    EXPECT_FALSE(parsed[0].isExternal());

    const auto rewrite = ooxml::cleanRelationships("word/_rels/document.xml.rels", xml, {"word/vbaProject.bin"});
    EXPECT_TRUE(rewrite.changed());
    EXPECT_NE(rewrite.xml.find("styles.xml"), std::string::npos);
    EXPECT_EQ(rewrite.xml.find("vbaProject"), std::string::npos);
    EXPECT_EQ(rewrite.xml.find("https://a.example"), std::string::npos);

    EXPECT_THROW(ooxml::parseRelationships("<Relationships><Relationship"), MalformedContainer);
}

TEST(OoxmlPackageTest, UnsafeSchemes) {
    ooxml::Relationship relationship;
    relationship.target = "JavaScript:alert(1)";
    EXPECT_TRUE(relationship.hasUnsafeScheme());
    relationship.target = "https://example.org";
    EXPECT_FALSE(relationship.hasUnsafeScheme());
}

TEST(OoxmlPackageTest, ActiveNodeRemovalKeepsWhitespaceRuns) {
    const std::string xml =
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body><w:p>"
        "<w:r><w:t>Hello</w:t></w:r><w:r><w:t xml:space=\"preserve\"> </w:t></w:r><w:r><w:t>world</w:t></w:r>"
        "<w:control w:name=\"CheckBox1\"/></w:p></w:body></w:document>";

    const auto rewrite = ooxml::removeActiveNodes(xml);
    ASSERT_TRUE(rewrite.changed());
    EXPECT_EQ(rewrite.xml.find("w:control"), std::string::npos);
    EXPECT_NE(rewrite.xml.find("<w:t xml:space=\"preserve\"> </w:t>"), std::string::npos);
}

TEST(OoxmlAnalyzerTest, BenignPackageIsClean) {
    const ScanSettings settings;
    const OoxmlAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings(fixtures::buildDocx());
    EXPECT_TRUE(result.findings.empty());
}

TEST(OoxmlAnalyzerTest, DetectsMacrosAndEmbeddings) {
    const ScanSettings settings;
    const OoxmlAnalyzer analyzer(settings);
    fixtures::DocxOptions options;
    options.macro = true;
    options.embedding = true;
    const auto result = analyzer.detectFindings(fixtures::buildDocx(options));
    EXPECT_TRUE(result.hasFinding("office_macro"));
    EXPECT_TRUE(result.hasFinding("office_ole"));
    EXPECT_DOUBLE_EQ(result.ruleScore(), 0.9);
}

TEST(OoxmlAnalyzerTest, DetectsActiveXAndRelationships) {
    const ScanSettings settings;
    const OoxmlAnalyzer analyzer(settings);
    fixtures::DocxOptions options;
    options.activeX = true;
    options.hyperlink = true;
    options.remoteTemplate = true;
    const auto result = analyzer.detectFindings(fixtures::buildDocx(options));
    EXPECT_TRUE(result.hasFinding("office_activex"));
    EXPECT_TRUE(result.hasFinding("office_external_rel"));
    EXPECT_TRUE(result.hasFinding("office_remote_template"));
}

TEST(OoxmlAnalyzerTest, UnreadableContainer) {
    const ScanSettings settings;
    const OoxmlAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings("PK\x03\x04 truncated garbage with powershell");
    EXPECT_TRUE(result.hasFinding("office_unsupported_structure"));
    EXPECT_TRUE(result.hasFinding("suspicious_strings"));
}

TEST(OoxmlAnalyzerTest, EntryLimitIsReported) {
    ScanSettings settings;
    settings.maxZipEntries = 2;
    const OoxmlAnalyzer analyzer(settings);
    const auto result = analyzer.detectFindings(fixtures::buildDocx());
    EXPECT_TRUE(result.hasFinding("resource_limit"));
}

TEST(OoxmlSanitizerTest, RewriteDropsMacroProject) {
    const ScanSettings settings;
    fixtures::DocxOptions options;
    options.macro = true;
    const auto input = fixtures::buildDocx(options);
    const auto result = OoxmlRewriteStage(settings).attempt(input);

    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.removed.count("vba_macro"), 1u);

    auto reader = ZipReader::open(result.output);
    EXPECT_EQ(reader.find("word/vbaProject.bin"), nullptr);
    EXPECT_NE(reader.find("word/document.xml"), nullptr);
    EXPECT_EQ(memberOf(result.output, "word/_rels/document.xml.rels").find("vbaProject"), std::string::npos);
    const auto types = memberOf(result.output, "[Content_Types].xml");
    EXPECT_EQ(types.find("macroEnabled"), std::string::npos);
    EXPECT_EQ(types.find("vbaProject"), std::string::npos);

    const OoxmlAnalyzer analyzer(settings);
    EXPECT_FALSE(analyzer.detectFindings(result.output).hasFinding("office_macro"));
}

TEST(OoxmlSanitizerTest, RewriteStripsActiveNodesAndTemplates) {
    const ScanSettings settings;
    fixtures::DocxOptions options;
    options.activeX = true;
    options.remoteTemplate = true;
    const auto result = OoxmlRewriteStage(settings).attempt(fixtures::buildDocx(options));

    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.removed.count("activex"), 1u);
    EXPECT_EQ(result.removed.count("remote_template"), 1u);
    EXPECT_EQ(memberOf(result.output, "word/document.xml").find("w:control"), std::string::npos);
    EXPECT_EQ(memberOf(result.output, "word/settings.xml").find("attachedTemplate"), std::string::npos);

    const OoxmlAnalyzer analyzer(settings);
    const auto rescan = analyzer.detectFindings(result.output);
    EXPECT_FALSE(rescan.hasFinding("office_activex"));
    EXPECT_FALSE(rescan.hasFinding("office_remote_template"));
}

TEST(OoxmlSanitizerTest, CleanPackageIsNoOp) {
    const ScanSettings settings;
    const auto input = fixtures::buildDocx();
    const auto result = OoxmlRewriteStage(settings).attempt(input);
    ASSERT_TRUE(result.succeeded);
    EXPECT_TRUE(result.removed.empty());
    EXPECT_EQ(result.output, input);
}

TEST(OoxmlSanitizerTest, SalvageWorksWithoutCentralDirectory) {
    const ScanSettings settings;
    fixtures::DocxOptions options;
    options.macro = true;
    const auto input = fixtures::buildDocx(options);
    const auto damaged = input.substr(0, input.find(std::string("PK\x01\x02", 4)));

    EXPECT_THROW(OoxmlRewriteStage(settings).attempt(damaged), MalformedContainer);
    const auto result = OoxmlSalvageStage(settings).attempt(damaged);
    ASSERT_TRUE(result.succeeded) << result.errorMessage;
    EXPECT_EQ(result.removed.count("vba_macro"), 1u);
    EXPECT_EQ(ZipReader::open(result.output).find("word/vbaProject.bin"), nullptr);
}

TEST(OoxmlSanitizerTest, PackageMarkerAddsMember) {
    const ScanSettings settings;
    const auto marked = addPackageMarker(fixtures::buildDocx(), settings);
    const auto reader = ZipReader::open(marked);
    EXPECT_NE(reader.find("docshield.txt"), nullptr);
    EXPECT_NE(reader.find("word/document.xml"), nullptr);
}
