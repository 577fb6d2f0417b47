#include "DocShield/FormatClassifier.hpp"
#include "TestDocuments.hpp"

#include <gtest/gtest.h>

using namespace docshield;

TEST(FormatClassifierTest, ExtensionWinsOverContent) {
    const auto format = FormatClassifier::classify("notes.RTF", fixtures::benignPdf());
    EXPECT_EQ(format.family, FormatFamily::Rtf);
    ASSERT_TRUE(format.contentFamily.has_value());
    EXPECT_EQ(*format.contentFamily, FormatFamily::Pdf);
    EXPECT_EQ(format.effectiveFamily(), FormatFamily::Pdf);

    const auto sheet = FormatClassifier::classify("book.xlsm", "");
    EXPECT_EQ(sheet.family, FormatFamily::Ooxml);
    EXPECT_EQ(sheet.ooxml, OoxmlKind::Spreadsheet);
    EXPECT_FALSE(sheet.contentFamily.has_value());
}

TEST(FormatClassifierTest, MatchingContentLeavesFamilyAlone) {
    const auto format = FormatClassifier::classify("report.pdf", fixtures::benignPdf());
    EXPECT_FALSE(format.contentFamily.has_value());
    EXPECT_EQ(format.effectiveFamily(), FormatFamily::Pdf);

    const auto renamed = FormatClassifier::classify("invoice.docx", fixtures::embeddedObjectRtf());
    EXPECT_EQ(renamed.family, FormatFamily::Ooxml);
    EXPECT_EQ(renamed.effectiveFamily(), FormatFamily::Rtf);
}

TEST(FormatClassifierTest, DeclaredContentTypeUsedWithoutExtension) {
    const auto format = FormatClassifier::classify("upload", "", std::string("application/pdf"));
    EXPECT_EQ(format.family, FormatFamily::Pdf);
}

TEST(FormatClassifierTest, FallsBackToMagicBytes) {
    EXPECT_EQ(FormatClassifier::classify("blob", fixtures::benignPdf()).family, FormatFamily::Pdf);
    EXPECT_EQ(FormatClassifier::classify("blob", "  " + fixtures::benignRtf()).family, FormatFamily::Rtf);

    const auto docx = FormatClassifier::classify("blob", fixtures::buildDocx());
    EXPECT_EQ(docx.family, FormatFamily::Ooxml);
    EXPECT_EQ(docx.ooxml, OoxmlKind::WordProcessing);
}

TEST(FormatClassifierTest, UnrecognisedInputIsUnknown) {
    ZipWriter writer;
    writer.add("photo.jpg", "jpeg");
    EXPECT_EQ(FormatClassifier::classify("archive", writer.finish()).family, FormatFamily::Unknown);
    EXPECT_EQ(FormatClassifier::classify("", "").family, FormatFamily::Unknown);
    EXPECT_EQ(FormatClassifier::classify("tool.exe", "MZ\x90").family, FormatFamily::Unknown);
}

TEST(FormatClassifierTest, MetadataHelpers) {
    EXPECT_EQ(FormatClassifier::extensionOf("Report.Final.DOCX"), "docx");
    EXPECT_EQ(FormatClassifier::extensionOf("noext"), "");
    EXPECT_EQ(FormatClassifier::guessMime("a.pdf"), "application/pdf");
    EXPECT_EQ(FormatClassifier::guessMime("a.bin"), "application/octet-stream");
}
