#include <QtTest/QtTest>
#include "core/indexing/document_structure.h"

class TestDocumentStructure : public QObject {
    Q_OBJECT

private slots:
    void testHeadingText_data();
    void testHeadingText();
    void testNoHeadingsReturnsNullopt();
    void testSectionsAndHeadingPath();
    void testPreambleSection();
    void testParagraphSpans();
    void testHeadingsInsideFenceIgnored();
    void testSkippedLevelPath();
};

void TestDocumentStructure::testHeadingText_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<bool>("isHeading");
    QTest::addColumn<QString>("text");
    QTest::addColumn<int>("level");

    QTest::newRow("h1") << QStringLiteral("# Title") << true << QStringLiteral("Title") << 1;
    QTest::newRow("h3") << QStringLiteral("### Deep") << true << QStringLiteral("Deep") << 3;
    QTest::newRow("indented") << QStringLiteral("   ## Indented") << true
                              << QStringLiteral("Indented") << 2;
    QTest::newRow("closing-hashes") << QStringLiteral("## Setup ##") << true
                                    << QStringLiteral("Setup") << 2;
    QTest::newRow("tab-separator") << QStringLiteral("#\tTabbed") << true
                                   << QStringLiteral("Tabbed") << 1;
    QTest::newRow("no-space") << QStringLiteral("#NoSpace") << false << QString() << 0;
    QTest::newRow("seven-hashes") << QStringLiteral("####### Too deep") << false << QString() << 0;
    QTest::newRow("four-spaces") << QStringLiteral("    # Code") << false << QString() << 0;
    QTest::newRow("empty-heading") << QStringLiteral("## ") << false << QString() << 0;
    QTest::newRow("plain") << QStringLiteral("Just text") << false << QString() << 0;
}

void TestDocumentStructure::testHeadingText()
{
    QFETCH(QString, line);
    QFETCH(bool, isHeading);
    QFETCH(QString, text);
    QFETCH(int, level);

    int parsedLevel = 0;
    const auto heading = sift::MarkdownStructureParser::headingText(line, &parsedLevel);
    QCOMPARE(heading.has_value(), isHeading);
    if (isHeading) {
        QCOMPARE(*heading, text);
        QCOMPARE(parsedLevel, level);
    }
}

void TestDocumentStructure::testNoHeadingsReturnsNullopt()
{
    QVERIFY(!sift::MarkdownStructureParser::parse(
                 QStringLiteral("First paragraph.\n\nSecond paragraph.\n")).has_value());
    QVERIFY(!sift::MarkdownStructureParser::parse(QString()).has_value());
}

void TestDocumentStructure::testSectionsAndHeadingPath()
{
    const QString text = QStringLiteral(
        "# Guide\n"
        "Intro text.\n"
        "\n"
        "## Install\n"
        "Run the installer.\n"
        "\n"
        "### Linux\n"
        "Use the package.\n"
        "\n"
        "## Usage\n"
        "Call it.\n");

    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());
    QCOMPARE(structure->textLength, static_cast<int>(text.size()));
    QCOMPARE(static_cast<int>(structure->sections.size()), 4);

    QCOMPARE(structure->sections[0].heading, QStringLiteral("Guide"));
    QCOMPARE(structure->sections[0].level, 1);
    QCOMPARE(structure->sections[0].headingPath, QStringList{QStringLiteral("Guide")});

    QCOMPARE(structure->sections[2].heading, QStringLiteral("Linux"));
    QCOMPARE(structure->sections[2].headingPath,
             (QStringList{QStringLiteral("Guide"), QStringLiteral("Install"),
                          QStringLiteral("Linux")}));

    // A sibling at level 2 drops the level-3 ancestor.
    QCOMPARE(structure->sections[3].headingPath,
             (QStringList{QStringLiteral("Guide"), QStringLiteral("Usage")}));
}

void TestDocumentStructure::testPreambleSection()
{
    const QString text = QStringLiteral("Opening words.\n\n# First\nBody.\n");
    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());
    QCOMPARE(static_cast<int>(structure->sections.size()), 2);

    const sift::DocumentSection& preamble = structure->sections[0];
    QVERIFY(preamble.heading.isEmpty());
    QCOMPARE(preamble.level, 0);
    QVERIFY(!preamble.headingSpan.has_value());
    QCOMPARE(static_cast<int>(preamble.paragraphs.size()), 1);
    QCOMPARE(text.mid(preamble.paragraphs[0].start, preamble.paragraphs[0].length()),
             QStringLiteral("Opening words."));
}

void TestDocumentStructure::testParagraphSpans()
{
    const QString text = QStringLiteral("# Notes\nline one\nline two\n\n\nnext para\n");
    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());
    QCOMPARE(static_cast<int>(structure->sections.size()), 1);

    const sift::DocumentSection& section = structure->sections[0];
    QVERIFY(section.headingSpan.has_value());
    QCOMPARE(text.mid(section.headingSpan->start, section.headingSpan->length()),
             QStringLiteral("# Notes"));
    QCOMPARE(static_cast<int>(section.paragraphs.size()), 2);
    QCOMPARE(text.mid(section.paragraphs[0].start, section.paragraphs[0].length()),
             QStringLiteral("line one\nline two"));
    QCOMPARE(text.mid(section.paragraphs[1].start, section.paragraphs[1].length()),
             QStringLiteral("next para"));
}

void TestDocumentStructure::testHeadingsInsideFenceIgnored()
{
    const QString text = QStringLiteral(
        "# Real\n"
        "```\n"
        "# not a heading\n"
        "\n"
        "still code\n"
        "```\n"
        "after\n");

    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());
    QCOMPARE(static_cast<int>(structure->sections.size()), 1);

    const sift::DocumentSection& section = structure->sections[0];
    QCOMPARE(section.heading, QStringLiteral("Real"));
    // The fence, including its blank line, stays one paragraph with the text after it.
    QCOMPARE(static_cast<int>(section.paragraphs.size()), 1);
    const QString paragraph = text.mid(section.paragraphs[0].start, section.paragraphs[0].length());
    QVERIFY(paragraph.contains(QStringLiteral("# not a heading")));
    QVERIFY(paragraph.contains(QStringLiteral("still code")));
    QVERIFY(paragraph.endsWith(QStringLiteral("after")));
}

void TestDocumentStructure::testSkippedLevelPath()
{
    const QString text = QStringLiteral("# Top\n\n### Deep\nbody\n");
    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());
    QCOMPARE(static_cast<int>(structure->sections.size()), 2);
    QCOMPARE(structure->sections[1].headingPath,
             (QStringList{QStringLiteral("Top"), QStringLiteral("Deep")}));
}

QTEST_MAIN(TestDocumentStructure)
#include "test_document_structure.moc"
