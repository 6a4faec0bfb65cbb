#include <QtTest/QtTest>
#include "core/indexing/chunker.h"
#include "core/indexing/document_structure.h"

class TestChunker : public QObject {
    Q_OBJECT

private slots:
    void testEmptyTextProducesNoChunks();
    void testShortTextSingleChunk();
    void testDeterministicBoundaries();
    void testTokenBoundRespected();
    void testFixedChunksOverlap();
    void testSplitPrefersParagraphBoundary();
    void testSemanticChunksCarryHeadingPath();
    void testSmallSectionMergedIntoNeighbour();
    void testOversizeParagraphFallsBackToFixed();
    void testMismatchedStructureFallsBackToFixed();
    void testChunkIndicesContiguous();
    void testForcedSplitKeepsSurrogatePairs();

private:
    static QString sentences(int count, const QString& word = QStringLiteral("lorem"));
};

QString TestChunker::sentences(int count, const QString& word)
{
    QStringList parts;
    for (int i = 0; i < count; ++i) {
        parts.append(QStringLiteral("Sentence %1 talks about %2 and nothing else.").arg(i).arg(word));
    }
    return parts.join(QLatin1Char(' '));
}

void TestChunker::testEmptyTextProducesNoChunks()
{
    sift::Chunker chunker;
    QVERIFY(chunker.chunk(QString(), QStringLiteral("t"), QStringLiteral("s"), {}).empty());
    QVERIFY(chunker.chunk(QStringLiteral("  \n\t \n "), QStringLiteral("t"),
                          QStringLiteral("s"), {}).empty());
}

void TestChunker::testShortTextSingleChunk()
{
    sift::Chunker chunker;
    sift::Metadata metadata;
    metadata.insert(QStringLiteral("file_path"), QStringLiteral("/docs/a.txt"));

    const auto chunks = chunker.chunk(QStringLiteral("cats are mammals"),
                                      QStringLiteral("Intro"), QStringLiteral("a.txt"), metadata);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].content, QStringLiteral("cats are mammals"));
    QCOMPARE(chunks[0].chunkIndex, 0);
    QVERIFY(chunks[0].id.isEmpty());
    QCOMPARE(chunks[0].tokenCount.value(), sift::estimateTokenCount(chunks[0].content));
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("title")).toString(), QStringLiteral("Intro"));
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("source")).toString(), QStringLiteral("a.txt"));
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("file_path")).toString(),
             QStringLiteral("/docs/a.txt"));
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("chunk_method")).toString(),
             QStringLiteral("fixed"));
    QVERIFY(!chunks[0].embedding.has_value());
}

void TestChunker::testDeterministicBoundaries()
{
    const QString text = sentences(200);
    sift::Chunker chunker;

    const auto first = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {});
    const auto second = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {});

    QVERIFY(first.size() > 1);
    QCOMPARE(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        QCOMPARE(first[i].content, second[i].content);
        QVERIFY(first[i].metadata == second[i].metadata);
    }
}

void TestChunker::testTokenBoundRespected()
{
    sift::ChunkerConfig config;
    config.chunkSize = 1000;
    config.chunkOverlap = 50;
    config.maxTokens = 40;   // 160-character window
    config.minChunkChars = 20;
    sift::Chunker chunker(config);
    QCOMPARE(chunker.windowSize(), 160);

    QString text = sentences(60);
    text += QStringLiteral(" ") + QString(500, QLatin1Char('x'));  // unbreakable run

    const auto chunks = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {});
    QVERIFY(chunks.size() > 5);
    for (const sift::Chunk& chunk : chunks) {
        QVERIFY2(sift::estimateTokenCount(chunk.content) <= config.maxTokens,
                 qPrintable(QStringLiteral("chunk %1 has %2 chars")
                                .arg(chunk.chunkIndex)
                                .arg(chunk.content.size())));
    }
}

void TestChunker::testFixedChunksOverlap()
{
    sift::ChunkerConfig config;
    config.chunkSize = 300;
    config.chunkOverlap = 60;
    config.minChunkChars = 10;
    sift::Chunker chunker(config);

    const auto chunks = chunker.chunk(sentences(40), QStringLiteral("t"), QStringLiteral("s"), {});
    QVERIFY(chunks.size() > 2);
    for (size_t i = 1; i < chunks.size(); ++i) {
        const int prevEnd = chunks[i - 1].metadata.value(QStringLiteral("char_end")).toInt();
        const int start = chunks[i].metadata.value(QStringLiteral("char_start")).toInt();
        QVERIFY(start < prevEnd);
        QVERIFY(prevEnd - start <= config.chunkOverlap);
    }
}

void TestChunker::testSplitPrefersParagraphBoundary()
{
    sift::ChunkerConfig config;
    config.chunkSize = 200;
    config.chunkOverlap = 0;
    config.minChunkChars = 10;
    config.useSemanticSplitting = false;
    sift::Chunker chunker(config);

    const QString first = QString(150, QLatin1Char('a'));
    const QString second = QStringLiteral("second paragraph with words in it ") + QString(80, QLatin1Char('b'));
    const auto chunks = chunker.chunk(first + QStringLiteral("\n\n") + second,
                                      QStringLiteral("t"), QStringLiteral("s"), {});
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QCOMPARE(chunks[0].content, first);
    QVERIFY(chunks[1].content.startsWith(QStringLiteral("second paragraph")));
}

void TestChunker::testSemanticChunksCarryHeadingPath()
{
    const QString intro = sentences(4, QStringLiteral("setup"));
    const QString install = sentences(4, QStringLiteral("installation"));
    const QString text = QStringLiteral("# Guide\n\n") + intro
        + QStringLiteral("\n\n## Install\n\n") + install + QStringLiteral("\n");

    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());

    sift::Chunker chunker;
    const auto chunks = chunker.chunk(text, QStringLiteral("Guide"), QStringLiteral("guide.md"),
                                      {}, &*structure);
    QCOMPARE(static_cast<int>(chunks.size()), 2);

    QCOMPARE(chunks[0].metadata.value(QStringLiteral("chunk_method")).toString(),
             QStringLiteral("semantic"));
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("heading")).toString(), QStringLiteral("Guide"));
    QVERIFY(chunks[0].content.startsWith(QStringLiteral("# Guide")));

    QCOMPARE(chunks[1].metadata.value(QStringLiteral("heading")).toString(),
             QStringLiteral("Install"));
    QCOMPARE(chunks[1].metadata.value(QStringLiteral("heading_path")).toString(),
             QStringLiteral("Guide > Install"));
    QVERIFY(chunks[1].content.startsWith(QStringLiteral("## Install")));
    QVERIFY(chunks[1].content.contains(QStringLiteral("installation")));
}

void TestChunker::testSmallSectionMergedIntoNeighbour()
{
    const QString text = QStringLiteral("# A\n\nTiny.\n\n# B\n\n") + sentences(5) + QStringLiteral("\n");
    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());

    sift::Chunker chunker;
    const auto chunks = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {}, &*structure);

    // "# A / Tiny." is under minChunkChars and first, so it folds forward.
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QVERIFY(chunks[0].content.startsWith(QStringLiteral("# A")));
    QVERIFY(chunks[0].content.contains(QStringLiteral("# B")));
}

void TestChunker::testOversizeParagraphFallsBackToFixed()
{
    sift::ChunkerConfig config;
    config.chunkSize = 200;
    config.chunkOverlap = 20;
    config.minChunkChars = 10;
    sift::Chunker chunker(config);

    const QString text = QStringLiteral("# Big\n\n") + sentences(30) + QStringLiteral("\n");
    const auto structure = sift::MarkdownStructureParser::parse(text);
    QVERIFY(structure.has_value());

    const auto chunks = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {}, &*structure);
    QVERIFY(chunks.size() > 3);

    bool sawFixed = false;
    for (const sift::Chunk& chunk : chunks) {
        QVERIFY(chunk.tokenCount.value() <= chunker.config().maxTokens);
        QCOMPARE(chunk.metadata.value(QStringLiteral("heading")).toString(), QStringLiteral("Big"));
        if (chunk.metadata.value(QStringLiteral("chunk_method")).toString() == QLatin1String("fixed")) {
            sawFixed = true;
        }
    }
    QVERIFY(sawFixed);
}

void TestChunker::testMismatchedStructureFallsBackToFixed()
{
    const QString markdown = QStringLiteral("# Title\n\n") + sentences(3);
    const auto structure = sift::MarkdownStructureParser::parse(markdown);
    QVERIFY(structure.has_value());

    // Structure parsed from different text must not be applied.
    const QString other = sentences(3, QStringLiteral("elsewhere"));
    sift::Chunker chunker;
    const auto chunks = chunker.chunk(other, QStringLiteral("t"), QStringLiteral("s"), {}, &*structure);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].metadata.value(QStringLiteral("chunk_method")).toString(),
             QStringLiteral("fixed"));
}

void TestChunker::testChunkIndicesContiguous()
{
    sift::ChunkerConfig config;
    config.chunkSize = 150;
    config.chunkOverlap = 30;
    config.minChunkChars = 40;
    sift::Chunker chunker(config);

    const auto chunks = chunker.chunk(sentences(50), QStringLiteral("t"), QStringLiteral("s"), {});
    for (size_t i = 0; i < chunks.size(); ++i) {
        QCOMPARE(chunks[i].chunkIndex, static_cast<int>(i));
    }
}

void TestChunker::testForcedSplitKeepsSurrogatePairs()
{
    // No spaces or punctuation, so every cut is forced. Each emoji is two
    // UTF-16 units and the leading "a" puts the 1000-unit window edge
    // inside one of them.
    const QString emoji = QString::fromUtf8("\xF0\x9F\x98\x80");
    QString text = QStringLiteral("a");
    for (int i = 0; i < 600; ++i) {
        text += emoji;
    }

    sift::Chunker chunker;
    const auto chunks = chunker.chunk(text, QStringLiteral("t"), QStringLiteral("s"), {});
    QVERIFY(chunks.size() >= 2);

    for (const sift::Chunk& chunk : chunks) {
        QCOMPARE(QString::fromUtf8(chunk.content.toUtf8()), chunk.content);
        QVERIFY(!chunk.content.contains(QChar(QChar::ReplacementCharacter)));
        QVERIFY(!chunk.content.front().isLowSurrogate());
        QVERIFY(!chunk.content.back().isHighSurrogate());

        const int start = chunk.metadata.value(sift::MetadataKeys::CharStart).toInt();
        const int end = chunk.metadata.value(sift::MetadataKeys::CharEnd).toInt();
        QVERIFY(start == 0 || !text[start].isLowSurrogate());
        QVERIFY(end == text.size() || !text[end].isLowSurrogate());
        QCOMPARE(chunk.content, text.mid(start, end - start));
    }
    QCOMPARE(chunks.back().metadata.value(sift::MetadataKeys::CharEnd).toInt(),
             static_cast<int>(text.size()));
}

QTEST_MAIN(TestChunker)
#include "test_chunker.moc"
