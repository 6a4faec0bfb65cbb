#include <QtTest/QtTest>
#include "core/ranking/cross_encoder_reranker.h"
#include "fake_services.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

class TestCrossEncoderReranker : public QObject {
    Q_OBJECT

private slots:
    void testEmptyCandidatesSkipModel();
    void testScoresAreSigmoidOfLogits();
    void testReordersByRelevance();
    void testTopKTruncates();
    void testBatchesRespectBatchSize();
    void testScoresIndependentOfBatchComposition();
    void testLoadFailureIsNoOp();
    void testInferenceFailureIsNoOp();
    void testNoFactoryIsUnavailable();
    void testScorerCreatedOnceUnderConcurrency();
    void testConcurrentRerankOverlapsInference();
    void testScoreCountMismatchIsDataIntegrity();

private:
    static sift::SearchResult candidate(const QString& id, const QString& content, double similarity);
    static std::vector<sift::SearchResult> petCandidates();
};

namespace {

// Returns one score too few.
class ShortScorer : public sift::PairScorer {
public:
    sift::Result<std::vector<float>> scoreBatch(const QString&,
                                                const std::vector<QString>& passages) override
    {
        return std::vector<float>(passages.size() > 0 ? passages.size() - 1 : 0, 0.0f);
    }
};

// Each call waits for a second call to be in flight at the same time, up to
// a deadline, and records the highest overlap seen.
class OverlapScorer : public sift::PairScorer {
public:
    sift::Result<std::vector<float>> scoreBatch(const QString&,
                                                const std::vector<QString>& passages) override
    {
        const int now = inFlight.fetch_add(1) + 1;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (inFlight.load() < 2 && maxInFlight.load() < 2
               && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::yield();
        }
        const int overlap = inFlight.load();
        seen = maxInFlight.load();
        while (overlap > seen && !maxInFlight.compare_exchange_weak(seen, overlap)) {
        }

        inFlight.fetch_sub(1);
        return std::vector<float>(passages.size(), 0.0f);
    }

    static std::atomic<int> inFlight;
    static std::atomic<int> maxInFlight;
};

std::atomic<int> OverlapScorer::inFlight{0};
std::atomic<int> OverlapScorer::maxInFlight{0};

} // namespace

sift::SearchResult TestCrossEncoderReranker::candidate(const QString& id, const QString& content,
                                                       double similarity)
{
    sift::SearchResult result;
    result.chunkId = id;
    result.content = content;
    result.similarity = similarity;
    return result;
}

std::vector<sift::SearchResult> TestCrossEncoderReranker::petCandidates()
{
    return {
        candidate(QStringLiteral("c1"), QStringLiteral("Parrots can learn words."), 0.9),
        candidate(QStringLiteral("c2"), QStringLiteral("Dogs are loyal."), 0.8),
        candidate(QStringLiteral("c3"), QStringLiteral("Cats sleep most of the day and cats purr."), 0.7),
        candidate(QStringLiteral("c4"), QStringLiteral("Fish swim."), 0.6),
    };
}

void TestCrossEncoderReranker::testEmptyCandidatesSkipModel()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters));

    auto result = reranker.tryRerank(QStringLiteral("cats"), {});
    QVERIFY(result.ok());
    QVERIFY(result.value().empty());
    QCOMPARE(counters->created.load(), 0);
    QCOMPARE(counters->batches.load(), 0);
}

void TestCrossEncoderReranker::testScoresAreSigmoidOfLogits()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters));

    const auto candidates = petCandidates();
    auto result = reranker.tryRerank(QStringLiteral("do cats purr"), candidates);
    QVERIFY(result.ok());
    QCOMPARE(result.value().size(), candidates.size());

    for (const sift::SearchResult& r : result.value()) {
        const float logit = sift::test::FakePairScorer::logitFor(QStringLiteral("do cats purr"),
                                                                 r.content);
        const double expected = 1.0 / (1.0 + std::exp(-static_cast<double>(logit)));
        QVERIFY(qAbs(r.similarity - expected) < 1e-9);
        QVERIFY(r.similarity > 0.0 && r.similarity < 1.0);
    }
}

void TestCrossEncoderReranker::testReordersByRelevance()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters));

    auto result = reranker.tryRerank(QStringLiteral("do cats purr"), petCandidates());
    QVERIFY(result.ok());
    QCOMPARE(result.value().front().chunkId, QStringLiteral("c3"));
    for (size_t i = 1; i < result.value().size(); ++i) {
        QVERIFY(result.value()[i - 1].similarity >= result.value()[i].similarity);
    }
}

void TestCrossEncoderReranker::testTopKTruncates()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters));

    auto top2 = reranker.tryRerank(QStringLiteral("cats"), petCandidates(), 2);
    QVERIFY(top2.ok());
    QCOMPARE(static_cast<int>(top2.value().size()), 2);
    QCOMPARE(top2.value()[0].chunkId, QStringLiteral("c3"));

    auto wide = reranker.tryRerank(QStringLiteral("cats"), petCandidates(), 50);
    QVERIFY(wide.ok());
    QCOMPARE(static_cast<int>(wide.value().size()), 4);

    // Every pair is still scored, only the output is cut.
    QCOMPARE(counters->pairs.load(), 8);
}

void TestCrossEncoderReranker::testBatchesRespectBatchSize()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters),
                                        sift::RerankerConfig{3});

    std::vector<sift::SearchResult> candidates;
    for (int i = 0; i < 10; ++i) {
        candidates.push_back(candidate(QStringLiteral("c%1").arg(i),
                                       QStringLiteral("passage number %1").arg(i), 0.5));
    }
    auto result = reranker.tryRerank(QStringLiteral("passage"), candidates);
    QVERIFY(result.ok());
    QCOMPARE(counters->batches.load(), 4);
    QCOMPARE(counters->largestBatch.load(), 3);
    QCOMPARE(counters->pairs.load(), 10);
}

void TestCrossEncoderReranker::testScoresIndependentOfBatchComposition()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker single(sift::test::FakePairScorer::factory(counters),
                                      sift::RerankerConfig{1});
    sift::CrossEncoderReranker bulk(sift::test::FakePairScorer::factory(counters),
                                    sift::RerankerConfig{32});

    auto one = single.tryRerank(QStringLiteral("loyal dogs"), petCandidates());
    auto all = bulk.tryRerank(QStringLiteral("loyal dogs"), petCandidates());
    QVERIFY(one.ok());
    QVERIFY(all.ok());
    QCOMPARE(one.value().size(), all.value().size());
    for (size_t i = 0; i < one.value().size(); ++i) {
        QCOMPARE(one.value()[i].chunkId, all.value()[i].chunkId);
        QCOMPARE(one.value()[i].similarity, all.value()[i].similarity);
    }
}

void TestCrossEncoderReranker::testLoadFailureIsNoOp()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::failingFactory(counters));
    const auto candidates = petCandidates();

    auto attempt = reranker.tryRerank(QStringLiteral("cats"), candidates);
    QVERIFY(!attempt.ok());
    QCOMPARE(attempt.error().kind, sift::ErrorKind::Unavailable);

    const auto unchanged = reranker.rerank(QStringLiteral("cats"), candidates, 2);
    QCOMPARE(unchanged.size(), candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        QCOMPARE(unchanged[i].chunkId, candidates[i].chunkId);
        QCOMPARE(unchanged[i].similarity, candidates[i].similarity);
    }

    // The failed load is remembered, not retried.
    QCOMPARE(counters->created.load(), 1);
    QVERIFY(!reranker.ensureLoaded().ok());
    QCOMPARE(counters->created.load(), 1);
}

void TestCrossEncoderReranker::testInferenceFailureIsNoOp()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters, true));
    const auto candidates = petCandidates();

    const auto unchanged = reranker.rerank(QStringLiteral("cats"), candidates);
    QCOMPARE(unchanged.size(), candidates.size());
    QCOMPARE(unchanged[0].chunkId, QStringLiteral("c1"));
    QCOMPARE(unchanged[0].similarity, 0.9);
    QVERIFY(counters->batches.load() >= 1);
}

void TestCrossEncoderReranker::testNoFactoryIsUnavailable()
{
    sift::CrossEncoderReranker reranker{sift::PairScorerFactory{}};
    const sift::Status status = reranker.ensureLoaded();
    QVERIFY(!status.ok());
    QCOMPARE(status.error().kind, sift::ErrorKind::Unavailable);
}

void TestCrossEncoderReranker::testScorerCreatedOnceUnderConcurrency()
{
    auto counters = std::make_shared<sift::test::FakePairScorer::Counters>();
    sift::CrossEncoderReranker reranker(sift::test::FakePairScorer::factory(counters),
                                        sift::RerankerConfig{2});
    const auto candidates = petCandidates();

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<int> okFlags(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&reranker, &candidates, &okFlags, t]() {
            auto result = reranker.tryRerank(QStringLiteral("cats purr"), candidates);
            okFlags[static_cast<size_t>(t)] =
                (result.ok() && result.value().front().chunkId == QLatin1String("c3")) ? 1 : 0;
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    QCOMPARE(counters->created.load(), 1);
    for (int flag : okFlags) {
        QCOMPARE(flag, 1);
    }
    QCOMPARE(counters->pairs.load(), kThreads * 4);
}

void TestCrossEncoderReranker::testConcurrentRerankOverlapsInference()
{
    OverlapScorer::inFlight.store(0);
    OverlapScorer::maxInFlight.store(0);
    sift::CrossEncoderReranker reranker([]() -> sift::Result<std::unique_ptr<sift::PairScorer>> {
        std::unique_ptr<sift::PairScorer> scorer = std::make_unique<OverlapScorer>();
        return scorer;
    });
    QVERIFY(reranker.ensureLoaded().ok());
    const auto candidates = petCandidates();

    std::atomic<int> succeeded{0};
    std::thread first([&]() {
        if (reranker.tryRerank(QStringLiteral("cats"), candidates).ok()) {
            succeeded.fetch_add(1);
        }
    });
    std::thread second([&]() {
        if (reranker.tryRerank(QStringLiteral("dogs"), candidates).ok()) {
            succeeded.fetch_add(1);
        }
    });
    first.join();
    second.join();

    QCOMPARE(succeeded.load(), 2);
    // Two requests were scored at the same time on one scorer.
    QCOMPARE(OverlapScorer::maxInFlight.load(), 2);
}

void TestCrossEncoderReranker::testScoreCountMismatchIsDataIntegrity()
{
    sift::CrossEncoderReranker reranker([]() -> sift::Result<std::unique_ptr<sift::PairScorer>> {
        std::unique_ptr<sift::PairScorer> scorer = std::make_unique<ShortScorer>();
        return scorer;
    });

    auto result = reranker.tryRerank(QStringLiteral("cats"), petCandidates());
    QVERIFY(!result.ok());
    QCOMPARE(result.error().kind, sift::ErrorKind::DataIntegrity);
}

QTEST_MAIN(TestCrossEncoderReranker)
#include "test_cross_encoder_reranker.moc"
