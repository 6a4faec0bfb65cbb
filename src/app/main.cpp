#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/runtime/sift_runtime.h"
#include "core/search/retrieval_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString& message)
{
    err() << "error: " << message << Qt::endl;
    return 1;
}

int failWith(const sift::Error& error)
{
    return fail(error.toString());
}

void printJson(const QJsonObject& json)
{
    out() << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out().flush();
}

QJsonObject reportToJson(const sift::IngestionReport& report)
{
    QJsonArray documents;
    for (const sift::IngestedDocument& doc : report.documents) {
        QJsonObject entry;
        entry.insert(QStringLiteral("id"), doc.documentId);
        entry.insert(QStringLiteral("title"), doc.title);
        entry.insert(QStringLiteral("source"), doc.source);
        entry.insert(QStringLiteral("chunks"), doc.chunks);
        entry.insert(QStringLiteral("embedded_chunks"), doc.embeddedChunks);
        entry.insert(QStringLiteral("duration_ms"), doc.durationMs);
        documents.append(entry);
    }

    QJsonObject json;
    json.insert(QStringLiteral("documents_processed"), report.processed);
    json.insert(QStringLiteral("succeeded"), report.succeeded);
    json.insert(QStringLiteral("failed"), report.failed);
    json.insert(QStringLiteral("chunks_created"), report.chunksCreated);
    json.insert(QStringLiteral("chunks_embedded"), report.chunksEmbedded);
    json.insert(QStringLiteral("stopped"), report.stopped);
    json.insert(QStringLiteral("duration_ms"), report.durationMs);
    json.insert(QStringLiteral("documents"), documents);
    json.insert(QStringLiteral("errors"), QJsonArray::fromStringList(report.errorMessages()));
    return json;
}

QJsonObject documentToJson(const sift::Document& document)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), document.id);
    json.insert(QStringLiteral("title"), document.title);
    json.insert(QStringLiteral("source"), document.source);
    json.insert(QStringLiteral("created_at"), document.createdAt.toString(Qt::ISODateWithMs));
    json.insert(QStringLiteral("updated_at"), document.updatedAt.toString(Qt::ISODateWithMs));
    return json;
}

bool readIntOption(const QCommandLineParser& parser, const QCommandLineOption& option, int* value)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    *value = parser.value(option).toInt(&ok);
    return ok;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sift"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Hybrid retrieval over a local document corpus.\n\n"
        "Commands:\n"
        "  ingest <folder>     Ingest every document under folder\n"
        "  upload <file>       Add a single document\n"
        "  search <query>      Ranked passages as JSON\n"
        "  context <query>     Ranked passages as an LLM context string\n"
        "  list                Stored documents, newest first\n"
        "  stats               Corpus counts\n"
        "  delete <id>         Remove one document\n"
        "  reset               Remove every document"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("SQLite database path."),
                                      QStringLiteral("path"));
    const QCommandLineOption limitOption(QStringLiteral("limit"),
                                         QStringLiteral("Number of results (1-100)."),
                                         QStringLiteral("n"));
    const QCommandLineOption offsetOption(QStringLiteral("offset"),
                                          QStringLiteral("Documents to skip in list."),
                                          QStringLiteral("n"));
    const QCommandLineOption modeOption(QStringLiteral("mode"),
                                        QStringLiteral("Search mode: hybrid or vector."),
                                        QStringLiteral("mode"));
    const QCommandLineOption noRerankOption(QStringLiteral("no-rerank"),
                                            QStringLiteral("Skip cross-encoder reranking."));
    const QCommandLineOption noCleanOption(QStringLiteral("no-clean"),
                                           QStringLiteral("Keep existing documents on ingest."));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"),
                                            QStringLiteral("debug, info, warning or error."),
                                            QStringLiteral("level"));
    parser.addOption(dbOption);
    parser.addOption(limitOption);
    parser.addOption(offsetOption);
    parser.addOption(modeOption);
    parser.addOption(noRerankOption);
    parser.addOption(noCleanOption);
    parser.addOption(logLevelOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("ingest|upload|search|context|list|stats|delete|reset"));
    parser.addPositionalArgument(QStringLiteral("argument"),
                                 QStringLiteral("Folder, file, query or document id."));
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    const QString argument = positional.mid(1).join(QLatin1Char(' '));

    sift::Settings settings = sift::SettingsManager::resolve();
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (parser.isSet(logLevelOption)) {
        settings.logLevel = parser.value(logLevelOption);
    }
    if (parser.isSet(noRerankOption)) {
        settings.rerankerEnabled = false;
    }
    if (!sift::applyLogLevel(settings.logLevel)) {
        err() << "warning: unknown log level '" << settings.logLevel << "'" << Qt::endl;
    }

    const bool needsArgument = command == QLatin1String("ingest")
        || command == QLatin1String("upload") || command == QLatin1String("search")
        || command == QLatin1String("context") || command == QLatin1String("delete");
    const bool knownCommand = needsArgument || command == QLatin1String("list")
        || command == QLatin1String("stats") || command == QLatin1String("reset");
    if (!knownCommand) {
        return fail(QStringLiteral("unknown command '%1'").arg(command));
    }
    if (needsArgument && argument.trimmed().isEmpty()) {
        return fail(QStringLiteral("'%1' needs an argument").arg(command));
    }

    auto opened = sift::SiftRuntime::open(settings);
    if (!opened) {
        return failWith(opened.error());
    }
    sift::SiftRuntime& runtime = *opened.value();

    if (command == QLatin1String("ingest")) {
        const sift::IngestionReport report =
            runtime.ingestion().run(argument, !parser.isSet(noCleanOption));
        printJson(reportToJson(report));
        return report.succeeded > 0 || report.errors.empty() ? 0 : 1;
    }

    if (command == QLatin1String("upload")) {
        auto uploaded = runtime.ingestion().ingestFile(argument);
        if (!uploaded) {
            return failWith(uploaded.error());
        }
        QJsonObject json;
        json.insert(QStringLiteral("id"), uploaded.value().documentId);
        json.insert(QStringLiteral("title"), uploaded.value().title);
        json.insert(QStringLiteral("source"), uploaded.value().source);
        json.insert(QStringLiteral("chunks"), uploaded.value().chunks);
        json.insert(QStringLiteral("embedded_chunks"), uploaded.value().embeddedChunks);
        json.insert(QStringLiteral("duration_ms"), uploaded.value().durationMs);
        printJson(json);
        return 0;
    }

    if (command == QLatin1String("search") || command == QLatin1String("context")) {
        sift::SearchRequest request = runtime.defaultRequest();
        if (!readIntOption(parser, limitOption, &request.limit)) {
            return fail(QStringLiteral("--limit expects a number"));
        }
        if (parser.isSet(modeOption)) {
            const QString mode = parser.value(modeOption).toLower();
            if (mode == QLatin1String("hybrid")) {
                request.mode = sift::SearchMode::Hybrid;
            } else if (mode == QLatin1String("vector")) {
                request.mode = sift::SearchMode::Vector;
            } else {
                return fail(QStringLiteral("--mode expects hybrid or vector"));
            }
        }

        if (command == QLatin1String("context")) {
            auto context = runtime.engine().buildContext(argument, request);
            if (!context) {
                return failWith(context.error());
            }
            out() << context.value() << Qt::endl;
            return 0;
        }

        auto response = runtime.engine().search(argument, request);
        if (!response) {
            return failWith(response.error());
        }
        QJsonArray results;
        for (const sift::SearchResult& result : response.value().results) {
            results.append(sift::searchResultToJson(result));
        }
        QJsonObject json;
        json.insert(QStringLiteral("query"), argument);
        json.insert(QStringLiteral("keyword_strategy"),
                    sift::keywordStrategyToString(response.value().keywordStrategy));
        json.insert(QStringLiteral("reranked"), response.value().reranked);
        json.insert(QStringLiteral("stats"), sift::searchStatsToJson(response.value().stats));
        json.insert(QStringLiteral("results"), results);
        printJson(json);
        return 0;
    }

    if (command == QLatin1String("list")) {
        int limit = 100;
        int offset = 0;
        if (!readIntOption(parser, limitOption, &limit) || limit < 1) {
            return fail(QStringLiteral("--limit expects a positive number"));
        }
        if (!readIntOption(parser, offsetOption, &offset) || offset < 0) {
            return fail(QStringLiteral("--offset expects a non-negative number"));
        }
        auto listed = runtime.store().listDocuments(limit, offset);
        if (!listed) {
            return failWith(listed.error());
        }
        QJsonArray documents;
        for (const sift::Document& document : listed.value()) {
            documents.append(documentToJson(document));
        }
        QJsonObject json;
        json.insert(QStringLiteral("limit"), limit);
        json.insert(QStringLiteral("offset"), offset);
        json.insert(QStringLiteral("documents"), documents);
        printJson(json);
        return 0;
    }

    if (command == QLatin1String("stats")) {
        auto stats = runtime.stats();
        if (!stats) {
            return failWith(stats.error());
        }
        printJson(stats.value());
        return 0;
    }

    if (command == QLatin1String("delete")) {
        const sift::Status deleted = runtime.deleteDocument(argument.trimmed());
        if (!deleted) {
            return failWith(deleted.error());
        }
        out() << "deleted " << argument.trimmed() << Qt::endl;
        return 0;
    }

    const sift::Status reset = runtime.resetCorpus();
    if (!reset) {
        return failWith(reset.error());
    }
    out() << "corpus reset" << Qt::endl;
    return 0;
}
