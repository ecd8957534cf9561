/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <memory>
#include <batch_runner.hpp>
#include <reference_import.hpp>
#include <reference_store.hpp>

Q_LOGGING_CATEGORY(lcImport, "reggis.import")
Q_LOGGING_CATEGORY(lcRun, "reggis.run")
Q_LOGGING_CATEGORY(lcStore, "reggis.store")

namespace {

enum ExitCode { ExitDone = 0, ExitFailed = 1, ExitUsage = 2, ExitCancelled = 3 };

constexpr int kMaxLoggedRejections = 10;

std::atomic<reggis::BatchRunner*> g_runner{nullptr};

void on_sigint(int)
{
    if (reggis::BatchRunner* r = g_runner.load())
        r->cancel();
}

// Publishes the runner to the SIGINT handler for its lifetime
class RunnerRegistration
{
public:
    explicit RunnerRegistration(reggis::BatchRunner& r)
    {
        g_runner.store(&r);
        std::signal(SIGINT, on_sigint);
    }
    ~RunnerRegistration()
    {
        std::signal(SIGINT, SIG_DFL);
        g_runner.store(nullptr);
    }
    RunnerRegistration(const RunnerRegistration&) = delete;
    RunnerRegistration& operator=(const RunnerRegistration&) = delete;
};

// ---------- log file ----------
QFile* g_logFile = nullptr;
QtMessageHandler g_prevHandler = nullptr;

void file_message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << qFormatLogMessage(type, ctx, msg) << '\n';
        ts.flush();
    }
    if (g_prevHandler)
        g_prevHandler(type, ctx, msg);
}

// "<dir>/reggis_<yyyyMMdd_HHmmss>.log" when a directory is given, else the file itself
bool install_log_file(const QString& target)
{
    QString path = target;
    if (QFileInfo(target).isDir())
        path = QDir(target).filePath(QStringLiteral("reggis_%1.log")
                   .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"))));

    static QFile file;
    file.setFileName(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        return false;
    g_logFile = &file;
    g_prevHandler = qInstallMessageHandler(file_message_handler);
    return true;
}

QString S(const std::string& s) { return QString::fromStdString(s); }

// ---------- configuration ----------
bool load_config(const QString& path, reggis::RunOptions& opt, QString& dbPath, QString* error)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("cannot open config %1").arg(path);
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (doc.isNull() || !doc.isObject()) {
        *error = QStringLiteral("invalid config %1: %2").arg(path, perr.errorString());
        return false;
    }
    const QJsonObject o = doc.object();

    auto str = [&](const char* key, std::string& out) {
        if (o.contains(QLatin1String(key))) out = o.value(QLatin1String(key)).toString().toStdString();
    };
    auto flag = [&](const char* key, bool& out) {
        if (o.contains(QLatin1String(key))) out = o.value(QLatin1String(key)).toBool(out);
    };

    str("usd_rate", opt.extract.normalize.usd_rate);
    str("eur_rate", opt.extract.normalize.eur_rate);
    flag("prefer_document_rate", opt.extract.normalize.prefer_document_rate);

    flag("require_positive_amounts", opt.extract.require_positive_amounts);
    str("principal", opt.extract.principal);
    str("activa_factura", opt.extract.activa_factura);
    str("activa_bodega", opt.extract.activa_bodega);
    str("incentivo", opt.extract.incentivo);

    if (o.contains(QLatin1String("max_entry_bytes")))
        opt.walk.max_entry_bytes = (std::uint64_t)o.value(QLatin1String("max_entry_bytes")).toDouble();

    std::string delimiter;
    str("delimiter", delimiter);
    if (!delimiter.empty()) opt.export_options.delimiter = delimiter.front();
    flag("include_header", opt.export_options.include_header);
    flag("write_utf8_bom", opt.export_options.write_utf8_bom);
    flag("decimal_comma", opt.export_options.decimal_comma);
    str("file_label", opt.export_options.file_label);

    if (o.contains(QLatin1String("workers")))
        opt.workers = (unsigned)std::max(0, o.value(QLatin1String("workers")).toInt());
    if (o.contains(QLatin1String("progress_every_lines")))
        opt.progress_every_lines = o.value(QLatin1String("progress_every_lines")).toInt(opt.progress_every_lines);

    if (o.contains(QLatin1String("database")))
        dbPath = o.value(QLatin1String("database")).toString();
    return true;
}

QString default_database_path()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath(QStringLiteral("database/reference.db"));
}

std::unique_ptr<reggis::ReferenceStore> open_store(const QString& dbPath)
{
    QDir().mkpath(QFileInfo(dbPath).absolutePath());
    try {
        auto store = std::make_unique<reggis::ReferenceStore>(dbPath.toStdString());
        qCInfo(lcStore).noquote() << "Reference database:" << dbPath;
        return store;
    } catch (const reggis::StoreError& e) {
        qCCritical(lcStore, "%s", e.what());
        return nullptr;
    }
}

// ---------- commands ----------
int report_import(const char* what, const reggis::ImportResult& r)
{
    if (!r.ok()) {
        qCCritical(lcImport, "%s import failed (%s): %s", what, reggis::to_string(r.error), r.message.c_str());
        return ExitFailed;
    }
    qCInfo(lcImport, "%s: inserted=%d existing=%d skipped=%d rejected=%d",
           what, r.inserted, r.already_existing, r.skipped, r.rejected);

    int logged = 0;
    for (const auto& issue : r.reasons) {
        if (logged++ == kMaxLoggedRejections) break;
        qCWarning(lcImport, "row %d: %s", issue.row, issue.reason.c_str());
    }
    if ((int)r.reasons.size() > kMaxLoggedRejections)
        qCWarning(lcImport, "... %d more rejected rows", (int)r.reasons.size() - kMaxLoggedRejections);
    return ExitDone;
}

int run_batch(reggis::ReferenceStore& store, const reggis::RunOptions& opt, const reggis::RunRequest& req)
{
    reggis::BatchRunner runner(store, opt);
    RunnerRegistration reg(runner);

    auto sink = [](const reggis::ProgressEvent& ev) {
        using Kind = reggis::ProgressEvent::Kind;
        switch (ev.kind) {
        case Kind::StateChanged:
            qCInfo(lcRun, "state %s", reggis::to_string(ev.state));
            break;
        case Kind::UnitDone:
            qCInfo(lcRun, "[%d/%d] %s (%d lines so far)", ev.files_done, ev.files_total,
                   ev.unit.c_str(), ev.lines_extracted);
            break;
        case Kind::Lines:
            qCInfo(lcRun, "%d lines extracted", ev.lines_extracted);
            break;
        }
    };

    const reggis::RunReport report = runner.run(req, sink);

    for (const auto& e : report.errors)
        qCWarning(lcRun, "%s: %s: %s", reggis::to_string(e.kind), e.path.c_str(), e.message.c_str());

    int logged = 0;
    for (const auto& r : report.rejections) {
        if (logged++ == kMaxLoggedRejections) break;
        qCWarning(lcRun, "%s: invoice %s code %s entity %s buyer %s (%s)",
                  reggis::to_string(r.reason), r.invoiceNumber.c_str(), r.productCode.c_str(),
                  r.entity.c_str(), r.buyerTaxId.c_str(), r.source.c_str());
    }
    if ((int)report.rejections.size() > kMaxLoggedRejections)
        qCWarning(lcRun, "... %d more rejected lines", (int)report.rejections.size() - kMaxLoggedRejections);

    qCInfo(lcRun, "files %d/%d, documents %d (invoices %d, credit notes %d, debit notes %d, other %d)",
           report.files_processed, report.files_total, report.documents_parsed, report.invoices,
           report.credit_notes, report.debit_notes, report.other_documents);
    qCInfo(lcRun, "lines extracted %d, invalid %d, accepted %d, unknown material %d, unknown client %d",
           report.lines_extracted, report.invalid_lines, report.accepted_lines,
           report.rejected_unknown_material, report.rejected_unknown_client);

    switch (report.state) {
    case reggis::RunState::Done:
        qCInfo(lcRun, "Output: %s", report.output_path.c_str());
        return ExitDone;
    case reggis::RunState::Cancelled:
        qCWarning(lcRun, "Cancelled, nothing written");
        return ExitCancelled;
    default:
        qCCritical(lcRun, "Run failed: %s", report.message.c_str());
        return ExitFailed;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("reggis-export"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.00"));
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Invoice extraction to REGGIS CSV"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("import-materials <file> | import-clients <file> | counts | list-materials | list-clients | run"));

    const QCommandLineOption dbOpt(QStringLiteral("db"), QStringLiteral("Reference database path."), QStringLiteral("path"));
    const QCommandLineOption configOpt(QStringLiteral("config"), QStringLiteral("JSON configuration file."), QStringLiteral("file"));
    const QCommandLineOption logOpt(QStringLiteral("log-file"), QStringLiteral("Append log to file (or folder)."), QStringLiteral("path"));
    const QCommandLineOption inputOpt(QStringLiteral("input"), QStringLiteral("Folder with .xml/.zip invoices."), QStringLiteral("dir"));
    const QCommandLineOption outputOpt(QStringLiteral("output"), QStringLiteral("Folder for the CSV export."), QStringLiteral("dir"));
    const QCommandLineOption matOpt(QStringLiteral("validate-materials"), QStringLiteral("Reject lines with unknown materials."));
    const QCommandLineOption cliOpt(QStringLiteral("validate-clients"), QStringLiteral("Reject lines with unknown clients."));
    const QCommandLineOption workersOpt(QStringLiteral("workers"), QStringLiteral("Worker threads (1-8)."), QStringLiteral("n"));
    const QCommandLineOption labelOpt(QStringLiteral("label"), QStringLiteral("Label in the output file name."), QStringLiteral("text"));
    const QCommandLineOption limitOpt(QStringLiteral("limit"), QStringLiteral("Rows per listing page (default 100)."), QStringLiteral("n"), QStringLiteral("100"));
    const QCommandLineOption offsetOpt(QStringLiteral("offset"), QStringLiteral("Rows to skip in a listing."), QStringLiteral("n"), QStringLiteral("0"));
    parser.addOptions({ dbOpt, configOpt, logOpt, inputOpt, outputOpt, matOpt, cliOpt, workersOpt, labelOpt,
                        limitOpt, offsetOpt });

    if (!parser.parse(QCoreApplication::arguments())) {
        qCritical().noquote() << parser.errorText();
        return ExitUsage;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(ExitDone);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    if (parser.isSet(logOpt) && !install_log_file(parser.value(logOpt))) {
        qCritical().noquote() << "Cannot open log file" << parser.value(logOpt);
        return ExitUsage;
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        qCritical("Missing command");
        return ExitUsage;
    }
    const QString command = args.first();

    reggis::RunOptions opt;
    QString dbPath;
    if (parser.isSet(configOpt)) {
        QString err;
        if (!load_config(parser.value(configOpt), opt, dbPath, &err)) {
            qCritical().noquote() << err;
            return ExitUsage;
        }
    }
    if (parser.isSet(dbOpt)) dbPath = parser.value(dbOpt);
    if (dbPath.isEmpty()) dbPath = default_database_path();

    if (command == QLatin1String("import-materials") || command == QLatin1String("import-clients")) {
        if (args.size() < 2) {
            qCritical().noquote() << command << "needs a file";
            return ExitUsage;
        }
        auto store = open_store(dbPath);
        if (!store) return ExitFailed;

        const std::string file = args.at(1).toStdString();
        if (command == QLatin1String("import-materials"))
            return report_import("materials", reggis::import_materials_file(*store, file));
        return report_import("clients", reggis::import_clients_file(*store, file));
    }

    if (command == QLatin1String("counts")) {
        auto store = open_store(dbPath);
        if (!store) return ExitFailed;
        const auto c = store->counts();
        QTextStream(stdout) << "materials " << c.first << "\nclients " << c.second << '\n';
        return ExitDone;
    }

    if (command == QLatin1String("list-materials") || command == QLatin1String("list-clients")) {
        bool okLimit = false, okOffset = false;
        const int limit = parser.value(limitOpt).toInt(&okLimit);
        const int offset = parser.value(offsetOpt).toInt(&okOffset);
        if (!okLimit || !okOffset || limit < 1 || offset < 0) {
            qCritical("--limit must be positive and --offset not negative");
            return ExitUsage;
        }
        auto store = open_store(dbPath);
        if (!store) return ExitFailed;

        QTextStream out(stdout);
        try {
            if (command == QLatin1String("list-materials")) {
                for (const auto& m : store->list_materials(limit, offset))
                    out << S(m.code) << '\t' << S(m.entity) << '\t' << S(m.description) << '\t' << S(m.createdAt) << '\n';
            } else {
                for (const auto& c : store->list_clients(limit, offset))
                    out << S(c.parentCode) << '\t' << S(c.nit.value_or(std::string())) << '\t' << S(c.name) << '\t' << S(c.createdAt) << '\n';
            }
        } catch (const reggis::StoreError& e) {
            qCCritical(lcStore, "%s", e.what());
            return ExitFailed;
        }
        return ExitDone;
    }

    if (command == QLatin1String("run")) {
        if (!parser.isSet(inputOpt) || !parser.isSet(outputOpt)) {
            qCritical("run needs --input and --output");
            return ExitUsage;
        }
        if (parser.isSet(workersOpt)) {
            bool ok = false;
            const int n = parser.value(workersOpt).toInt(&ok);
            if (!ok || n < 1 || n > (int)reggis::kMaxWorkers) {
                qCritical("--workers must be between 1 and %u", reggis::kMaxWorkers);
                return ExitUsage;
            }
            opt.workers = (unsigned)n;
        }
        if (parser.isSet(labelOpt)) opt.export_options.file_label = parser.value(labelOpt).toStdString();

        reggis::RunRequest req;
        req.input = parser.value(inputOpt).toStdString();
        req.output = parser.value(outputOpt).toStdString();
        req.validate_materials = parser.isSet(matOpt);
        req.validate_clients = parser.isSet(cliOpt);

        auto store = open_store(dbPath);
        if (!store) return ExitFailed;

        qCInfo(lcRun).noquote() << "Input:" << S(req.input) << "Output:" << S(req.output);
        return run_batch(*store, opt, req);
    }

    qCritical().noquote() << "Unknown command" << command;
    return ExitUsage;
}
