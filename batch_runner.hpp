/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "reggis_model.hpp"
#include "reggis_parser_pugi.hpp"
#include "archive_walker.hpp"
#include "validation_filter.hpp"
#include "reggis_csv.hpp"
#include "reference_store.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace reggis {

enum class RunState { Idle, Scanning, Extracting, Validating, Writing, Done, Failed, Cancelled };

inline const char* to_string(RunState s) {
    switch (s) {
    case RunState::Idle:       return "Idle";
    case RunState::Scanning:   return "Scanning";
    case RunState::Extracting: return "Extracting";
    case RunState::Validating: return "Validating";
    case RunState::Writing:    return "Writing";
    case RunState::Done:       return "Done";
    case RunState::Failed:     return "Failed";
    case RunState::Cancelled:  return "Cancelled";
    }
    return "Unknown";
}

constexpr unsigned kMaxWorkers = 8;

struct RunRequest {
    std::string input;              // folder with .xml / .zip files
    std::string output;             // folder receiving the CSV
    bool validate_materials = false;
    bool validate_clients = false;
};

struct RunOptions {
    unsigned workers = 0;           // 0 = hardware concurrency (at most kMaxWorkers)
    int progress_every_lines = 500; // Lines event granularity; 0 = off
    ExtractOptions extract;
    WalkOptions walk;
    ExportOptions export_options;
};

struct FileError {
    std::string path;
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

struct RunReport {
    RunState state{RunState::Idle};
    std::string message;            // reason for Failed

    int files_total = 0;
    int files_processed = 0;

    int documents_parsed = 0;
    int invoices = 0;
    int credit_notes = 0;
    int debit_notes = 0;
    int other_documents = 0;

    int lines_extracted = 0;
    int invalid_lines = 0;
    int accepted_lines = 0;
    int rejected_unknown_material = 0;
    int rejected_unknown_client = 0;

    std::vector<Rejection> rejections;
    std::vector<FileError> errors;
    std::string output_path;
};

struct ProgressEvent {
    enum class Kind { StateChanged, UnitDone, Lines };
    Kind kind{Kind::StateChanged};
    RunState state{RunState::Idle};
    int files_done = 0;
    int files_total = 0;
    int lines_extracted = 0;
    std::string unit;               // UnitDone: file name
};

// Invoked serialized, possibly from worker threads. Must not block.
// A std::exception thrown by the sink stops the run as Failed.
using ProgressSink = std::function<void(const ProgressEvent&)>;

// Walker -> Extractor -> Filter -> Writer for one input folder.
class BatchRunner {
public:
    explicit BatchRunner(const ReferenceStore& store, RunOptions opt = {})
        : store_(store), opt_(std::move(opt)), parser_(opt_.extract) {}

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    // Cooperative: in-flight units finish, nothing new is dequeued, nothing is written.
    void cancel() noexcept { cancel_.store(true); }
    bool cancel_requested() const noexcept { return cancel_.load(); }
    RunState state() const noexcept { return state_.load(); }

    RunReport run(const RunRequest& req, const ProgressSink& sink = {}) {
        RunReport report;
        std::mutex sinkMtx;
        std::string sinkError;
        sinkFailed_.store(false);
        auto emit = [&](const ProgressEvent& ev) {
            if (!sink) return;
            std::lock_guard<std::mutex> lock(sinkMtx);
            if (sinkFailed_.load()) return;
            try {
                sink(ev);
            } catch (const std::exception& e) {
                sinkError = std::string("progress sink failed: ") + e.what();
                sinkFailed_.store(true);
            }
        };
        auto enter = [&](RunState s) {
            state_.store(s);
            report.state = s;
            ProgressEvent ev;
            ev.kind = ProgressEvent::Kind::StateChanged;
            ev.state = s;
            ev.files_total = report.files_total;
            ev.files_done = report.files_processed;
            ev.lines_extracted = report.lines_extracted;
            emit(ev);
        };
        auto fail = [&](ErrorKind kind, const std::string& path, const std::string& msg) {
            if (kind != ErrorKind::None) report.errors.push_back({ path, kind, msg });
            report.message = msg;
            enter(RunState::Failed);
            return report;
        };
        auto sink_fail = [&] {
            std::string msg;
            {
                std::lock_guard<std::mutex> lock(sinkMtx);
                msg = sinkError;
            }
            return fail(ErrorKind::None, req.input, msg);
        };

        // ---- Scanning ----
        enter(RunState::Scanning);
        if (sinkFailed_.load()) return sink_fail();
        std::vector<SourceUnit> units;
        std::string err;
        if (!list_units(req.input, units, &err))
            return fail(ErrorKind::InputUnreadable, req.input, err);
        report.files_total = (int)units.size();

        // ---- Extracting ----
        enter(RunState::Extracting);
        std::vector<UnitSlot> slots(units.size());
        extract_all(units, slots, report, emit);

        if (sinkFailed_.load()) {
            merge(slots, report);
            return sink_fail();
        }
        if (cancel_requested()) {
            merge(slots, report);
            enter(RunState::Cancelled);
            return report;
        }
        std::vector<InvoiceLine> lines = merge(slots, report);

        // ---- Validating ----
        enter(RunState::Validating);
        std::vector<InvoiceLine> accepted;
        {
            FilterOptions fo;
            fo.validate_materials = req.validate_materials;
            fo.validate_clients = req.validate_clients;

            if (!fo.validate_materials && !fo.validate_clients) {
                accepted = std::move(lines);
            } else {
                ReferenceStore::ReadView view = store_.read_view();
                accepted.reserve(lines.size());
                for (auto& line : lines) {
                    Rejection rej;
                    if (filter_line(line, fo, view, &rej)) {
                        accepted.push_back(std::move(line));
                        continue;
                    }
                    if (rej.reason == RejectReason::UnknownMaterial) report.rejected_unknown_material++;
                    else report.rejected_unknown_client++;
                    report.rejections.push_back(std::move(rej));
                }
            }
        }
        report.accepted_lines = (int)accepted.size();

        if (cancel_requested()) {
            enter(RunState::Cancelled);
            return report;
        }
        if (accepted.empty())
            return fail(ErrorKind::None, req.input, "no accepted lines");

        // ---- Writing ----
        enter(RunState::Writing);
        if (sinkFailed_.load()) return sink_fail();
        ExportOptions eo = opt_.export_options;
        if (eo.file_label.empty())
            eo.file_label = std::filesystem::u8path(req.input).lexically_normal().filename().u8string();
        if (eo.file_label.empty() || eo.file_label == ".")
            eo.file_label = std::filesystem::u8path(req.input).lexically_normal().parent_path().filename().u8string();

        std::string outPath;
        if (!write_export_file(accepted, req.output, eo, std::time(nullptr), outPath, &err))
            return fail(ErrorKind::OutputUnwritable, req.output, err);

        report.output_path = outPath;
        enter(RunState::Done);
        if (sinkFailed_.load()) {
            std::lock_guard<std::mutex> lock(sinkMtx);
            report.message = sinkError;   // output already published
        }
        return report;
    }

private:
    struct UnitSlot {
        std::vector<InvoiceLine> lines;
        std::vector<FileError> errors;
        int documents_parsed = 0;
        int invoices = 0;
        int credit_notes = 0;
        int debit_notes = 0;
        int other_documents = 0;
        int invalid_lines = 0;
        bool processed = false;
    };

    const ReferenceStore& store_;
    RunOptions opt_;
    Parser parser_;
    std::atomic<bool> cancel_{false};
    std::atomic<RunState> state_{RunState::Idle};
    std::atomic<bool> sinkFailed_{false};

    unsigned worker_count(size_t units) const {
        unsigned n = opt_.workers;
        if (n == 0) n = std::thread::hardware_concurrency();
        if (n == 0) n = 1;
        n = std::min(n, kMaxWorkers);
        n = std::min<unsigned>(n, (unsigned)std::max<size_t>(units, 1));
        return n;
    }

    void process_unit(const SourceUnit& unit, UnitSlot& out, std::atomic<int>& linesTotal,
                      const std::function<void(int)>& onLines) const
    {
        int docOrdinal = 0;
        auto onDoc = [&](const std::string& source, const std::string& xml) {
            Document doc;
            std::string perr;
            const int ordinal = docOrdinal++;
            if (!parser_.parse_string(xml, doc, &perr)) {
                out.errors.push_back({ source, ErrorKind::MalformedDocument, perr });
                return;
            }
            out.documents_parsed++;
            out.invalid_lines += doc.invalidLines;
            switch (doc.kind) {
            case DocKind::Invoice:    out.invoices++; break;
            case DocKind::CreditNote: out.credit_notes++; break;
            case DocKind::DebitNote:  out.debit_notes++; break;
            default:                  out.other_documents++; break;
            }
            for (auto& line : doc.lines) {
                line.source = source;
                line.unitOrdinal = unit.ordinal;
                line.documentOrdinal = ordinal;
                out.lines.push_back(std::move(line));
            }
            if (!doc.lines.empty())
                onLines(linesTotal.fetch_add((int)doc.lines.size()) + (int)doc.lines.size());
        };
        auto onIssue = [&](WalkIssue issue) {
            out.errors.push_back({ std::move(issue.path), issue.kind, std::move(issue.message) });
        };
        walk_unit(unit, opt_.walk, onDoc, onIssue);
    }

    template <class Emit>
    void extract_all(const std::vector<SourceUnit>& units, std::vector<UnitSlot>& slots,
                     const RunReport& report, Emit& emit)
    {
        std::atomic<size_t> cursor{0};
        std::atomic<int> filesDone{0};
        std::atomic<int> linesTotal{0};
        std::atomic<int> lastBucket{0};
        const int every = opt_.progress_every_lines;

        auto onLines = [&](int total) {
            if (every <= 0) return;
            const int bucket = total / every;
            int prev = lastBucket.load();
            while (bucket > prev) {
                if (lastBucket.compare_exchange_weak(prev, bucket)) {
                    ProgressEvent ev;
                    ev.kind = ProgressEvent::Kind::Lines;
                    ev.state = RunState::Extracting;
                    ev.files_total = report.files_total;
                    ev.files_done = filesDone.load();
                    ev.lines_extracted = total;
                    emit(ev);
                    break;
                }
            }
        };

        auto worker = [&] {
            for (;;) {
                if (cancel_requested() || sinkFailed_.load()) return;
                const size_t i = cursor.fetch_add(1);
                if (i >= units.size()) return;

                UnitSlot& slot = slots[i];
                try {
                    process_unit(units[i], slot, linesTotal, onLines);
                } catch (const std::exception& e) {
                    slot.errors.push_back({ units[i].name, ErrorKind::EntryUnreadable, e.what() });
                }
                slot.processed = true;

                ProgressEvent ev;
                ev.kind = ProgressEvent::Kind::UnitDone;
                ev.state = RunState::Extracting;
                ev.files_total = report.files_total;
                ev.files_done = filesDone.fetch_add(1) + 1;
                ev.lines_extracted = linesTotal.load();
                ev.unit = units[i].name;
                emit(ev);
            }
        };

        const unsigned n = worker_count(units.size());
        std::vector<std::thread> pool;
        pool.reserve(n);
        try {
            for (unsigned t = 0; t < n; ++t) pool.emplace_back(worker);
        } catch (const std::system_error&) {
            // fewer threads than asked; the running ones drain the queue
            if (pool.empty()) worker();
        }
        for (auto& th : pool) th.join();
    }

    // Slots in enumeration order -> one ordered line sequence plus counters.
    static std::vector<InvoiceLine> merge(std::vector<UnitSlot>& slots, RunReport& report) {
        std::vector<InvoiceLine> lines;
        for (auto& s : slots) {
            if (!s.processed) continue;
            report.files_processed++;
            report.documents_parsed += s.documents_parsed;
            report.invoices += s.invoices;
            report.credit_notes += s.credit_notes;
            report.debit_notes += s.debit_notes;
            report.other_documents += s.other_documents;
            report.invalid_lines += s.invalid_lines;
            report.lines_extracted += (int)s.lines.size();
            for (auto& e : s.errors) report.errors.push_back(std::move(e));
            for (auto& l : s.lines) lines.push_back(std::move(l));
            s = UnitSlot{};
        }
        return lines;
    }
};

} // namespace reggis
