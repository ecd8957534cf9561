/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include <gtest/gtest.h>
#include <batch_runner.hpp>
#include "test_support.hpp"
#include <stdexcept>

using namespace reggis;
using reggis_test::InvoiceFixture;
using reggis_test::LineFixture;

class BatchRunnerTest : public reggis_test::TempDirTest {
protected:
    ReferenceStore store_{":memory:"};

    std::string in() const { return path("in"); }
    std::string out() const { return path("out"); }

    static std::string invoice(const std::string& id, const std::vector<std::string>& codes,
                               const std::string& buyer = "900123456") {
        InvoiceFixture s;
        s.id = id;
        s.buyerNit = buyer;
        s.lines.clear();
        for (const auto& c : codes) {
            LineFixture l;
            l.code = c;
            s.lines.push_back(l);
        }
        return reggis_test::invoice_xml(s);
    }

    // a.zip: fe1 + malformed entry, b.zip: fe2 (two lines), c.xml: credit note
    void write_standard_input() {
        InvoiceFixture credit;
        credit.root = "CreditNote";
        credit.id = "NC-1";

        ASSERT_TRUE(reggis_test::write_zip(path("in/a.zip"), {
            { "fe1.xml", invoice("FE-1", { "M1" }) },
            { "bad.xml", "<Invoice><cbc:ID>broken" },
        }));
        ASSERT_TRUE(reggis_test::write_zip(path("in/b.zip"), {
            { "fe2.xml", invoice("FE-2", { "M2", "M3" }) },
        }));
        reggis_test::write_file(path("in/c.xml"), reggis_test::invoice_xml(credit));
    }

    RunRequest request() const {
        RunRequest req;
        req.input = in();
        req.output = out();
        return req;
    }
};

TEST_F(BatchRunnerTest, ExtractsAllUnitsAndReportsMalformed) {
    std::filesystem::create_directories(in());
    write_standard_input();

    BatchRunner runner(store_);
    RunReport r = runner.run(request());

    ASSERT_EQ(r.state, RunState::Done) << r.message;
    EXPECT_EQ(runner.state(), RunState::Done);
    EXPECT_EQ(r.files_total, 3);
    EXPECT_EQ(r.files_processed, 3);
    EXPECT_EQ(r.documents_parsed, 3);
    EXPECT_EQ(r.invoices, 2);
    EXPECT_EQ(r.credit_notes, 1);
    EXPECT_EQ(r.lines_extracted, 3);
    EXPECT_EQ(r.accepted_lines, 3);

    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::MalformedDocument);
    EXPECT_EQ(r.errors[0].path, "a.zip/bad.xml");

    ASSERT_FALSE(r.output_path.empty());
    EXPECT_EQ(std::filesystem::path(r.output_path).filename().string().rfind("REGGIS_in_", 0), 0u);

    const std::string csv = reggis_test::read_file(r.output_path);
    const size_t p1 = csv.find("FE-1;");
    const size_t p2 = csv.find("FE-2;Leche entera;M2;");
    const size_t p3 = csv.find("FE-2;Leche entera;M3;");
    ASSERT_NE(p1, std::string::npos);
    ASSERT_NE(p2, std::string::npos);
    ASSERT_NE(p3, std::string::npos);
    EXPECT_LT(p1, p2);
    EXPECT_LT(p2, p3);
}

TEST_F(BatchRunnerTest, UnreadableArchiveSkippedOthersExported) {
    reggis_test::write_file(path("in/a.zip"), "this is not a zip archive");
    ASSERT_TRUE(reggis_test::write_zip(path("in/b.zip"), {
        { "fe2.xml", invoice("FE-2", { "M2" }) },
    }));

    RunReport r = BatchRunner(store_).run(request());
    ASSERT_EQ(r.state, RunState::Done) << r.message;
    EXPECT_EQ(r.files_processed, 2);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::ArchiveUnreadable);
    EXPECT_EQ(r.errors[0].path, "a.zip");
    EXPECT_EQ(r.accepted_lines, 1);

    const std::string csv = reggis_test::read_file(r.output_path);
    EXPECT_NE(csv.find("FE-2;"), std::string::npos);
}

TEST_F(BatchRunnerTest, OutputIndependentOfWorkerCount) {
    std::filesystem::create_directories(in());
    write_standard_input();
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(reggis_test::write_zip(path("in/z" + std::to_string(i) + ".zip"), {
            { "x.xml", invoice("FX-" + std::to_string(i), { "A", "B" }) },
            { "y.xml", invoice("FY-" + std::to_string(i), { "C" }) },
        }));
    }

    RunOptions single;
    single.workers = 1;
    RunOptions many;
    many.workers = 4;

    RunRequest r1 = request();
    r1.output = path("out1");
    RunRequest r2 = request();
    r2.output = path("out2");

    RunReport a = BatchRunner(store_, single).run(r1);
    RunReport b = BatchRunner(store_, many).run(r2);
    ASSERT_EQ(a.state, RunState::Done);
    ASSERT_EQ(b.state, RunState::Done);
    EXPECT_EQ(a.lines_extracted, b.lines_extracted);
    EXPECT_EQ(reggis_test::read_file(a.output_path), reggis_test::read_file(b.output_path));
}

TEST_F(BatchRunnerTest, ValidationRejectsUnknownMaterialAndClient) {
    ASSERT_TRUE(store_.import_materials({ { 2, "M1", "Leche", "Parmalat" } }).ok());
    ASSERT_TRUE(store_.import_clients({ { 2, "P1", "Tienda", "900123456" } }).ok());

    reggis_test::write_file(path("in/f1.xml"), invoice("FE-1", { "M1", "M9" }));
    reggis_test::write_file(path("in/f2.xml"), invoice("FE-2", { "M1" }, "111"));

    RunRequest req = request();
    req.validate_materials = true;
    req.validate_clients = true;

    RunReport r = BatchRunner(store_).run(req);
    ASSERT_EQ(r.state, RunState::Done) << r.message;
    EXPECT_EQ(r.lines_extracted, 3);
    EXPECT_EQ(r.accepted_lines, 1);
    EXPECT_EQ(r.rejected_unknown_material, 1);
    EXPECT_EQ(r.rejected_unknown_client, 1);
    ASSERT_EQ(r.rejections.size(), 2u);
    EXPECT_EQ(r.rejections[0].reason, RejectReason::UnknownMaterial);
    EXPECT_EQ(r.rejections[0].productCode, "M9");
    EXPECT_EQ(r.rejections[0].source, "f1.xml");
    EXPECT_EQ(r.rejections[1].reason, RejectReason::UnknownClient);
    EXPECT_EQ(r.rejections[1].invoiceNumber, "FE-2");
}

TEST_F(BatchRunnerTest, SwitchesOffPassEverything) {
    reggis_test::write_file(path("in/f1.xml"), invoice("FE-1", { "M9" }, "111"));

    RunReport r = BatchRunner(store_).run(request());
    ASSERT_EQ(r.state, RunState::Done);
    EXPECT_EQ(r.accepted_lines, 1);
    EXPECT_TRUE(r.rejections.empty());
}

TEST_F(BatchRunnerTest, CancelledRunWritesNothing) {
    std::filesystem::create_directories(in());
    write_standard_input();

    BatchRunner runner(store_);
    RunReport r = runner.run(request(), [&](const ProgressEvent& ev) {
        if (ev.kind == ProgressEvent::Kind::StateChanged && ev.state == RunState::Extracting)
            runner.cancel();
    });

    EXPECT_EQ(r.state, RunState::Cancelled);
    EXPECT_TRUE(runner.cancel_requested());
    EXPECT_TRUE(r.output_path.empty());
    EXPECT_TRUE(reggis_test::list_dir(out()).empty());
}

TEST_F(BatchRunnerTest, ThrowingSinkFailsRunWithoutOutput) {
    std::filesystem::create_directories(in());
    write_standard_input();

    RunOptions opt;
    opt.workers = 2;
    int calls = 0;
    RunReport r = BatchRunner(store_, opt).run(request(), [&](const ProgressEvent& ev) {
        calls++;
        if (ev.kind == ProgressEvent::Kind::UnitDone) throw std::runtime_error("display closed");
    });

    EXPECT_EQ(r.state, RunState::Failed);
    EXPECT_EQ(r.message, "progress sink failed: display closed");
    EXPECT_TRUE(r.output_path.empty());
    EXPECT_TRUE(reggis_test::list_dir(out()).empty());
    EXPECT_EQ(calls, 3);   // Scanning, Extracting, the throwing UnitDone
}

TEST_F(BatchRunnerTest, ProgressFollowsStateMachine) {
    std::filesystem::create_directories(in());
    write_standard_input();

    std::vector<RunState> states;
    int unitsDone = 0;
    RunReport r = BatchRunner(store_).run(request(), [&](const ProgressEvent& ev) {
        if (ev.kind == ProgressEvent::Kind::StateChanged) states.push_back(ev.state);
        if (ev.kind == ProgressEvent::Kind::UnitDone) unitsDone++;
    });

    ASSERT_EQ(r.state, RunState::Done);
    const std::vector<RunState> expected = {
        RunState::Scanning, RunState::Extracting, RunState::Validating, RunState::Writing, RunState::Done };
    EXPECT_EQ(states, expected);
    EXPECT_EQ(unitsDone, 3);
}

TEST_F(BatchRunnerTest, MissingInputFails) {
    RunReport r = BatchRunner(store_).run(request());
    EXPECT_EQ(r.state, RunState::Failed);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::InputUnreadable);
}

TEST_F(BatchRunnerTest, NoAcceptedLinesFails) {
    InvoiceFixture credit;
    credit.root = "CreditNote";
    reggis_test::write_file(path("in/c.xml"), reggis_test::invoice_xml(credit));

    RunReport r = BatchRunner(store_).run(request());
    EXPECT_EQ(r.state, RunState::Failed);
    EXPECT_EQ(r.message, "no accepted lines");
    EXPECT_TRUE(reggis_test::list_dir(out()).empty());
}

TEST_F(BatchRunnerTest, UnwritableOutputFails) {
    reggis_test::write_file(path("in/f1.xml"), invoice("FE-1", { "M1" }));
    reggis_test::write_file(out(), "not a folder");

    RunReport r = BatchRunner(store_).run(request());
    EXPECT_EQ(r.state, RunState::Failed);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_EQ(r.errors.back().kind, ErrorKind::OutputUnwritable);
}
