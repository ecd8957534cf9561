/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include <gtest/gtest.h>
#include <archive_walker.hpp>
#include "test_support.hpp"

using namespace reggis;

class ArchiveWalkerTest : public reggis_test::TempDirTest {
protected:
    std::vector<std::pair<std::string, std::string>> docs_;
    std::vector<WalkIssue> issues_;

    void walk(const SourceUnit& u, const WalkOptions& opt = {}) {
        walk_unit(u, opt,
            [&](const std::string& source, const std::string& xml){ docs_.emplace_back(source, xml); },
            [&](WalkIssue issue){ issues_.push_back(std::move(issue)); });
    }

    SourceUnit unit(const std::string& name) const {
        SourceUnit u;
        u.name = name;
        u.path = path(name);
        u.isArchive = has_ext_ci(name, ".zip");
        return u;
    }
};

TEST_F(ArchiveWalkerTest, ListsTopLevelXmlAndZipSorted) {
    reggis_test::write_file(path("b.ZIP"), "x");
    reggis_test::write_file(path("a.xml"), "<a/>");
    reggis_test::write_file(path("notes.txt"), "x");
    reggis_test::write_file(path("sub/c.xml"), "<c/>");

    std::vector<SourceUnit> units;
    std::string err;
    ASSERT_TRUE(list_units(dir_.string(), units, &err)) << err;
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].name, "a.xml");
    EXPECT_FALSE(units[0].isArchive);
    EXPECT_EQ(units[0].ordinal, 0);
    EXPECT_EQ(units[1].name, "b.ZIP");
    EXPECT_TRUE(units[1].isArchive);
    EXPECT_EQ(units[1].ordinal, 1);
}

TEST_F(ArchiveWalkerTest, MissingFolderFails) {
    std::vector<SourceUnit> units;
    std::string err;
    EXPECT_FALSE(list_units(path("nope"), units, &err));
    EXPECT_FALSE(err.empty());
}

TEST_F(ArchiveWalkerTest, LooseXmlIsOneDocument) {
    reggis_test::write_file(path("a.xml"), "<Invoice/>");
    walk(unit("a.xml"));
    ASSERT_EQ(docs_.size(), 1u);
    EXPECT_EQ(docs_[0].first, "a.xml");
    EXPECT_EQ(docs_[0].second, "<Invoice/>");
    EXPECT_TRUE(issues_.empty());
}

TEST_F(ArchiveWalkerTest, ArchiveEntriesInOrderSkippingOthers) {
    ASSERT_TRUE(reggis_test::write_zip(path("lote.zip"), {
        { "fe1.xml", "<one/>" },
        { "readme.txt", "ignored" },
        { "inner.zip", "ignored" },
        { "FE2.XML", "<two/>" },
    }));
    walk(unit("lote.zip"));
    ASSERT_EQ(docs_.size(), 2u);
    EXPECT_EQ(docs_[0].first, "lote.zip/fe1.xml");
    EXPECT_EQ(docs_[0].second, "<one/>");
    EXPECT_EQ(docs_[1].first, "lote.zip/FE2.XML");
    EXPECT_TRUE(issues_.empty());
}

TEST_F(ArchiveWalkerTest, CorruptArchiveReported) {
    reggis_test::write_file(path("broken.zip"), "definitely not a zip");
    walk(unit("broken.zip"));
    EXPECT_TRUE(docs_.empty());
    ASSERT_EQ(issues_.size(), 1u);
    EXPECT_EQ(issues_[0].kind, ErrorKind::ArchiveUnreadable);
    EXPECT_EQ(issues_[0].path, "broken.zip");
}

TEST_F(ArchiveWalkerTest, OversizedEntryReportedOthersContinue) {
    ASSERT_TRUE(reggis_test::write_zip(path("lote.zip"), {
        { "big.xml", std::string(64, 'x') },
        { "small.xml", "<s/>" },
    }));
    WalkOptions opt;
    opt.max_entry_bytes = 16;
    walk(unit("lote.zip"), opt);

    ASSERT_EQ(issues_.size(), 1u);
    EXPECT_EQ(issues_[0].kind, ErrorKind::EntryUnreadable);
    EXPECT_EQ(issues_[0].path, "lote.zip/big.xml");
    ASSERT_EQ(docs_.size(), 1u);
    EXPECT_EQ(docs_[0].first, "lote.zip/small.xml");
}
