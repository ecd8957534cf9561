/**
 * reggis export - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include <gtest/gtest.h>
#include <reference_store.hpp>
#include "test_support.hpp"

using namespace reggis;

// ============================================================================
// Materials
// ============================================================================

TEST(ReferenceStoreTest, StartsEmpty) {
    ReferenceStore store(":memory:");
    EXPECT_EQ(store.counts(), std::make_pair(std::size_t(0), std::size_t(0)));
    EXPECT_FALSE(store.lookup_material("M1", "800245795"));
    EXPECT_FALSE(store.lookup_client("900123456"));
}

TEST(ReferenceStoreTest, MaterialsKeyedByCodeAndEntity) {
    ReferenceStore store(":memory:");
    ImportResult r = store.import_materials({
        { 2, "M1", "Leche entera", "Parmalat" },
        { 3, "M1", "Leche entera", "Proleche" },
        { 4, " M2 ", "Kumis", "LACTALIS" },
    });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.inserted, 3);
    EXPECT_EQ(r.rejected, 0);

    EXPECT_TRUE(store.lookup_material("M1", "800245795"));
    EXPECT_TRUE(store.lookup_material("M1", "890903711"));
    EXPECT_TRUE(store.lookup_material("M2", "800245795"));
    EXPECT_FALSE(store.lookup_material("M2", "890903711"));
    EXPECT_FALSE(store.lookup_material("", "800245795"));
    EXPECT_EQ(store.counts().first, 3u);
}

TEST(ReferenceStoreTest, ParmalatStoredUnderLactalisTaxId) {
    ReferenceStore store(":memory:");
    ImportResult r = store.import_materials({ { 2, "123456", "Leche", "Parmalat" } });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.inserted, 1);
    EXPECT_TRUE(store.lookup_material("123456", "800245795"));
    EXPECT_FALSE(store.lookup_material("123456", "Parmalat"));
}

TEST(ReferenceStoreTest, DuplicateImportIsIdempotent) {
    ReferenceStore store(":memory:");
    const std::vector<MaterialRow> rows = {
        { 2, "M1", "Leche entera", "Parmalat" },
        { 3, "M2", "Kumis", "Parmalat" },
    };
    ASSERT_TRUE(store.import_materials(rows).ok());

    ImportResult again = store.import_materials(rows);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.inserted, 0);
    EXPECT_EQ(again.already_existing, 2);
    EXPECT_EQ(store.counts().first, 2u);
}

TEST(ReferenceStoreTest, RejectsIncompleteOrUnknownSociedad) {
    ReferenceStore store(":memory:");
    ImportResult r = store.import_materials({
        { 2, "M1", "", "Parmalat" },
        { 3, "M2", "Kumis", "Alpina" },
        { 4, "M3", "Queso", "Proleche" },
    });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.inserted, 1);
    EXPECT_EQ(r.rejected, 2);
    ASSERT_EQ(r.reasons.size(), 2u);
    EXPECT_EQ(r.reasons[0].row, 2);
    EXPECT_EQ(r.reasons[1].row, 3);
    EXPECT_NE(r.reasons[1].reason.find("Alpina"), std::string::npos);
}

// ============================================================================
// Clients
// ============================================================================

TEST(ReferenceStoreTest, ClientSentinels) {
    ReferenceStore store(":memory:");
    ImportResult r = store.import_clients({
        { 2, "P1", "Tienda La Esquina", "900123456" },
        { 3, "P2", "Sin registro", "NO NIT" },
        { 4, "P3", "Otro", "Sin Nit" },
        { 5, "P4", "Mayorista", "nit" },
        { 6, "P5", "Supermercado", " 901000111 " },
    });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.skipped, 2);
    EXPECT_EQ(r.inserted, 3);

    EXPECT_TRUE(store.lookup_client("900123456"));
    EXPECT_TRUE(store.lookup_client("901000111"));
    EXPECT_FALSE(store.lookup_client("nit"));
    EXPECT_FALSE(store.lookup_client(""));
    EXPECT_EQ(store.counts().second, 3u);
}

TEST(ReferenceStoreTest, ClientDuplicatesByParentCode) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_clients({ { 2, "P1", "Tienda", "900123456" } }).ok());

    ImportResult r = store.import_clients({
        { 2, "P1", "Tienda renombrada", "900999999" },
        { 3, "", "Sin codigo", "900888888" },
    });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.already_existing, 1);
    EXPECT_EQ(r.rejected, 1);
    EXPECT_FALSE(store.lookup_client("900999999"));
}

// ============================================================================
// Persistence and views
// ============================================================================

class ReferenceStoreFileTest : public reggis_test::TempDirTest {};

TEST_F(ReferenceStoreFileTest, ReloadsFromDisk) {
    const std::string db = path("reference.db");
    {
        ReferenceStore store(db);
        ASSERT_TRUE(store.import_materials({ { 2, "M1", "Leche", "Parmalat" } }).ok());
        ASSERT_TRUE(store.import_clients({ { 2, "P1", "Tienda", "900123456" }, { 3, "P2", "Otra", "nit" } }).ok());
    }
    ReferenceStore reopened(db);
    EXPECT_TRUE(reopened.lookup_material("M1", "800245795"));
    EXPECT_TRUE(reopened.lookup_client("900123456"));
    EXPECT_EQ(reopened.counts(), std::make_pair(std::size_t(1), std::size_t(2)));
}

TEST_F(ReferenceStoreFileTest, OpenFailureThrows) {
    EXPECT_THROW({ ReferenceStore store(path("missing/dir/reference.db")); }, StoreError);
}

TEST(ReferenceStoreTest, ReadViewSeesSameData) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_materials({ { 2, "M1", "Leche", "Proleche" } }).ok());
    ASSERT_TRUE(store.import_clients({ { 2, "P1", "Tienda", "900123456" } }).ok());

    ReferenceStore::ReadView view = store.read_view();
    EXPECT_TRUE(view.lookup_material("M1", "890903711"));
    EXPECT_FALSE(view.lookup_material("M1", "800245795"));
    EXPECT_TRUE(view.lookup_client("900123456"));
    EXPECT_FALSE(view.lookup_client("123"));
}

// ============================================================================
// Reading back
// ============================================================================

TEST(ReferenceStoreTest, GetMaterialReturnsStoredRow) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_materials({ { 2, " M1 ", " Leche entera ", "Parmalat" } }).ok());

    std::optional<MaterialRecord> m = store.get_material("M1", "800245795");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->code, "M1");
    EXPECT_EQ(m->description, "Leche entera");
    EXPECT_EQ(m->entity, "800245795");
    EXPECT_EQ(m->createdAt.size(), 19u);   // YYYY-MM-DD HH:MM:SS

    EXPECT_FALSE(store.get_material("M1", "890903711").has_value());
    EXPECT_FALSE(store.get_material("M9", "800245795").has_value());
}

TEST(ReferenceStoreTest, GetClientKeepsNullNit) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_clients({
        { 2, "P1", "Tienda", "900123456" },
        { 3, "P2", "Otra", "nit" },
    }).ok());

    std::optional<ClientRecord> c = store.get_client(" P1 ");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->name, "Tienda");
    ASSERT_TRUE(c->nit.has_value());
    EXPECT_EQ(*c->nit, "900123456");
    EXPECT_FALSE(c->createdAt.empty());

    std::optional<ClientRecord> noNit = store.get_client("P2");
    ASSERT_TRUE(noNit.has_value());
    EXPECT_FALSE(noNit->nit.has_value());

    EXPECT_FALSE(store.get_client("P9").has_value());
}

TEST(ReferenceStoreTest, ListMaterialsPagesNewestFirst) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_materials({
        { 2, "M1", "Uno", "Parmalat" },
        { 3, "M2", "Dos", "Parmalat" },
        { 4, "M3", "Tres", "Proleche" },
    }).ok());

    std::vector<MaterialRecord> all = store.list_materials();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].code, "M3");
    EXPECT_EQ(all[2].code, "M1");

    std::vector<MaterialRecord> page = store.list_materials(2, 1);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].code, "M2");
    EXPECT_EQ(page[1].code, "M1");

    EXPECT_TRUE(store.list_materials(10, 3).empty());
    EXPECT_TRUE(store.list_materials(0, 0).empty());
}

TEST(ReferenceStoreTest, ListClientsPages) {
    ReferenceStore store(":memory:");
    ASSERT_TRUE(store.import_clients({
        { 2, "P1", "Tienda", "900123456" },
        { 3, "P2", "Otra", "" },
    }).ok());

    std::vector<ClientRecord> page = store.list_clients(1, 0);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].parentCode, "P2");
    EXPECT_FALSE(page[0].nit.has_value());

    std::vector<ClientRecord> next = store.list_clients(1, 1);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].parentCode, "P1");
}
