#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace database_tests {

using namespace test_support;

// ============================================================================
// test_foreign_keys_enabled: every handle enforces REFERENCES
// ============================================================================

void test_foreign_keys_enabled() {
    std::cout << "  test_foreign_keys_enabled..." << std::flush;

    pantry::database db(pantry::in_memory_path);
    auto rows = db.query("PRAGMA foreign_keys");
    assert(rows.size() == 1);
    assert(as_int(rows[0][0].second) == 1);

    db.execute("CREATE TABLE parent(id INTEGER PRIMARY KEY)");
    db.execute("CREATE TABLE child(id INTEGER PRIMARY KEY, parent_id INTEGER REFERENCES parent(id))");

    bool threw = false;
    try {
        db.execute("INSERT INTO child(id, parent_id) VALUES (?, ?)", {int64_t{1}, int64_t{42}});
    } catch (const pantry::statement_error& e) {
        threw = true;
        assert(contains(e.what(), "FOREIGN KEY"));
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_bind_and_extract_all_types
// ============================================================================

void test_bind_and_extract_all_types() {
    std::cout << "  test_bind_and_extract_all_types..." << std::flush;

    pantry::database db(pantry::in_memory_path);
    db.execute("CREATE TABLE item(id INTEGER PRIMARY KEY, name TEXT, score REAL, data BLOB, note TEXT)");
    db.execute("INSERT INTO item(id, name, score, data, note) VALUES (?, ?, ?, ?, ?)",
               {int64_t{7}, std::string("oats"), 3.25, pantry::blob_t{0x00, 0x7f, 0xff}, nullptr});

    auto rows = db.query("SELECT id, name, score, data, note FROM item WHERE id = ?", {int64_t{7}});
    assert(rows.size() == 1);
    const auto& row = rows[0];

    // Column order follows the SELECT list
    assert(row.size() == 5);
    assert(row[0].first == "id");
    assert(row[1].first == "name");
    assert(row[4].first == "note");

    assert(as_int(row[0].second) == 7);
    assert(as_text(row[1].second) == "oats");
    assert(std::get<double>(row[2].second) == 3.25);
    assert((std::get<pantry::blob_t>(row[3].second) == pantry::blob_t{0x00, 0x7f, 0xff}));
    assert(std::holds_alternative<std::nullptr_t>(row[4].second));

    auto* name = pantry::find_column(row, "name");
    assert(name && as_text(*name) == "oats");
    assert(pantry::find_column(row, "missing") == nullptr);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_multi_statement_execute: statements in one SQL text run in order
// ============================================================================

void test_multi_statement_execute() {
    std::cout << "  test_multi_statement_execute..." << std::flush;

    pantry::database db(pantry::in_memory_path);
    db.execute("CREATE TABLE a(x INTEGER); INSERT INTO a VALUES (1); INSERT INTO a VALUES (2);");

    auto rows = db.query("SELECT COUNT(*) AS n FROM a");
    assert(as_int(rows[0][0].second) == 2);

    // With params: the values bind to the first statement
    db.execute("INSERT INTO a VALUES (?); INSERT INTO a VALUES (10)", {int64_t{5}});
    rows = db.query("SELECT x FROM a ORDER BY x");
    assert(rows.size() == 4);
    assert(as_int(rows[2][0].second) == 5);
    assert(as_int(rows[3][0].second) == 10);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_statement_errors: prepare and bind failures carry SQLite's message
// ============================================================================

void test_statement_errors() {
    std::cout << "  test_statement_errors..." << std::flush;

    pantry::database db(pantry::in_memory_path);

    bool threw = false;
    try {
        db.query("SELEC 1");
    } catch (const pantry::statement_error& e) {
        threw = true;
        assert(e.code() == SQLITE_ERROR);
        assert(contains(e.what(), "syntax error"));
    }
    assert(threw);

    threw = false;
    try {
        db.query("SELECT * FROM nowhere");
    } catch (const pantry::statement_error& e) {
        threw = true;
        assert(contains(e.what(), "no such table"));
    }
    assert(threw);

    // More values than placeholders
    db.execute("CREATE TABLE t(x)");
    threw = false;
    try {
        db.execute("INSERT INTO t VALUES (?)", {int64_t{1}, int64_t{2}});
    } catch (const pantry::statement_error& e) {
        threw = true;
        assert(e.code() == SQLITE_RANGE);
    }
    assert(threw);
    assert(db.query("SELECT * FROM t").empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_transaction_guard: rolls back unless committed
// ============================================================================

void test_transaction_guard() {
    std::cout << "  test_transaction_guard..." << std::flush;

    pantry::database db(pantry::in_memory_path);
    db.execute("CREATE TABLE t(x INTEGER)");

    {
        pantry::transaction tx(db);
        assert(db.is_in_transaction());
        db.execute("INSERT INTO t VALUES (1)");
    }
    assert(!db.is_in_transaction());
    assert(db.query("SELECT * FROM t").empty());

    {
        pantry::transaction tx(db);
        db.execute("INSERT INTO t VALUES (2)");
        tx.commit();
    }
    auto rows = db.query("SELECT x FROM t");
    assert(rows.size() == 1);
    assert(as_int(rows[0][0].second) == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing database..." << std::endl;
    test_foreign_keys_enabled();
    test_bind_and_extract_all_types();
    test_multi_statement_execute();
    test_statement_errors();
    test_transaction_guard();
}

} // namespace database_tests
