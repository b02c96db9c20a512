#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace protocol_tests {

using namespace test_support;

void test_decode_init_db() {
    std::cout << "  test_decode_init_db..." << std::flush;

    auto req = pantry::decode_request(R"({"type":"InitDbFile"})");
    auto* init = std::get_if<pantry::init_db_request>(&req);
    assert(init && !init->database_file);

    req = pantry::decode_request(R"({"type":"InitDbFile","database_file":"meals.sqlite3"})");
    init = std::get_if<pantry::init_db_request>(&req);
    assert(init && init->database_file == "meals.sqlite3");

    // Empty and null names mean "use the default"
    req = pantry::decode_request(R"({"type":"InitDbFile","database_file":""})");
    assert(!std::get<pantry::init_db_request>(req).database_file);
    req = pantry::decode_request(R"({"type":"InitDbFile","database_file":null})");
    assert(!std::get<pantry::init_db_request>(req).database_file);

    std::cout << " OK" << std::endl;
}

void test_decode_exec_bind_values() {
    std::cout << "  test_decode_exec_bind_values..." << std::flush;

    auto req = pantry::decode_request(R"json({
        "type": "Exec",
        "statements": [
            {"sql": "CREATE TABLE t(a, b, c, d, e, f)"},
            {"sql": "INSERT INTO t VALUES (?, ?, ?, ?, ?, ?)", "bind": [1, 2.5, "x", null, true, [0, 16, 255]]},
            {"sql": "DELETE FROM t", "bind": null}
        ]
    })json");
    auto& exec = std::get<pantry::exec_request>(req);
    assert(!exec.database_file);
    assert(exec.statements.size() == 3);
    assert(exec.statements[0].bind.empty());
    assert(exec.statements[2].bind.empty());

    const auto& bind = exec.statements[1].bind;
    assert(bind.size() == 6);
    assert(as_int(bind[0]) == 1);
    assert(std::get<double>(bind[1]) == 2.5);
    assert(as_text(bind[2]) == "x");
    assert(std::holds_alternative<std::nullptr_t>(bind[3]));
    assert(as_int(bind[4]) == 1);
    assert((std::get<pantry::blob_t>(bind[5]) == pantry::blob_t{0, 16, 255}));

    // Missing statements is an empty batch
    req = pantry::decode_request(R"({"type":"Exec"})");
    assert(std::get<pantry::exec_request>(req).statements.empty());

    std::cout << " OK" << std::endl;
}

void test_decode_query() {
    std::cout << "  test_decode_query..." << std::flush;

    auto req = pantry::decode_request(
        R"({"type":"Query","database_file":"p.sqlite3","sql":"SELECT * FROM t WHERE id = ?","bind":["p1"]})");
    auto& query = std::get<pantry::query_request>(req);
    assert(query.database_file == "p.sqlite3");
    assert(query.query.sql == "SELECT * FROM t WHERE id = ?");
    assert(query.query.bind.size() == 1);
    assert(as_text(query.query.bind[0]) == "p1");
    assert(std::string(pantry::request_kind(req)) == "Query");

    std::cout << " OK" << std::endl;
}

template <typename Error>
std::string decode_failure(const std::string& payload) {
    try {
        pantry::decode_request(payload);
    } catch (const Error& e) {
        return e.what();
    }
    assert(false && "expected decode to throw");
    return {};
}

void test_decode_errors() {
    std::cout << "  test_decode_errors..." << std::flush;

    using pantry::request_decode_error;
    using pantry::unknown_request_kind;

    auto msg = decode_failure<request_decode_error>("this is not json{");
    assert(starts_with(msg, "Failed to parse request: "));

    msg = decode_failure<request_decode_error>("[1, 2]");
    assert(msg == "Failed to parse request: expected a JSON object, got array");

    msg = decode_failure<request_decode_error>(R"({"sql":"SELECT 1"})");
    assert(msg == "Failed to parse request: missing 'type'");

    msg = decode_failure<request_decode_error>(R"({"type":"Query"})");
    assert(msg == "Failed to parse request: missing 'sql'");

    msg = decode_failure<request_decode_error>(R"({"type":"Query","sql":42})");
    assert(msg == "Failed to parse request: 'sql' must be a string");

    msg = decode_failure<request_decode_error>(R"({"type":"Query","sql":"SELECT ?","bind":[{"a":1}]})");
    assert(starts_with(msg, "Failed to parse request: bind[0]"));

    msg = decode_failure<request_decode_error>(R"({"type":"Exec","statements":[{"bind":[]}]})");
    assert(msg == "Failed to parse request: statements[0]: missing 'sql'");

    msg = decode_failure<request_decode_error>(R"({"type":"Exec","statements":"DROP TABLE t"})");
    assert(msg == "Failed to parse request: 'statements' must be an array");

    msg = decode_failure<unknown_request_kind>(R"({"type":"Bogus"})");
    assert(msg == "Unknown request type: Bogus");

    msg = decode_failure<unknown_request_kind>(R"({"type":7})");
    assert(msg == "Unknown request type: 7");

    std::cout << " OK" << std::endl;
}

void test_encode_responses() {
    std::cout << "  test_encode_responses..." << std::flush;

    assert(pantry::encode_response(pantry::ok_response{}) == R"({"type":"Ok"})");
    assert(pantry::encode_response(pantry::err_response{"boom"}) == R"({"type":"Err","message":"boom"})");
    assert(pantry::encode_debug("Exec begin") == R"({"type":"Debug","message":"Exec begin"})");

    // Columns keep result order, not alphabetical order
    pantry::rows_response rows;
    rows.rows.push_back({{"zeta", int64_t{1}}, {"alpha", std::string("a")},
                         {"blob", pantry::blob_t{1, 2}}, {"none", nullptr}, {"real", 0.5}});
    assert(pantry::encode_response(rows) ==
           R"({"type":"Rows","rows":[{"zeta":1,"alpha":"a","blob":[1,2],"none":null,"real":0.5}]})");

    assert(pantry::encode_response(pantry::rows_response{}) == R"({"type":"Rows","rows":[]})");

    std::cout << " OK" << std::endl;
}

void test_encode_request_decodes_back() {
    std::cout << "  test_encode_request_decodes_back..." << std::flush;

    pantry::exec_request exec;
    exec.database_file = "x.sqlite3";
    exec.statements = {
        {"INSERT INTO t VALUES (?, ?)", {int64_t{3}, pantry::blob_t{9, 8}}},
        {"DELETE FROM t"},
    };
    auto decoded = pantry::decode_request(pantry::encode_request(exec));
    auto& back = std::get<pantry::exec_request>(decoded);
    assert(back.database_file == exec.database_file);
    assert(back.statements == exec.statements);

    std::cout << " OK" << std::endl;
}

void test_decode_reply() {
    std::cout << "  test_decode_reply..." << std::flush;

    auto r = pantry::decode_reply(R"({"type":"Rows","rows":[{"id":1,"name":"a","data":[5,6]}]})");
    auto& rows = std::get<pantry::rows_response>(r).rows;
    assert(rows.size() == 1);
    assert(rows[0][0].first == "id");
    assert(as_int(rows[0][0].second) == 1);
    assert(as_text(rows[0][1].second) == "a");
    assert((std::get<pantry::blob_t>(rows[0][2].second) == pantry::blob_t{5, 6}));

    r = pantry::decode_reply(R"({"type":"Debug","message":"Query begin"})");
    assert(std::get<pantry::debug_message>(r).message == "Query begin");

    r = pantry::decode_reply(R"({"type":"Err","message":"nope"})");
    assert(std::get<pantry::err_response>(r).message == "nope");

    bool threw = false;
    try {
        pantry::decode_reply(R"({"type":"Maybe"})");
    } catch (const pantry::unexpected_reply&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing protocol..." << std::endl;
    test_decode_init_db();
    test_decode_exec_bind_values();
    test_decode_query();
    test_decode_errors();
    test_encode_responses();
    test_encode_request_decodes_back();
    test_decode_reply();
}

} // namespace protocol_tests
