#include <iostream>
#include <cassert>
#include <chrono>
#include <cstring>
#include <functional>
#include <vector>
#include <libpq-fe.h>
#include "database/PostgresDirectory.h"
#include "Errors.h"

namespace {

// Columns in the order the directory selects them.
const char* REVIEWER_COLUMN_NAMES[] = {
    "id", "name", "phone", "role", "available", "status", "status_since", "backlog_pages"
};
const int REVIEWER_COLUMN_COUNT = 8;

const std::vector<const char*> VALID_ROW = {
    "R1", "Rita", "1001", "1", "t", "2", "1500000", "7"
};

// Builds a one-row result without a server. nullptr values become SQL NULL.
PGresult* makeReviewerResult(const std::vector<const char*>& values) {
    PGresult* res = PQmakeEmptyPGresult(nullptr, PGRES_TUPLES_OK);
    assert(res);

    PGresAttDesc attrs[REVIEWER_COLUMN_COUNT];
    for (int i = 0; i < REVIEWER_COLUMN_COUNT; i++) {
        std::memset(&attrs[i], 0, sizeof(attrs[i]));
        attrs[i].name = const_cast<char*>(REVIEWER_COLUMN_NAMES[i]);
        attrs[i].typid = 25;
        attrs[i].typlen = -1;
        attrs[i].atttypmod = -1;
    }
    assert(PQsetResultAttrs(res, REVIEWER_COLUMN_COUNT, attrs));

    for (int i = 0; i < REVIEWER_COLUMN_COUNT; i++) {
        const char* value = values[i];
        int length = value ? static_cast<int>(std::strlen(value)) : -1;
        assert(PQsetvalue(res, 0, i, const_cast<char*>(value), length));
    }
    return res;
}

std::vector<const char*> rowWith(int column, const char* value) {
    std::vector<const char*> row = VALID_ROW;
    row[column] = value;
    return row;
}

// True only when the failure is reported as a storage error, never as a
// caller-side validation error.
bool failsAsStorageError(const std::function<void()>& action) {
    try {
        action();
    } catch (const ValidationError&) {
        return false;
    } catch (const StorageError&) {
        return true;
    } catch (const std::exception& e) {
        std::cout << "Unexpected exception: " << e.what() << std::endl;
        return false;
    }
    return false;
}

bool rowFailsAsStorageError(const std::vector<const char*>& values) {
    PGresult* res = makeReviewerResult(values);
    bool failed = failsAsStorageError([res] { reviewerFromRow(res, 0); });
    PQclear(res);
    return failed;
}

void testValidRow() {
    PGresult* res = makeReviewerResult(VALID_ROW);
    Reviewer reviewer = reviewerFromRow(res, 0);
    PQclear(res);

    assert(reviewer.id == "R1");
    assert(reviewer.name == "Rita");
    assert(reviewer.phone == "1001");
    assert(reviewer.role == ReviewerRole::REVIEWER);
    assert(reviewer.available);
    assert(reviewer.status == ReviewerStatus::VERY_BUSY);
    assert(reviewer.backlog_pages == 7);
    assert(reviewer.status_since ==
           std::chrono::system_clock::time_point(std::chrono::milliseconds(1500)));
    std::cout << "Valid row passed\n";
}

void testMalformedRows() {
    assert(rowFailsAsStorageError(rowWith(5, "busy")));
    assert(rowFailsAsStorageError(rowWith(5, "7")));
    assert(rowFailsAsStorageError(rowWith(5, nullptr)));
    assert(rowFailsAsStorageError(rowWith(3, "")));
    assert(rowFailsAsStorageError(rowWith(4, "x")));
    assert(rowFailsAsStorageError(rowWith(4, nullptr)));
    assert(rowFailsAsStorageError(rowWith(6, "")));
    assert(rowFailsAsStorageError(rowWith(6, nullptr)));
    assert(rowFailsAsStorageError(rowWith(7, "12 pages")));
    assert(rowFailsAsStorageError(rowWith(7, "3000000000")));
    std::cout << "Malformed rows passed\n";
}

void testTimestampConversion() {
    assert(epochMicrosToTime("1500000") ==
           std::chrono::system_clock::time_point(std::chrono::milliseconds(1500)));
    assert(timeToEpochMicros(epochMicrosToTime("1792411200000000")) == "1792411200000000");

    assert(failsAsStorageError([] { epochMicrosToTime(""); }));
    assert(failsAsStorageError([] { epochMicrosToTime(nullptr); }));
    assert(failsAsStorageError([] { epochMicrosToTime("12abc"); }));
    assert(failsAsStorageError([] { epochMicrosToTime("99999999999999999999999"); }));
    std::cout << "Timestamp conversion passed\n";
}

void testIntegerParsing() {
    assert(parseInt("42", "count") == 42);
    assert(parseBigint("-5", "id") == -5);
    assert(failsAsStorageError([] { parseInt("3000000000", "count"); }));
    assert(failsAsStorageError([] { parseBigint("", "id"); }));
    std::cout << "Integer parsing passed\n";
}

} // namespace

int main() {
    std::cout << "Starting row conversion tests...\n";

    testValidRow();
    testMalformedRows();
    testTimestampConversion();
    testIntegerParsing();

    std::cout << "All row conversion tests passed!\n";
    return 0;
}
