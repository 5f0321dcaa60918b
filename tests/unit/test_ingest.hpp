#pragma once

namespace payledger::tests {

void test_parse_record();
void test_to_command();
void test_csv_reader();
void test_csv_reader_header();
void test_csv_reader_quoted_fields();

}  // namespace payledger::tests
