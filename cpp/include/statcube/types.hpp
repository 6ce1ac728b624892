#pragma once

#include <string>

namespace statcube {

/**
 * How categories and dimensions are named in a decoded table:
 * Label uses display labels, Id uses identifiers.
 */
enum class Naming {
    Label,
    Id
};

// JSON-stat wire format versions the encoder can produce
enum class Version {
    V1_3,
    V2_0
};

enum class OutputFormat {
    JsonText,
    Table,
    TableList
};

// Throws InvalidNamingMode for anything other than "label" or "id"
Naming parse_naming(const std::string& naming);
const char* naming_name(Naming naming) noexcept;

// Throws UnsupportedVersion for anything other than "1.3" or "2.0"
Version parse_version(const std::string& version);
const char* version_string(Version version) noexcept;

// Accepts "jsonstat"/"json", "table"/"dataframe", "table_list"/"dataframe_list"
OutputFormat parse_output_format(const std::string& format);

} // namespace statcube
