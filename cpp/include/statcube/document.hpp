#pragma once

#include "statcube/config.hpp"
#include "statcube/io/fetcher.hpp"
#include "statcube/logging.hpp"
#include "statcube/table.hpp"
#include "statcube/types.hpp"

#include <boost/json.hpp>

#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace statcube {

enum class DocumentClass {
    Dataset,
    Dimension,
    Collection
};

const char* document_class_name(DocumentClass cls) noexcept;

// Throws MalformedDocument for anything but dataset, dimension or collection
DocumentClass parse_document_class(const std::string& name);

/**
 * A JSON-stat document: its class and its body as an ordered JSON object.
 * Immutable once read.
 */
class Document {
public:
    Document(DocumentClass cls, boost::json::object body);

    DocumentClass document_class() const noexcept { return class_; }
    const boost::json::object& body() const noexcept { return body_; }

    bool operator==(const Document& other) const {
        return class_ == other.class_ && body_ == other.body_;
    }
    bool operator!=(const Document& other) const { return !(*this == other); }

private:
    DocumentClass class_;
    boost::json::object body_;
};

// True for http://, https://, ftp:// and ftps:// sources
bool is_url(const std::string& source);

// =============================================================================
// Reading
// =============================================================================

/**
 * From a flat table. A dataset is encoded as 2.0 with `value_key` as the
 * value column. A dimension table has an `id` column, an optional `index`
 * column and exactly one label column. Collections cannot come from a table.
 */
Document read(DocumentClass cls, const Table& table, const std::string& value_key = "value");

// From a flat table, with the value column and output version taken from `codec`
Document read(DocumentClass cls, const Table& table, const CodecConfig& codec);

// From an already deserialized document
Document read(DocumentClass cls, const boost::json::value& value);

// From a JSON byte stream. Parser errors propagate unchanged.
Document read(DocumentClass cls, std::istream& stream);

// From JSON text, or from a URL retrieved through `fetcher`
Document read(DocumentClass cls, const std::string& source, const Fetcher& fetcher);

// =============================================================================
// Writing
// =============================================================================

std::string write_json(const Document& doc);

/**
 * Dataset: decoded cube (the first dataset of a 1.x bundle).
 * Dimension: columns id, <dimension label>, index sorted by index.
 * Collections throw UnsupportedOutputFormat; use write_tables.
 */
Table write_table(const Document& doc, Naming naming = Naming::Label,
                  const std::string& value_key = "value");

// JSON text, one table, or a table list
using Output = std::variant<std::string, Table, std::vector<Table>>;

/**
 * Write a document in `format`, using the naming and value column of `codec`.
 *
 * Datasets and dimensions write to JsonText or Table; collections write to
 * JsonText or TableList (items reached through `fetcher`). Any other pairing
 * throws UnsupportedOutputFormat.
 */
Output write(const Document& doc, OutputFormat format, const Fetcher& fetcher, Logger& logger,
             const CodecConfig& codec = CodecConfig{});

// `format` as accepted by parse_output_format
Output write(const Document& doc, const std::string& format, const Fetcher& fetcher, Logger& logger,
             const CodecConfig& codec = CodecConfig{});

} // namespace statcube
