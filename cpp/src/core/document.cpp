#include "statcube/document.hpp"
#include "statcube/collection.hpp"
#include "statcube/cube.hpp"
#include "statcube/decoder.hpp"
#include "statcube/dimension.hpp"
#include "statcube/encoder.hpp"
#include "statcube/error.hpp"
#include "statcube/scalar.hpp"

#include <array>
#include <istream>
#include <utility>

namespace statcube {

namespace {

Document dimension_from_table(const Table& table) {
    const auto id_column = table.find_column("id");
    if (!id_column) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "dimension table has no id column", "id");
    }

    std::vector<std::size_t> label_columns;
    for (std::size_t c = 0; c < table.column_count(); ++c) {
        if (table.columns()[c] != "id" && table.columns()[c] != "index") {
            label_columns.push_back(c);
        }
    }
    if (label_columns.size() != 1) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                                "dimension table needs exactly one label column",
                                std::to_string(label_columns.size()));
    }
    const std::string& label_name = table.columns()[label_columns.front()];

    boost::json::array index;
    boost::json::object labels;
    for (const auto& row : table.rows()) {
        std::string id = coerce_to_str(row[*id_column]);
        index.emplace_back(boost::json::string(id));
        labels[id] = coerce_to_str(row[label_columns.front()]);
    }

    boost::json::object category;
    category["index"] = std::move(index);
    category["label"] = std::move(labels);

    boost::json::object body;
    body["version"] = "2.0";
    body["class"] = "dimension";
    body["label"] = label_name;
    body["category"] = std::move(category);
    return Document(DocumentClass::Dimension, std::move(body));
}

Table dimension_table(const boost::json::object& body) {
    std::string label_name = "label";
    if (const auto* label = body.if_contains("label")) {
        if (!label->is_null() && !coerce_to_str(*label).empty()) {
            label_name = coerce_to_str(*label);
        }
    }

    Table table({"id", label_name, "index"});
    for (const auto& category : resolve_dimension(body, label_name)) {
        table.add_row({boost::json::string(category.id), boost::json::string(category.label),
                       static_cast<std::int64_t>(category.position)});
    }
    return table;
}

} // anonymous namespace

const char* document_class_name(DocumentClass cls) noexcept {
    switch (cls) {
        case DocumentClass::Dataset:    return "dataset";
        case DocumentClass::Dimension:  return "dimension";
        case DocumentClass::Collection: return "collection";
    }
    return "unknown";
}

DocumentClass parse_document_class(const std::string& name) {
    if (name == "dataset") return DocumentClass::Dataset;
    if (name == "dimension") return DocumentClass::Dimension;
    if (name == "collection") return DocumentClass::Collection;
    throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                            "class must be dataset, dimension or collection", name);
}

Document::Document(DocumentClass cls, boost::json::object body)
    : class_(cls)
    , body_(std::move(body)) {}

bool is_url(const std::string& source) {
    static const std::array<const char*, 4> prefixes = {"http://", "https://", "ftp://", "ftps://"};
    for (const char* prefix : prefixes) {
        if (source.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

Document read(DocumentClass cls, const Table& table, const std::string& value_key) {
    CodecConfig codec;
    codec.value_column = value_key;
    return read(cls, table, codec);
}

Document read(DocumentClass cls, const Table& table, const CodecConfig& codec) {
    switch (cls) {
        case DocumentClass::Dataset:
            return Document(cls, encode(table, codec.value_column, codec.version));
        case DocumentClass::Dimension:
            return dimension_from_table(table);
        case DocumentClass::Collection:
            break;
    }
    throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                            "a collection cannot be read from a table", document_class_name(cls));
}

Document read(DocumentClass cls, const boost::json::value& value) {
    return Document(cls, as_document(value));
}

Document read(DocumentClass cls, std::istream& stream) {
    boost::json::stream_parser parser;
    std::array<char, 8192> buffer;
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(stream.gcount());
        if (count > 0) {
            parser.write(buffer.data(), count);
        }
    }
    if (stream.bad()) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "stream read failed", "istream");
    }
    parser.finish();
    return read(cls, parser.release());
}

Document read(DocumentClass cls, const std::string& source, const Fetcher& fetcher) {
    if (is_url(source)) {
        return read(cls, fetcher.fetch(source));
    }
    return read(cls, boost::json::parse(source));
}

std::string write_json(const Document& doc) {
    return boost::json::serialize(doc.body());
}

Table write_table(const Document& doc, Naming naming, const std::string& value_key) {
    switch (doc.document_class()) {
        case DocumentClass::Dataset: {
            const auto& body = doc.body();
            if (body.contains("dimension") && body.contains(value_key)) {
                return decode(body, naming, value_key);
            }
            auto tables = decode_bundle(body, naming, value_key);
            if (tables.empty()) {
                throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "bundle holds no dataset", value_key);
            }
            return std::move(tables.front());
        }
        case DocumentClass::Dimension:
            return dimension_table(doc.body());
        case DocumentClass::Collection:
            break;
    }
    throw StatcubeException(ErrorCode::UNSUPPORTED_OUTPUT_FORMAT,
                            "collections write to json or a table list", "table");
}

Output write(const Document& doc, OutputFormat format, const Fetcher& fetcher, Logger& logger,
             const CodecConfig& codec) {
    const bool collection = doc.document_class() == DocumentClass::Collection;
    switch (format) {
        case OutputFormat::JsonText:
            return write_json(doc);
        case OutputFormat::Table:
            if (!collection) return write_table(doc, codec.naming, codec.value_column);
            break;
        case OutputFormat::TableList:
            if (collection) return write_tables(doc, fetcher, logger, codec.naming, codec.value_column);
            break;
    }
    throw StatcubeException(ErrorCode::UNSUPPORTED_OUTPUT_FORMAT,
                            collection ? "collections write to jsonstat or table_list"
                                       : "datasets and dimensions write to jsonstat or table",
                            document_class_name(doc.document_class()));
}

Output write(const Document& doc, const std::string& format, const Fetcher& fetcher, Logger& logger,
             const CodecConfig& codec) {
    return write(doc, parse_output_format(format), fetcher, logger, codec);
}

} // namespace statcube
