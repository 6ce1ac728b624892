#include "statcube/collection.hpp"
#include "statcube/error.hpp"
#include "statcube/scalar.hpp"

namespace statcube {

namespace {

const boost::json::array& items_of(const boost::json::object& body) {
    if (const auto* link = body.if_contains("link")) {
        if (const auto* link_obj = link->if_object()) {
            if (const auto* items = link_obj->if_contains("item")) {
                if (const auto* list = items->if_array()) return *list;
            }
        }
    }
    throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "collection has no link.item list", "link");
}

std::string member_string(const boost::json::object& item, const char* key) {
    const auto* member = item.if_contains(key);
    return (member && !member->is_null()) ? coerce_to_str(*member) : std::string();
}

bool embeds_content(const boost::json::object& item, DocumentClass cls) {
    switch (cls) {
        case DocumentClass::Dataset:    return item.contains("value") && item.contains("dimension");
        case DocumentClass::Dimension:  return item.contains("category");
        case DocumentClass::Collection: return item.contains("link");
    }
    return false;
}

Document item_document(const boost::json::object& item, const Fetcher& fetcher) {
    const DocumentClass cls = parse_document_class(member_string(item, "class"));
    if (embeds_content(item, cls)) {
        return Document(cls, item);
    }

    const std::string href = member_string(item, "href");
    if (href.empty()) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "collection item has no href",
                                member_string(item, "label"));
    }
    return read(cls, fetcher.fetch(href));
}

void walk(const Document& collection, const Fetcher& fetcher, Logger& logger,
          Naming naming, const std::string& value_key, std::vector<Table>& out) {
    for (const auto& entry : items_of(collection.body())) {
        const auto& item = as_document(entry);
        const std::string cls = member_string(item, "class");

        if (cls != "dataset" && cls != "collection") {
            logger.debug("collection: skipping " + cls + " item " + member_string(item, "href"));
            continue;
        }

        logger.debug("collection: reading " + cls + " " + member_string(item, "href"));
        Document document = item_document(item, fetcher);
        if (document.document_class() == DocumentClass::Dataset) {
            out.push_back(write_table(document, naming, value_key));
        } else {
            walk(document, fetcher, logger, naming, value_key, out);
        }
    }
}

} // anonymous namespace

std::size_t collection_size(const Document& collection) {
    return items_of(collection.body()).size();
}

Document collection_item(const Document& collection, std::size_t element, const Fetcher& fetcher) {
    const auto& items = items_of(collection.body());
    if (element >= items.size()) {
        throw IndexOutOfRangeError("collection has " + std::to_string(items.size()) + " items",
                                   std::to_string(element));
    }
    return item_document(as_document(items[element]), fetcher);
}

std::vector<Table> write_tables(const Document& collection, const Fetcher& fetcher, Logger& logger,
                                Naming naming, const std::string& value_key) {
    if (collection.document_class() != DocumentClass::Collection) {
        throw StatcubeException(ErrorCode::UNSUPPORTED_OUTPUT_FORMAT,
                                "only collections write to a table list",
                                document_class_name(collection.document_class()));
    }

    std::vector<Table> tables;
    walk(collection, fetcher, logger, naming, value_key, tables);
    logger.info("collection: decoded " + std::to_string(tables.size()) + " datasets");
    return tables;
}

} // namespace statcube
