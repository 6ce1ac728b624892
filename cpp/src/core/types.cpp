#include "statcube/types.hpp"
#include "statcube/error.hpp"

namespace statcube {

Naming parse_naming(const std::string& naming) {
    if (naming == "label") return Naming::Label;
    if (naming == "id") return Naming::Id;
    STATCUBE_THROW(ErrorCode::INVALID_NAMING_MODE,
                   "naming must be \"label\" or \"id\"", naming);
}

const char* naming_name(Naming naming) noexcept {
    return naming == Naming::Label ? "label" : "id";
}

Version parse_version(const std::string& version) {
    if (version == "1.3") return Version::V1_3;
    if (version == "2.0") return Version::V2_0;
    STATCUBE_THROW(ErrorCode::UNSUPPORTED_VERSION,
                   "version must be \"1.3\" or \"2.0\"", version);
}

const char* version_string(Version version) noexcept {
    return version == Version::V2_0 ? "2.0" : "1.3";
}

OutputFormat parse_output_format(const std::string& format) {
    if (format == "jsonstat" || format == "json") return OutputFormat::JsonText;
    if (format == "table" || format == "dataframe") return OutputFormat::Table;
    if (format == "table_list" || format == "dataframe_list") return OutputFormat::TableList;
    STATCUBE_THROW(ErrorCode::UNSUPPORTED_OUTPUT_FORMAT,
                   "allowed outputs are jsonstat, table or table_list", format);
}

} // namespace statcube
