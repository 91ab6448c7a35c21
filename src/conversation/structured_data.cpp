// =============================================================================
// Structured Data - Implementation
// =============================================================================

#include "loanvoice/conversation/structured_data.h"

namespace loanvoice {

bool merge_structured_fields(Json& fields, const Json& update, Error& error) {
    if (!update.is_object()) {
        error = make_error(ErrorKind::Protocol,
                           std::string("structured update is not an object (") +
                               update.type_name() + ")");
        return false;
    }
    if (!fields.is_object()) {
        fields = Json::object();
    }
    for (auto it = update.begin(); it != update.end(); ++it) {
        fields[it.key()] = it.value();
    }
    return true;
}

std::string format_field_value(const Json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "-";
    return value.dump();
}

std::vector<std::string> describe_fields(const Json& fields) {
    std::vector<std::string> lines;
    if (!fields.is_object()) return lines;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        lines.push_back(it.key() + ": " + format_field_value(it.value()));
    }
    return lines;
}

}  // namespace loanvoice
