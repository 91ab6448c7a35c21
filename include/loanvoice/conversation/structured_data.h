/**
 * @file structured_data.h
 * @brief LoanVoice - Structured data accumulator
 *
 * Facts extracted by the backend (name, income, credit score, ...) arrive as
 * flat objects and are shallow-merged; later keys overwrite earlier ones.
 */

#ifndef LOANVOICE_CONVERSATION_STRUCTURED_DATA_H
#define LOANVOICE_CONVERSATION_STRUCTURED_DATA_H

#include <string>
#include <vector>

#include "loanvoice/core/error.h"
#include "loanvoice/protocol/control_message.h"

namespace loanvoice {

/**
 * @brief Shallow-merge `update` into `fields`.
 * @return false with a Protocol error if `update` is not an object
 */
bool merge_structured_fields(Json& fields, const Json& update, Error& error);

// Display form of one field value ("Anil", "5000", "true")
std::string format_field_value(const Json& value);

// "key: value" lines in key order
std::vector<std::string> describe_fields(const Json& fields);

}  // namespace loanvoice

#endif  // LOANVOICE_CONVERSATION_STRUCTURED_DATA_H
