#include <stackerror/adapters/from_http.hpp>

namespace stackerror::adapters {

std::string format_http_status(uint16_t status) {
    std::string text = std::to_string(status);
    text += ' ';
    const std::string_view reason = http_reason_phrase(status);
    if (reason.empty()) {
        text += "<unknown status code>";
    } else {
        text += reason;
    }
    return text;
}

StackError from_http_status(uint16_t status) {
    auto error = StackError::from_msg(format_http_status(status));
    if (auto code = code_from_http(status)) {
        return std::move(error).with_err_code(*code);
    }
    return error;
}

}  // namespace stackerror::adapters
