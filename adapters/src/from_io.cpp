#include <stackerror/adapters/from_io.hpp>

namespace stackerror::adapters {

namespace {

StackError classify(StackError error, const std::error_code& ec) {
    if (auto code = code_from_error_code(ec)) {
        return std::move(error).with_err_code(*code);
    }
    return error;
}

}  // anonymous namespace

StackError from_error_code(const std::error_code& ec) {
    return classify(StackError::from_msg(ec.message()), ec);
}

StackError from_system_error(const std::system_error& e) {
    return classify(StackError::from_msg(e), e.code());
}

}  // namespace stackerror::adapters
