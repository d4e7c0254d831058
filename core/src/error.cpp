#include <stackerror/error.hpp>

#include <algorithm>
#include <sstream>

namespace stackerror {

// ============================================================================
// StackError Implementation
// ============================================================================

StackError::~StackError() {
    // Unlink iteratively so long chains do not recurse once per node
    std::unique_ptr<StackError> next = std::move(cause_);
    while (next) {
        next = std::move(next->cause_);
    }
}

StackError StackError::with_err_code(ErrorCode code) && {
    code_ = code;
    return std::move(*this);
}

StackError StackError::with_no_err_code() && {
    code_.reset();
    return std::move(*this);
}

StackError StackError::with_err_uri(std::string uri) && {
    uri_ = std::move(uri);
    return std::move(*this);
}

StackError StackError::with_no_err_uri() && {
    uri_.reset();
    return std::move(*this);
}

StackError StackError::with_no_err_msg() && {
    message_.reset();
    return std::move(*this);
}

StackError StackError::stack_err() && {
    return std::move(*this).push(nullptr);
}

StackError StackError::push(std::unique_ptr<const detail::MessagePayload> message) && {
    StackError top;
    top.message_ = std::move(message);
    top.code_ = code_;
    top.uri_ = uri_;
    top.cause_ = std::make_unique<StackError>(std::move(*this));
    return top;
}

size_t StackError::depth() const noexcept {
    size_t count = 0;
    for (const StackError* node = this; node != nullptr; node = node->cause()) {
        ++count;
    }
    return count;
}

void StackError::render_message(std::ostream& os) const {
    if (message_) {
        message_->render(os);
    }
}

std::string StackError::message_string() const {
    std::ostringstream oss;
    render_message(oss);
    return oss.str();
}

std::vector<std::string> StackError::messages() const {
    std::vector<std::string> result;
    result.reserve(depth());
    for (const StackError* node = this; node != nullptr; node = node->cause()) {
        result.push_back(node->message_string());
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::string StackError::to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const StackError& error) {
    std::vector<const StackError*> nodes;
    nodes.reserve(error.depth());
    for (const StackError* node = &error; node != nullptr; node = node->cause()) {
        nodes.push_back(node);
    }

    // Root first, newline between nodes, none before the first
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        if (it != nodes.rbegin()) {
            os << '\n';
        }
        (*it)->render_message(os);
    }
    return os;
}

}  // namespace stackerror
