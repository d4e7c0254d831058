#include <iostream>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

#include <stackerror/adapters/from_http.hpp>
#include <stackerror/adapters/from_io.hpp>
#include <stackerror/derive.hpp>
#include <stackerror/message.hpp>
#include <stackerror/report.hpp>
#include <stackerror/result.hpp>
#include <stackerror/result_ext.hpp>

using namespace stackerror;

// Library-specific error type, behaves exactly like StackError
struct StoreError : DeriveStackError<StoreError> {
    StackError inner;
};

template<typename T>
using StoreResult = Result<T, StoreError>;

StoreResult<std::string> read_document(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return StoreError{{}, adapters::from_error_code(ec)}
            .stack_err(STACKERROR_MSG("cannot open " << path));
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

StoreResult<size_t> count_words(const std::string& path) {
    STACKERROR_TRY_ASSIGN(auto content, read_document(path).stack_err("while counting words"));

    size_t words = 0;
    bool in_word = false;
    for (char c : content) {
        bool space = c == ' ' || c == '\n' || c == '\t';
        if (!space && !in_word) {
            ++words;
        }
        in_word = !space;
    }
    return words;
}

Result<void> publish(uint16_t upstream_status) {
    if (upstream_status >= 400) {
        return adapters::from_http_status(upstream_status)
            .stack_err("upstream rejected the document")
            .with_err_uri("https://status.example.com/publish");
    }
    return ok();
}

int main() {
    std::cout << "=== stackerror Basic Stacking Example ===" << std::endl;

    debug::init_logging(debug::LogLevel::INFO);

    // A chain built by hand
    auto base = StackError::from_msg("Base error")
                    .with_err_code(ErrorCode::IO_INVALID_INPUT)
                    .with_err_uri("https://example.com/base")
                    .stack_err("Stacked error");
    std::cout << "\nHand-built chain:\n" << base << std::endl;
    std::cout << "code: " << *base.err_code() << ", uri: " << *base.err_uri() << std::endl;

    // A wrapper type carried through Result
    auto words = count_words("/nonexistent/document.txt");
    if (words.is_error()) {
        std::cout << "\nWrapped chain (" << words.error().depth() << " nodes):\n"
                  << words.error() << std::endl;
    }

    // Logging a chain at a boundary
    ReportConfig config;
    config.numbered = true;
    auto published = publish(503);
    if (published.is_error()) {
        report(published.error(), config);
    }

    // Converting into an exception at the outermost layer
    try {
        unwrap_or_throw(publish(404).stack_err("publish step failed"));
    } catch (const std::runtime_error& e) {
        std::cout << "\nCaught:\n" << e.what() << std::endl;
    }

    debug::shutdown_logging();
    return 0;
}
