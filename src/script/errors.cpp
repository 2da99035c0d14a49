#include "script/errors.hpp"

#include <sstream>

#include "script/operations.hpp"
#include "utils/common.hpp"

namespace codeact::script {

SyntaxRejection::SyntaxRejection(std::vector<std::string> errors)
    : std::runtime_error(utils::Join(errors, "\n")), errors_(std::move(errors)) {}

ScriptException::ScriptException(Value exception)
    : std::runtime_error(DescribeException(exception)), exception_(std::move(exception)) {}

std::string ScriptException::Describe() const {
    return what();
}

std::string ScriptException::Format() const {
    std::ostringstream oss;
    oss << "Traceback (most recent call last):\n";
    for (const auto& entry : trace_) {
        oss << "  File \"<user_code>\", line " << entry.line << ", in " << entry.where << "\n";
    }
    oss << Describe() << "\n";
    return oss.str();
}

}  // namespace codeact::script
