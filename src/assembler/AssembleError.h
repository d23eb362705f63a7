#ifndef ASSEMBLE_ERROR_H
#define ASSEMBLE_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

class AssembleError : public std::runtime_error {
public:
    enum class Kind { SYNTAX, UNKNOWN_LABEL };

    AssembleError(Kind kind, size_t line, const std::string& message, const std::string& label = {})
        : std::runtime_error("line " + std::to_string(line) + ": " + message),
          kind_(kind), line_(line), label_(label) {}

    Kind kind() const { return kind_; }
    size_t line() const { return line_; }        // 1-based
    const std::string& label() const { return label_; }

private:
    Kind kind_;
    size_t line_;
    std::string label_;
};

#endif // ASSEMBLE_ERROR_H
