#include "Lexer.h"
#include "AssembleError.h"
#include <cctype>
#include <sstream>
#include <utility>

static bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::vector<Token> tokenizeLine(const std::string& line, size_t lineNum) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if (c == ' ' || c == '\t' || c == '\r') { ++i; continue; }
        if (c == ';') break; // comentario hasta fin de linea

        size_t start = i;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) ++i;
            if (i < line.size() && isIdentChar(line[i])) {
                throw AssembleError(AssembleError::Kind::SYNTAX, lineNum,
                                    "malformed number at column " + std::to_string(start + 1));
            }
            tokens.push_back({Token::Kind::NUMBER, line.substr(start, i - start), start + 1});
        } else if (isIdentStart(c)) {
            while (i < line.size() && isIdentChar(line[i])) ++i;
            tokens.push_back({Token::Kind::WORD, line.substr(start, i - start), start + 1});
        } else if (c == '@') {
            ++i;
            if (i >= line.size() || !isIdentStart(line[i])) {
                throw AssembleError(AssembleError::Kind::SYNTAX, lineNum,
                                    "expected label after '@' at column " + std::to_string(start + 1));
            }
            while (i < line.size() && isIdentChar(line[i])) ++i;
            tokens.push_back({Token::Kind::POINTER, line.substr(start + 1, i - start - 1), start + 1});
        } else {
            throw AssembleError(AssembleError::Kind::SYNTAX, lineNum,
                                std::string("unexpected character '") + c + "' at column " + std::to_string(start + 1));
        }
    }
    return tokens;
}

std::vector<SourceLine> tokenize(const std::string& source) {
    std::vector<SourceLine> lines;
    std::istringstream in(source);
    std::string line;
    size_t lineNum = 0;
    while (std::getline(in, line)) {
        lineNum++;
        std::vector<Token> tokens = tokenizeLine(line, lineNum);
        if (tokens.empty()) continue;
        lines.push_back({lineNum, std::move(tokens)});
    }
    return lines;
}
