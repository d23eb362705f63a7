#ifndef LEXER_H
#define LEXER_H

#include <cstddef>
#include <string>
#include <vector>

struct Token {
    enum class Kind {
        WORD,     // [A-Za-z_][A-Za-z0-9_]*  (mnemonico, etiqueta o referencia)
        NUMBER,   // [0-9]+
        POINTER   // @[A-Za-z_][A-Za-z0-9_]*  (text sin '@')
    };

    Kind kind;
    std::string text;
    size_t column;   // 1-based
};

struct SourceLine {
    size_t number;   // 1-based, cuenta tambien lineas vacias
    std::vector<Token> tokens;
};

// Divide el programa en lineas de tokens. Las lineas vacias, con solo
// espacios o solo comentario (';') no aparecen en el resultado.
// Lanza AssembleError(SYNTAX) ante un caracter que no forma ningun token.
std::vector<SourceLine> tokenize(const std::string& source);

#endif // LEXER_H
