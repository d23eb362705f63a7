#ifndef PARSER_H
#define PARSER_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "Lexer.h"
#include "../isa/Instruction.hpp"

// Un nodo por linea no vacia; su posicion en el vector es su direccion
struct AstNode {
    std::optional<std::string> label;
    SymbolicInstruction instruction;
    size_t line;   // linea de origen (1-based) para mensajes de error
};

// Formato soportado:
//  [etiqueta] MNEMONICO [operando]
//  etiqueta: identificador que NO es todo mayusculas (loop, v0, Count)
//  operando: 42 | etiqueta | @etiqueta
//  DAT [n]  (n por defecto 0)
std::vector<AstNode> parse(const std::vector<SourceLine>& lines);

#endif // PARSER_H
