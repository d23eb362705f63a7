#ifndef LABEL_RESOLVER_H
#define LABEL_RESOLVER_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "Parser.h"
#include "../components/memory.h"

using LabelTable = std::unordered_map<std::string, size_t>;

// Primera pasada: etiqueta -> direccion (indice del nodo)
// Una etiqueta repetida se queda con su ultima direccion
LabelTable collectLabels(const std::vector<AstNode>& ast);

// Segunda pasada: etiqueta -> direccion, @etiqueta -> direccion + capacity
std::vector<Instruction> resolveLabels(const std::vector<AstNode>& ast,
                                       size_t capacity = Memory::CAPACITY);

#endif // LABEL_RESOLVER_H
