#ifndef ASSEMBLER_H
#define ASSEMBLER_H

#include <string>
#include <vector>
#include "AssembleError.h"
#include "../isa/Instruction.hpp"

// Texto fuente -> programa resuelto (una instruccion por direccion).
// Lanza AssembleError; no tiene efectos secundarios.
std::vector<Instruction> assemble(const std::string& source);

#endif // ASSEMBLER_H
