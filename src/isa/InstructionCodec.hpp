#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "Instruction.hpp"

// Cada opcode con operando ocupa una banda [base, base + BAND_WIDTH).
// Un operando fuera de [0, BAND_WIDTH) no se puede codificar.
constexpr int64_t BAND_WIDTH = 1000;

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(int64_t value)
        : std::runtime_error("Unknown opcode value: " + std::to_string(value)), value_(value) {}

    int64_t value() const { return value_; }

private:
    int64_t value_;
};

// DAT se escribe tal cual (payload). Lanza std::out_of_range si el
// operando no cabe en la banda.
int64_t encode(const Instruction& inst);

// Nunca devuelve DAT
std::optional<Instruction> tryDecode(int64_t word);
Instruction decode(int64_t word);

// Valor base de la banda (o codigo fijo) de cada opcode; DAT no tiene
int64_t opcodeBase(OpCode op);
