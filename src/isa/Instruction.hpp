#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

enum class OpCode { ADD, SUB, STA, LDA, LDR, BRA, BRZ, BRP,
    BWN, BWA, BWO, BWX, INP, OUT, HLT, DAT };

// Operando simbolico tal como sale del parser
struct Operand {
    enum class Kind { NUMERIC, LABEL, POINTER };

    Kind kind{Kind::NUMERIC};
    int64_t value{0};   // literal (solo NUMERIC)
    std::string label;  // nombre de la etiqueta sin '@' (LABEL/POINTER)

    static Operand numeric(int64_t n) { return {Kind::NUMERIC, n, {}}; }
    static Operand labelRef(const std::string& name) { return {Kind::LABEL, 0, name}; }
    static Operand pointerRef(const std::string& name) { return {Kind::POINTER, 0, name}; }

    bool operator==(const Operand& other) const {
        return kind == other.kind && value == other.value && label == other.label;
    }
    bool operator!=(const Operand& other) const { return !(*this == other); }
};

template <typename T>
struct BasicInstruction {
    OpCode op{OpCode::HLT};
    T operand{};   // sin uso en HLT/INP/OUT/BWN/LDR

    bool operator==(const BasicInstruction& other) const {
        return op == other.op && operand == other.operand;
    }
    bool operator!=(const BasicInstruction& other) const { return !(*this == other); }
};

using SymbolicInstruction = BasicInstruction<Operand>;
using Instruction = BasicInstruction<int64_t>;

// ADD SUB STA LDA BRA BRZ BRP BWA BWO BWX
bool requiresOperand(OpCode op);

const char* mnemonic(OpCode op);
std::optional<OpCode> opcodeFromMnemonic(const std::string& text);

// "LDA 17", "HLT", "DAT 5"
std::string toString(const Instruction& inst);
