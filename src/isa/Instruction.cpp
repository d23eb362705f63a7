#include "Instruction.hpp"
#include <array>
#include <utility>

namespace {

const std::array<std::pair<const char*, OpCode>, 16> MNEMONICS = {{
    {"ADD", OpCode::ADD}, {"SUB", OpCode::SUB}, {"STA", OpCode::STA},
    {"LDA", OpCode::LDA}, {"LDR", OpCode::LDR}, {"BRA", OpCode::BRA},
    {"BRZ", OpCode::BRZ}, {"BRP", OpCode::BRP}, {"BWN", OpCode::BWN},
    {"BWA", OpCode::BWA}, {"BWO", OpCode::BWO}, {"BWX", OpCode::BWX},
    {"INP", OpCode::INP}, {"OUT", OpCode::OUT}, {"HLT", OpCode::HLT},
    {"DAT", OpCode::DAT},
}};

}

bool requiresOperand(OpCode op) {
    switch (op) {
        case OpCode::ADD: case OpCode::SUB: case OpCode::STA: case OpCode::LDA:
        case OpCode::BRA: case OpCode::BRZ: case OpCode::BRP:
        case OpCode::BWA: case OpCode::BWO: case OpCode::BWX:
            return true;
        default:
            return false;
    }
}

const char* mnemonic(OpCode op) {
    for (const auto& entry : MNEMONICS) {
        if (entry.second == op) return entry.first;
    }
    return "???";
}

std::optional<OpCode> opcodeFromMnemonic(const std::string& text) {
    for (const auto& entry : MNEMONICS) {
        if (text == entry.first) return entry.second;
    }
    return std::nullopt;
}

std::string toString(const Instruction& inst) {
    std::string out = mnemonic(inst.op);
    if (requiresOperand(inst.op) || inst.op == OpCode::DAT) {
        out += " " + std::to_string(inst.operand);
    }
    return out;
}
