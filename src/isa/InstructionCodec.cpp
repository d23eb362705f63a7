#include "InstructionCodec.hpp"
#include <array>

namespace {

struct Band { int64_t base; OpCode op; };

// Codigos fijos: se comparan primero
const std::array<Band, 5> FIXED_CODES = {{
    {1, OpCode::HLT},
    {901, OpCode::INP},
    {902, OpCode::OUT},
    {4000, OpCode::LDR},
    {10000, OpCode::BWN},
}};

// Bandas en orden ascendente
const std::array<Band, 10> BANDS = {{
    {1000, OpCode::ADD},
    {2000, OpCode::SUB},
    {3000, OpCode::STA},
    {5000, OpCode::LDA},
    {6000, OpCode::BRA},
    {7000, OpCode::BRZ},
    {8000, OpCode::BRP},
    {11000, OpCode::BWA},
    {12000, OpCode::BWO},
    {13000, OpCode::BWX},
}};

}

int64_t opcodeBase(OpCode op) {
    for (const auto& f : FIXED_CODES) if (f.op == op) return f.base;
    for (const auto& b : BANDS) if (b.op == op) return b.base;
    throw std::invalid_argument("opcodeBase: DAT has no encoding");
}

int64_t encode(const Instruction& inst) {
    if (inst.op == OpCode::DAT) return inst.operand;

    int64_t base = opcodeBase(inst.op);
    if (!requiresOperand(inst.op)) return base;

    if (inst.operand < 0 || inst.operand >= BAND_WIDTH) {
        throw std::out_of_range("encode: operand " + std::to_string(inst.operand)
                                + " of " + mnemonic(inst.op) + " does not fit in its band");
    }
    return base + inst.operand;
}

std::optional<Instruction> tryDecode(int64_t word) {
    for (const auto& f : FIXED_CODES) {
        if (word == f.base) return Instruction{f.op, 0};
    }
    for (const auto& b : BANDS) {
        if (word >= b.base && word < b.base + BAND_WIDTH) return Instruction{b.op, word - b.base};
    }
    return std::nullopt;
}

Instruction decode(int64_t word) {
    auto inst = tryDecode(word);
    if (!inst) throw DecodeError(word);
    return *inst;
}
