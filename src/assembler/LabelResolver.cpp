#include "LabelResolver.h"
#include "AssembleError.h"

LabelTable collectLabels(const std::vector<AstNode>& ast) {
    LabelTable labelPos;
    for (size_t addr = 0; addr < ast.size(); ++addr) {
        const auto& node = ast[addr];
        if (!node.label) continue;
        labelPos[*node.label] = addr;   // si se repite, gana la ultima definicion
    }
    return labelPos;
}

std::vector<Instruction> resolveLabels(const std::vector<AstNode>& ast, size_t capacity) {
    LabelTable labelPos = collectLabels(ast);

    auto lookup = [&](const AstNode& node, const std::string& label) -> int64_t {
        auto it = labelPos.find(label);
        if (it == labelPos.end()) {
            throw AssembleError(AssembleError::Kind::UNKNOWN_LABEL, node.line,
                                "unknown label: " + label, label);
        }
        return static_cast<int64_t>(it->second);
    };

    std::vector<Instruction> program;
    program.reserve(ast.size());
    for (const auto& node : ast) {
        const Operand& operand = node.instruction.operand;
        Instruction inst;
        inst.op = node.instruction.op;
        switch (operand.kind) {
            case Operand::Kind::NUMERIC:
                inst.operand = operand.value;
                break;
            case Operand::Kind::LABEL:
                inst.operand = lookup(node, operand.label);
                break;
            case Operand::Kind::POINTER:
                inst.operand = lookup(node, operand.label) + static_cast<int64_t>(capacity);
                break;
        }
        program.push_back(inst);
    }
    return program;
}
