#include "Parser.h"
#include "AssembleError.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

// Un identificador solo de mayusculas se toma como mnemonico, nunca como etiqueta
static bool isAllUppercase(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= 'A' && c <= 'Z';
    });
}

static int64_t parseNumber(const Token& tok, size_t lineNum) {
    try {
        return std::stoll(tok.text);
    } catch (const std::out_of_range&) {
        throw AssembleError(AssembleError::Kind::SYNTAX, lineNum, "number too large: " + tok.text);
    }
}

static Operand parseOperand(const Token& tok, size_t lineNum) {
    switch (tok.kind) {
        case Token::Kind::NUMBER:  return Operand::numeric(parseNumber(tok, lineNum));
        case Token::Kind::WORD:    return Operand::labelRef(tok.text);
        case Token::Kind::POINTER: return Operand::pointerRef(tok.text);
    }
    throw AssembleError(AssembleError::Kind::SYNTAX, lineNum, "invalid operand: " + tok.text);
}

static AstNode parseLine(const SourceLine& src) {
    const auto& toks = src.tokens;
    AstNode node;
    node.line = src.number;
    size_t idx = 0;

    if (toks.empty()) {
        throw AssembleError(AssembleError::Kind::SYNTAX, src.number, "empty line");
    }
    if (toks[idx].kind == Token::Kind::WORD && !isAllUppercase(toks[idx].text)) {
        node.label = toks[idx].text;
        idx++;
    }
    if (idx >= toks.size()) {
        throw AssembleError(AssembleError::Kind::SYNTAX, src.number, "expected instruction after label " + *node.label);
    }
    const Token& opTok = toks[idx++];
    if (opTok.kind != Token::Kind::WORD) {
        throw AssembleError(AssembleError::Kind::SYNTAX, src.number, "expected mnemonic, found " + opTok.text);
    }
    auto op = opcodeFromMnemonic(opTok.text);
    if (!op) {
        throw AssembleError(AssembleError::Kind::SYNTAX, src.number, "unknown mnemonic " + opTok.text);
    }
    node.instruction.op = *op;

    if (requiresOperand(*op)) {
        if (idx >= toks.size()) {
            throw AssembleError(AssembleError::Kind::SYNTAX, src.number, opTok.text + " requires an operand");
        }
        node.instruction.operand = parseOperand(toks[idx++], src.number);
    } else if (*op == OpCode::DAT) {
        // DAT solo acepta literales
        if (idx < toks.size() && toks[idx].kind == Token::Kind::NUMBER) {
            node.instruction.operand = Operand::numeric(parseNumber(toks[idx++], src.number));
        } else {
            node.instruction.operand = Operand::numeric(0);
        }
    } else {
        node.instruction.operand = Operand::numeric(0);
    }

    if (idx < toks.size()) {
        throw AssembleError(AssembleError::Kind::SYNTAX, src.number,
                            "unexpected '" + toks[idx].text + "' at column " + std::to_string(toks[idx].column));
    }
    return node;
}

std::vector<AstNode> parse(const std::vector<SourceLine>& lines) {
    std::vector<AstNode> ast;
    ast.reserve(lines.size());
    for (const auto& line : lines) {
        ast.push_back(parseLine(line));
    }
    return ast;
}
