#include "Assembler.h"
#include "Lexer.h"
#include "Parser.h"
#include "LabelResolver.h"

std::vector<Instruction> assemble(const std::string& source) {
    std::vector<SourceLine> lines = tokenize(source);
    std::vector<AstNode> ast = parse(lines);
    return resolveLabels(ast);
}
