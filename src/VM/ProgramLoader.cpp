#include "ProgramLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string loadProgramFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Could not open file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("Error reading file: " + path);
    return ss.str();
}
