#include "memory.h"
#include <stdexcept>
#include <iomanip>

Memory::Memory() {
    clear();
}

MemoryCell Memory::read(size_t address) const {
    if (address >= CAPACITY) throw std::out_of_range("Memory::read: address out of range");
    return cells_[address];
}

void Memory::write(size_t address, MemoryCell value) {
    if (address >= CAPACITY) throw std::out_of_range("Memory::write: address out of range");
    cells_[address] = value;
}

void Memory::load(const Image& image) {
    cells_ = image;
}

void Memory::clear() {
    cells_.fill(0);
}

void Memory::dump(std::ostream& os, size_t pc, size_t from, size_t to) const {
    if (to > CAPACITY) to = CAPACITY;
    for (size_t addr = from; addr < to; ++addr) {
        os << (addr == pc ? ">> " : "   ")
           << std::setw(3) << std::setfill('0') << addr << std::setfill(' ')
           << ": " << cells_[addr] << "\n";
    }
}
