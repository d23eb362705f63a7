#ifndef MEMORY_H
#define MEMORY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>

using MemoryCell = int64_t;

class Memory {
public:
    static constexpr size_t CAPACITY = 100;   // 100 buzones de 64 bits (0..99)

    using Image = std::array<MemoryCell, CAPACITY>;

    Memory();

    // Lee una celda completa en 'address'
    MemoryCell read(size_t address) const;

    // Escribe una celda completa en 'address'
    void write(size_t address, MemoryCell value);

    // Reemplaza toda la memoria (carga de un programa compilado)
    void load(const Image& image);
    void clear();

    static bool in_range(int64_t address) {
        return address >= 0 && static_cast<uint64_t>(address) < CAPACITY;
    }

    const Image& snapshot() const { return cells_; }

    // Debug: imprime las celdas [from, to) marcando el PC con ">>"
    void dump(std::ostream& os, size_t pc, size_t from = 0, size_t to = CAPACITY) const;

private:
    Image cells_ = Image{0};
};

#endif // MEMORY_H
