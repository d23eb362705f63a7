#pragma once
#include <cstdint>
#include <iostream>

struct Metrics {
    uint64_t instructions = 0;    // ciclos que ejecutaron algo
    uint64_t skipped = 0;         // celdas no decodificables saltadas
    uint64_t memory_reads = 0;
    uint64_t memory_writes = 0;
    uint64_t indirections = 0;    // saltos @ seguidos
    uint64_t inputs = 0;
    uint64_t outputs = 0;

    void print(std::ostream& os = std::cout) const {
        os << "[VM] Instrucciones: " << instructions
           << " Saltadas: " << skipped
           << " Lecturas: " << memory_reads
           << " Escrituras: " << memory_writes
           << " Indirecciones: " << indirections
           << " Entradas: " << inputs
           << " Salidas: " << outputs << "\n";
    }
};
