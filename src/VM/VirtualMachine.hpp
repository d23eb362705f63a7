#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../components/memory.h"
#include "../isa/Instruction.hpp"
#include "../utils/metrics.h"

enum class FaultReason {
    NONE,
    ADDRESS_OUT_OF_RANGE,   // direccion de datos o destino de salto >= CAPACITY (o negativa)
    POINTER_OUT_OF_RANGE,   // operando >= 2 * CAPACITY
    INDIRECTION_CYCLE       // cadena de punteros mas larga que MAX_INDIRECTION_DEPTH
};

const char* faultName(FaultReason reason);

struct StepResult {
    enum class Kind { ADVANCED, OUTPUT, INPUT_REQUIRED, HALTED, FAULT };

    Kind kind{Kind::ADVANCED};
    int64_t value{0};                     // solo OUTPUT
    FaultReason fault{FaultReason::NONE}; // solo FAULT

    static StepResult advanced() { return {Kind::ADVANCED, 0, FaultReason::NONE}; }
    static StepResult output(int64_t v) { return {Kind::OUTPUT, v, FaultReason::NONE}; }
    static StepResult inputRequired() { return {Kind::INPUT_REQUIRED, 0, FaultReason::NONE}; }
    static StepResult halted() { return {Kind::HALTED, 0, FaultReason::NONE}; }
    static StepResult faulted(FaultReason r) { return {Kind::FAULT, 0, r}; }

    bool operator==(const StepResult& o) const {
        return kind == o.kind && value == o.value && fault == o.fault;
    }
    bool operator!=(const StepResult& o) const { return !(*this == o); }
};

class VmError : public std::runtime_error {
public:
    enum class Kind { COMPILE_FAILED, PROGRAM_TOO_LARGE };

    VmError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class VirtualMachine {
public:
    static constexpr size_t MAX_INDIRECTION_DEPTH = Memory::CAPACITY;

    enum class State { RUNNING, HALTED, FAULTED };

    explicit VirtualMachine(bool debug = false);

    // Non copyable (mutex)
    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    // Ensambla y carga; en caso de error no toca la memoria ni los registros
    void compile(const std::string& source);
    void loadProgram(const std::vector<Instruction>& prog);

    StepResult step();
    void input(int64_t value);

    // Solo tiene efecto en HALTED o FAULTED: restaura la imagen compilada
    void reset();

    size_t programCounter() const;
    int64_t accumulator() const;
    uint64_t cycles() const;
    bool halted() const;
    bool faulted() const;
    FaultReason fault() const;
    State state() const;
    bool awaitingInput() const;
    std::optional<int64_t> pendingInput() const;
    size_t lastAccessed() const;
    Memory::Image memory() const;
    Metrics metrics() const;

    void setDebug(bool debug) { m_debug = debug; }

private:
    // Resultado interno de resolver una direccion
    struct Resolved {
        size_t address{0};
        FaultReason fault{FaultReason::NONE};
    };

    Resolved resolve(int64_t operand);
    Resolved branchTarget(int64_t operand) const;
    StepResult execute(const Instruction& inst);
    StepResult raise(FaultReason reason);
    void resetRegisters();

    bool m_debug;
    Memory m_memory;
    Memory::Image m_image{};              // ultima imagen compilada (para reset)
    size_t m_pc{0};
    int64_t m_acc{0};
    uint64_t m_cycles{0};
    State m_state{State::RUNNING};
    FaultReason m_fault{FaultReason::NONE};
    std::optional<int64_t> m_pendingInput;
    size_t m_lastAccessed{0};
    Metrics m_metrics;
    mutable std::mutex m_mutex; // serializa el acceso del host
};
