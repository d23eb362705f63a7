#include "VirtualMachine.hpp"
#include "../assembler/Assembler.h"
#include "../isa/InstructionCodec.hpp"
#include <iostream>

// Aritmetica con desbordamiento en complemento a dos (sin UB)
static int64_t wrappingAdd(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

static int64_t wrappingSub(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

const char* faultName(FaultReason reason) {
    switch (reason) {
        case FaultReason::NONE: return "NONE";
        case FaultReason::ADDRESS_OUT_OF_RANGE: return "ADDRESS_OUT_OF_RANGE";
        case FaultReason::POINTER_OUT_OF_RANGE: return "POINTER_OUT_OF_RANGE";
        case FaultReason::INDIRECTION_CYCLE: return "INDIRECTION_CYCLE";
    }
    return "UNKNOWN";
}

VirtualMachine::VirtualMachine(bool debug) : m_debug(debug) {
    m_image.fill(0);
}

void VirtualMachine::compile(const std::string& source) {
    std::vector<Instruction> prog;
    try {
        prog = assemble(source);
    } catch (const AssembleError& e) {
        if (m_debug) std::cerr << "[ASM] Error: " << e.what() << "\n";
        throw VmError(VmError::Kind::COMPILE_FAILED, std::string("Could not compile the program: ") + e.what());
    }
    loadProgram(prog);
}

void VirtualMachine::loadProgram(const std::vector<Instruction>& prog) {
    if (prog.size() > Memory::CAPACITY) {
        throw VmError(VmError::Kind::PROGRAM_TOO_LARGE,
                      "Program has " + std::to_string(prog.size()) + " instructions, memory holds "
                      + std::to_string(Memory::CAPACITY));
    }

    // Se codifica en una imagen aparte: un fallo no deja la memoria a medias
    Memory::Image image{};
    image.fill(0);
    for (size_t addr = 0; addr < prog.size(); ++addr) {
        try {
            image[addr] = encode(prog[addr]);
        } catch (const std::out_of_range& e) {
            throw VmError(VmError::Kind::COMPILE_FAILED,
                          "address " + std::to_string(addr) + ": " + e.what());
        }
    }

    std::scoped_lock lock(m_mutex);
    m_memory.load(image);
    m_image = image;
    resetRegisters();
    if (m_debug) std::cout << "[VM] Programa cargado: " << prog.size() << " celdas\n";
}

StepResult VirtualMachine::step() {
    std::scoped_lock lock(m_mutex);

    if (m_state == State::HALTED) return StepResult::halted();
    if (m_state == State::FAULTED) return StepResult::faulted(m_fault);

    if (m_pc >= Memory::CAPACITY) {
        m_cycles++;
        m_state = State::HALTED;
        if (m_debug) std::cout << "[VM] PC fuera de memoria, detenido tras " << m_cycles << " ciclos\n";
        return StepResult::halted();
    }

    // Fetch
    MemoryCell word = m_memory.read(m_pc);
    m_lastAccessed = m_pc;

    // Decode
    auto decoded = tryDecode(word);
    if (!decoded) {
        m_cycles++;
        m_metrics.skipped++;
        if (m_debug) std::cout << "[VM] PC=" << m_pc << " valor " << word << " no decodificable, se salta\n";
        m_pc++;
        return StepResult::advanced();
    }
    if (decoded->op == OpCode::INP && !m_pendingInput) {
        return StepResult::inputRequired();
    }

    // Execute
    m_cycles++;
    m_metrics.instructions++;
    if (m_debug) std::cout << "[VM] ciclo " << m_cycles << " PC=" << m_pc << " " << toString(*decoded) << "\n";
    return execute(*decoded);
}

StepResult VirtualMachine::execute(const Instruction& inst) {
    switch (inst.op) {
        case OpCode::ADD:
        case OpCode::SUB:
        case OpCode::LDA:
        case OpCode::BWA:
        case OpCode::BWO:
        case OpCode::BWX: {
            Resolved r = resolve(inst.operand);
            if (r.fault != FaultReason::NONE) return raise(r.fault);
            int64_t val = m_memory.read(r.address);
            m_lastAccessed = r.address;
            m_metrics.memory_reads++;
            switch (inst.op) {
                case OpCode::ADD: m_acc = wrappingAdd(m_acc, val); break;
                case OpCode::SUB: m_acc = wrappingSub(m_acc, val); break;
                case OpCode::LDA: m_acc = val; break;
                case OpCode::BWA: m_acc &= val; break;
                case OpCode::BWO: m_acc |= val; break;
                default:          m_acc ^= val; break;
            }
            m_pc++;
            return StepResult::advanced();
        }
        case OpCode::STA: {
            Resolved r = resolve(inst.operand);
            if (r.fault != FaultReason::NONE) return raise(r.fault);
            m_memory.write(r.address, m_acc);
            m_lastAccessed = r.address;
            m_metrics.memory_writes++;
            m_pc++;
            return StepResult::advanced();
        }
        case OpCode::LDR: {
            // el acumulador hace de puntero
            Resolved r = resolve(m_acc);
            if (r.fault != FaultReason::NONE) return raise(r.fault);
            m_acc = m_memory.read(r.address);
            m_lastAccessed = r.address;
            m_metrics.memory_reads++;
            m_pc++;
            return StepResult::advanced();
        }
        case OpCode::BRA:
        case OpCode::BRZ:
        case OpCode::BRP: {
            bool taken = inst.op == OpCode::BRA
                      || (inst.op == OpCode::BRZ && m_acc == 0)
                      || (inst.op == OpCode::BRP && m_acc >= 0);
            if (!taken) { m_pc++; return StepResult::advanced(); }
            Resolved r = branchTarget(inst.operand);
            if (r.fault != FaultReason::NONE) return raise(r.fault);
            m_pc = r.address;
            return StepResult::advanced();
        }
        case OpCode::BWN: {
            m_acc = ~m_acc;
            m_pc++;
            return StepResult::advanced();
        }
        case OpCode::INP: {
            m_acc = *m_pendingInput;
            m_pendingInput.reset();
            m_metrics.inputs++;
            m_pc++;
            return StepResult::advanced();
        }
        case OpCode::OUT: {
            m_metrics.outputs++;
            if (m_debug) std::cout << "[VM] OUT " << m_acc << "\n";
            m_pc++;
            return StepResult::output(m_acc);
        }
        case OpCode::HLT: {
            m_state = State::HALTED;
            if (m_debug) std::cout << "[VM] HLT tras " << m_cycles << " ciclos\n";
            return StepResult::halted();
        }
        case OpCode::DAT:
            break;
    }
    throw std::logic_error("VirtualMachine::execute: DAT is never decoded");
}

VirtualMachine::Resolved VirtualMachine::resolve(int64_t operand) {
    const int64_t capacity = static_cast<int64_t>(Memory::CAPACITY);
    size_t depth = 0;
    while (true) {
        if (operand < 0) return {0, FaultReason::ADDRESS_OUT_OF_RANGE};
        if (operand >= 2 * capacity) return {0, FaultReason::POINTER_OUT_OF_RANGE};
        // CAPACITY + k: la direccion real esta guardada en la celda k
        if (operand <= capacity) break;
        if (depth++ >= MAX_INDIRECTION_DEPTH) return {0, FaultReason::INDIRECTION_CYCLE};
        m_metrics.indirections++;
        operand = m_memory.read(static_cast<size_t>(operand - capacity));
    }
    if (!Memory::in_range(operand)) return {0, FaultReason::ADDRESS_OUT_OF_RANGE};
    return {static_cast<size_t>(operand), FaultReason::NONE};
}

// Los saltos usan direcciones directas, sin indireccion
VirtualMachine::Resolved VirtualMachine::branchTarget(int64_t operand) const {
    if (!Memory::in_range(operand)) return {0, FaultReason::ADDRESS_OUT_OF_RANGE};
    return {static_cast<size_t>(operand), FaultReason::NONE};
}

StepResult VirtualMachine::raise(FaultReason reason) {
    m_state = State::FAULTED;
    m_fault = reason;
    if (m_debug) std::cerr << "[VM] Fault " << faultName(reason) << " en PC=" << m_pc << "\n";
    return StepResult::faulted(reason);
}

void VirtualMachine::input(int64_t value) {
    std::scoped_lock lock(m_mutex);
    m_pendingInput = value;
}

void VirtualMachine::reset() {
    std::scoped_lock lock(m_mutex);
    if (m_state == State::RUNNING) {
        if (m_debug) std::cout << "[VM] reset ignorado: la maquina sigue en ejecucion\n";
        return;
    }
    m_memory.load(m_image);
    resetRegisters();
}

void VirtualMachine::resetRegisters() {
    m_pc = 0;
    m_acc = 0;
    m_cycles = 0;
    m_state = State::RUNNING;
    m_fault = FaultReason::NONE;
    m_pendingInput.reset();
    m_lastAccessed = 0;
    m_metrics = Metrics{};
}

size_t VirtualMachine::programCounter() const {
    std::scoped_lock lock(m_mutex);
    return m_pc;
}

int64_t VirtualMachine::accumulator() const {
    std::scoped_lock lock(m_mutex);
    return m_acc;
}

uint64_t VirtualMachine::cycles() const {
    std::scoped_lock lock(m_mutex);
    return m_cycles;
}

bool VirtualMachine::halted() const {
    std::scoped_lock lock(m_mutex);
    return m_state == State::HALTED;
}

bool VirtualMachine::faulted() const {
    std::scoped_lock lock(m_mutex);
    return m_state == State::FAULTED;
}

FaultReason VirtualMachine::fault() const {
    std::scoped_lock lock(m_mutex);
    return m_fault;
}

VirtualMachine::State VirtualMachine::state() const {
    std::scoped_lock lock(m_mutex);
    return m_state;
}

bool VirtualMachine::awaitingInput() const {
    std::scoped_lock lock(m_mutex);
    if (m_state != State::RUNNING || m_pendingInput || m_pc >= Memory::CAPACITY) return false;
    auto decoded = tryDecode(m_memory.read(m_pc));
    return decoded && decoded->op == OpCode::INP;
}

std::optional<int64_t> VirtualMachine::pendingInput() const {
    std::scoped_lock lock(m_mutex);
    return m_pendingInput;
}

size_t VirtualMachine::lastAccessed() const {
    std::scoped_lock lock(m_mutex);
    return m_lastAccessed;
}

Memory::Image VirtualMachine::memory() const {
    std::scoped_lock lock(m_mutex);
    return m_memory.snapshot();
}

Metrics VirtualMachine::metrics() const {
    std::scoped_lock lock(m_mutex);
    return m_metrics;
}
