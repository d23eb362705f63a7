#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <utility>
#include <vector>
#include "VirtualMachine.hpp"

struct RunReport {
    enum class StopReason { HALTED, FAULT, INPUT_EXHAUSTED, CYCLE_LIMIT };

    StopReason reason{StopReason::HALTED};
    FaultReason fault{FaultReason::NONE};
    std::vector<int64_t> outputs;
    uint64_t steps{0};            // ciclos que corrieron en esta llamada a run()
    size_t inputsConsumed{0};
};

const char* stopReasonName(RunReport::StopReason reason);

// Bucle del host: avanza la VM, le entrega la entrada encolada y junta las salidas.
class ProgramRunner {
public:
    static constexpr uint64_t DEFAULT_MAX_CYCLES = 100000;

    using OutputCallback = std::function<void(int64_t)>;

    explicit ProgramRunner(VirtualMachine& vm, bool debug = false);

    void queueInput(int64_t value);
    void queueInputs(const std::vector<int64_t>& values);
    size_t pendingInputs() const { return m_inputs.size(); }

    // Se llama por cada OUT, ademas de guardarlo en el reporte
    void onOutput(OutputCallback cb) { m_onOutput = std::move(cb); }

    // Se detiene en HALTED, FAULT, INP sin entrada en cola o al llegar a maxSteps
    RunReport run(uint64_t maxSteps = DEFAULT_MAX_CYCLES);

private:
    VirtualMachine& m_vm;
    bool m_debug;
    std::deque<int64_t> m_inputs;
    OutputCallback m_onOutput;
};
