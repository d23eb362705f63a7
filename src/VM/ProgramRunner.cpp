#include "ProgramRunner.hpp"
#include <iostream>

const char* stopReasonName(RunReport::StopReason reason) {
    switch (reason) {
        case RunReport::StopReason::HALTED: return "HALTED";
        case RunReport::StopReason::FAULT: return "FAULT";
        case RunReport::StopReason::INPUT_EXHAUSTED: return "INPUT_EXHAUSTED";
        case RunReport::StopReason::CYCLE_LIMIT: return "CYCLE_LIMIT";
    }
    return "UNKNOWN";
}

ProgramRunner::ProgramRunner(VirtualMachine& vm, bool debug) : m_vm(vm), m_debug(debug) {}

void ProgramRunner::queueInput(int64_t value) {
    m_inputs.push_back(value);
}

void ProgramRunner::queueInputs(const std::vector<int64_t>& values) {
    for (int64_t v : values) m_inputs.push_back(v);
}

RunReport ProgramRunner::run(uint64_t maxSteps) {
    RunReport report;
    while (true) {
        if (report.steps >= maxSteps) {
            report.reason = RunReport::StopReason::CYCLE_LIMIT;
            if (m_debug) std::cout << "[LMC] Limite de " << maxSteps << " pasos alcanzado\n";
            break;
        }

        uint64_t cyclesBefore = m_vm.cycles();
        StepResult res = m_vm.step();
        if (res.kind == StepResult::Kind::INPUT_REQUIRED) {
            if (m_inputs.empty()) {
                report.reason = RunReport::StopReason::INPUT_EXHAUSTED;
                if (m_debug) std::cout << "[LMC] La VM pide entrada y no queda ninguna en cola\n";
                break;
            }
            int64_t value = m_inputs.front();
            m_inputs.pop_front();
            if (m_debug) std::cout << "[LMC] Entrada -> " << value << "\n";
            m_vm.input(value);
            report.inputsConsumed++;
            continue;
        }

        // Una VM ya detenida responde sin ejecutar ningun ciclo
        if (m_vm.cycles() != cyclesBefore) report.steps++;
        if (res.kind == StepResult::Kind::OUTPUT) {
            report.outputs.push_back(res.value);
            if (m_onOutput) m_onOutput(res.value);
        } else if (res.kind == StepResult::Kind::HALTED) {
            report.reason = RunReport::StopReason::HALTED;
            break;
        } else if (res.kind == StepResult::Kind::FAULT) {
            report.reason = RunReport::StopReason::FAULT;
            report.fault = res.fault;
            break;
        }
    }
    return report;
}
