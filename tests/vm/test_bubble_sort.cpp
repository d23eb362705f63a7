#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cstdint>
#include <vector>

#include "VM/VirtualMachine.hpp"
#include "VM/ProgramRunner.hpp"
#include "VM/SamplePrograms.hpp"

static const std::vector<int64_t> UNSORTED = {32, 7, 19, 75, 21, 14, 95, 35, 61, 50};
static const std::vector<int64_t> SORTED = {7, 14, 19, 21, 32, 35, 50, 61, 75, 95};

// Bucle manual del host, sin ProgramRunner
static void test_manual_host_loop() {
  VirtualMachine vm;
  vm.compile(BUBBLE_SORT_INPUT_PROGRAM);

  std::vector<int64_t> outputs;
  size_t nextInput = 0;
  bool done = false;
  for (size_t guard = 0; guard < 100000 && !done; ++guard) {
    StepResult r = vm.step();
    switch (r.kind) {
      case StepResult::Kind::INPUT_REQUIRED:
        assert(nextInput < UNSORTED.size());
        vm.input(UNSORTED[nextInput++]);
        break;
      case StepResult::Kind::OUTPUT:
        outputs.push_back(r.value);
        break;
      case StepResult::Kind::HALTED:
        done = true;
        break;
      case StepResult::Kind::FAULT:
        assert(false && "unexpected fault");
        break;
      case StepResult::Kind::ADVANCED:
        break;
    }
  }
  assert(done);
  assert(nextInput == UNSORTED.size());
  assert(outputs == SORTED);
  assert(vm.step() == StepResult::halted());

  Memory::Image mem = vm.memory();
  for (size_t i = 0; i < SORTED.size(); ++i) {
    assert(mem[90 + i] == SORTED[i]);
  }
}

static void test_runner_with_table() {
  VirtualMachine vm;
  vm.compile(BUBBLE_SORT_PROGRAM);

  std::vector<int64_t> seen;
  ProgramRunner runner(vm);
  runner.onOutput([&seen](int64_t v) { seen.push_back(v); });
  RunReport report = runner.run();

  assert(report.reason == RunReport::StopReason::HALTED);
  assert(report.fault == FaultReason::NONE);
  assert(report.outputs == SORTED);
  assert(seen == SORTED);
  assert(report.inputsConsumed == 0);
  assert(report.steps == vm.cycles());
  assert(vm.metrics().outputs == SORTED.size());
  assert(vm.metrics().indirections > 0);
}

static void test_runner_stop_reasons() {
  // Limite de pasos
  VirtualMachine vm;
  vm.compile(BUBBLE_SORT_PROGRAM);
  ProgramRunner limited(vm);
  RunReport report = limited.run(50);
  assert(report.reason == RunReport::StopReason::CYCLE_LIMIT);
  assert(report.steps == 50);
  assert(vm.cycles() == 50);
  assert(!vm.halted());

  // Se puede continuar donde quedo
  report = limited.run();
  assert(report.reason == RunReport::StopReason::HALTED);
  assert(report.outputs == SORTED);

  // Sobre una VM ya detenida no se ejecuta nada
  uint64_t cyclesAtHalt = vm.cycles();
  report = limited.run();
  assert(report.reason == RunReport::StopReason::HALTED);
  assert(report.steps == 0);
  assert(report.outputs.empty());
  assert(vm.cycles() == cyclesAtHalt);

  // Entrada insuficiente: se detiene en el cuarto INP
  VirtualMachine in;
  in.compile(BUBBLE_SORT_INPUT_PROGRAM);
  ProgramRunner starved(in);
  starved.queueInputs({1, 2, 3});
  report = starved.run();
  assert(report.reason == RunReport::StopReason::INPUT_EXHAUSTED);
  assert(report.inputsConsumed == 3);
  assert(starved.pendingInputs() == 0);
  assert(in.awaitingInput());

  // Se completa la entrada y termina
  starved.queueInputs({9, 8, 7, 6, 5, 4, 0});
  report = starved.run();
  assert(report.reason == RunReport::StopReason::HALTED);
  assert(report.inputsConsumed == 7);
  assert((report.outputs == std::vector<int64_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));

  // Fault reportado por el runner
  VirtualMachine bad;
  bad.compile("LDA 250\n");
  ProgramRunner faulty(bad);
  report = faulty.run();
  assert(report.reason == RunReport::StopReason::FAULT);
  assert(report.fault == FaultReason::POINTER_OUT_OF_RANGE);
  assert(report.steps == 1);
  report = faulty.run();
  assert(report.reason == RunReport::StopReason::FAULT);
  assert(report.fault == FaultReason::POINTER_OUT_OF_RANGE);
  assert(report.steps == 0);
}

int main() {
  test_manual_host_loop();
  test_runner_with_table();
  test_runner_stop_reasons();
  std::puts("OK bubble sort test");
  return 0;
}
