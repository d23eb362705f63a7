#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "VM/ProgramLoader.hpp"
#include "VM/ProgramRunner.hpp"
#include "VM/VirtualMachine.hpp"

int main() {
  std::string src = loadProgramFile(std::string(LMC_PROGRAMS_DIR) + "/countdown.lmc");
  assert(!src.empty());

  VirtualMachine vm;
  vm.compile(src);
  ProgramRunner runner(vm);
  runner.queueInput(3);
  RunReport report = runner.run();
  assert(report.reason == RunReport::StopReason::HALTED);
  assert((report.outputs == std::vector<int64_t>{3, 2, 1, 0}));
  assert(vm.halted());

  bool threw = false;
  try {
    loadProgramFile(std::string(LMC_PROGRAMS_DIR) + "/does_not_exist.lmc");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::puts("OK program loader test");
  return 0;
}
