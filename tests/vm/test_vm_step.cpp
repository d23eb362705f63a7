#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "VM/VirtualMachine.hpp"

// Avanza hasta un estado terminal; devuelve las salidas
static std::vector<int64_t> runToEnd(VirtualMachine& vm, size_t maxSteps = 10000) {
  std::vector<int64_t> out;
  for (size_t i = 0; i < maxSteps; ++i) {
    StepResult r = vm.step();
    if (r.kind == StepResult::Kind::OUTPUT) out.push_back(r.value);
    if (r.kind == StepResult::Kind::HALTED || r.kind == StepResult::Kind::FAULT) return out;
    assert(r.kind != StepResult::Kind::INPUT_REQUIRED);
  }
  assert(false && "program did not stop");
  return out;
}

static void test_suspend_resume() {
  VirtualMachine vm;
  vm.compile("INP\nOUT\nHLT\n");

  // Sin entrada: se repite INPUT_REQUIRED sin cambiar el estado
  for (int i = 0; i < 3; ++i) {
    assert(vm.step() == StepResult::inputRequired());
    assert(vm.programCounter() == 0);
    assert(vm.cycles() == 0);
    assert(vm.accumulator() == 0);
  }
  assert(vm.awaitingInput());

  vm.input(42);
  assert(vm.pendingInput() == 42);
  assert(!vm.awaitingInput());
  assert(vm.step() == StepResult::advanced());
  assert(vm.accumulator() == 42);
  assert(vm.programCounter() == 1);
  assert(vm.cycles() == 1);
  assert(!vm.pendingInput().has_value());

  assert(vm.step() == StepResult::output(42));
  assert(vm.step() == StepResult::halted());
  assert(vm.cycles() == 3);
  assert(vm.halted());
  assert(vm.programCounter() == 2);   // PC queda sobre el HLT

  // Idempotente una vez detenida
  for (int i = 0; i < 5; ++i) {
    assert(vm.step() == StepResult::halted());
  }
  assert(vm.cycles() == 3);
}

static void test_input_overwrite() {
  VirtualMachine vm;
  vm.compile("INP\nINP\nHLT\n");
  vm.input(1);
  vm.input(2);          // reemplaza el valor no consumido
  assert(vm.step() == StepResult::advanced());
  assert(vm.accumulator() == 2);
  // Solo se guarda un valor: el segundo INP vuelve a pedir
  assert(vm.step() == StepResult::inputRequired());
  assert(vm.programCounter() == 1);
}

static void test_decode_skip_and_end_of_memory() {
  VirtualMachine vm;
  vm.loadProgram({{OpCode::DAT, 0}, {OpCode::DAT, 4001}, {OpCode::HLT, 0}});
  assert(vm.step() == StepResult::advanced());
  assert(vm.programCounter() == 1);
  assert(vm.step() == StepResult::advanced());
  assert(vm.step() == StepResult::halted());
  assert(vm.metrics().skipped == 2);
  assert(vm.cycles() == 3);

  // Memoria vacia: salta las 100 celdas y se detiene al salir de la memoria
  VirtualMachine empty;
  empty.compile("DAT 0");
  for (size_t i = 0; i < Memory::CAPACITY; ++i) {
    assert(empty.step() == StepResult::advanced());
  }
  assert(empty.programCounter() == Memory::CAPACITY);
  assert(empty.step() == StepResult::halted());
  assert(empty.cycles() == Memory::CAPACITY + 1);
  assert(empty.step() == StepResult::halted());
  assert(empty.cycles() == Memory::CAPACITY + 1);
}

static void test_arithmetic_and_bitwise() {
  VirtualMachine vm;
  vm.compile(
      "LDA a\n"
      "BWA b\n"
      "STA r1\n"
      "LDA a\n"
      "BWO b\n"
      "STA r2\n"
      "LDA a\n"
      "BWX b\n"
      "STA r3\n"
      "BWN\n"
      "HLT\n"
      "a  DAT 12\n"
      "b  DAT 10\n"
      "r1 DAT\n"
      "r2 DAT\n"
      "r3 DAT\n");
  runToEnd(vm);
  Memory::Image mem = vm.memory();
  assert(mem[13] == 8);
  assert(mem[14] == 14);
  assert(mem[15] == 6);
  assert(vm.accumulator() == -7);
  assert(vm.metrics().memory_writes == 3);

  // Desbordamiento en complemento a dos, sin trap
  VirtualMachine wrap;
  wrap.loadProgram({{OpCode::LDA, 3}, {OpCode::ADD, 4}, {OpCode::HLT, 0},
                    {OpCode::DAT, std::numeric_limits<int64_t>::max()}, {OpCode::DAT, 1}});
  runToEnd(wrap);
  assert(wrap.accumulator() == std::numeric_limits<int64_t>::min());

  VirtualMachine sub;
  sub.compile("LDA a\nSUB b\nHLT\na DAT 3\nb DAT 10\n");
  runToEnd(sub);
  assert(sub.accumulator() == -7);
}

static void test_branches() {
  VirtualMachine vm;
  vm.compile(
      "      LDA zero\n"
      "      BRP pos\n"     // cero cuenta como positivo
      "      HLT\n"
      "pos   SUB one\n"
      "      BRP bad\n"
      "      BRZ bad\n"
      "      OUT\n"
      "      HLT\n"
      "bad   OUT\n"
      "      HLT\n"
      "zero  DAT 0\n"
      "one   DAT 1\n");
  std::vector<int64_t> out = runToEnd(vm);
  assert(out.size() == 1);
  assert(out[0] == -1);
  assert(vm.halted());

  VirtualMachine loop;
  loop.compile("BRA 2\nHLT\nLDA one\nBRZ 0\nOUT\nHLT\none DAT 1\n");
  out = runToEnd(loop);
  assert(out.size() == 1 && out[0] == 1);
}

static void test_indirection() {
  VirtualMachine vm;
  vm.compile(
      "     LDA @p1\n"
      "     HLT\n"
      "p1   DAT 103\n"    // -> celda 3
      "p2   DAT 104\n"    // -> celda 4
      "p3   DAT 5\n"      // direccion directa
      "val  DAT 77\n");
  assert(vm.step() == StepResult::advanced());
  assert(vm.accumulator() == 77);
  assert(vm.lastAccessed() == 5);
  assert(vm.metrics().indirections == 3);

  // Cadena de profundidad k == k busquedas manuales
  const size_t base = 10;
  const size_t target = 50;
  for (size_t k = 1; k <= 8; ++k) {
    std::vector<Instruction> prog(target + 1, Instruction{OpCode::DAT, 0});
    prog[0] = {OpCode::LDA, static_cast<int64_t>(Memory::CAPACITY + base)};
    prog[1] = {OpCode::HLT, 0};
    for (size_t i = 0; i < k; ++i) {
      bool last = (i + 1 == k);
      prog[base + i] = {OpCode::DAT, static_cast<int64_t>(last ? target : Memory::CAPACITY + base + i + 1)};
    }
    prog[target] = {OpCode::DAT, 1234 + static_cast<int64_t>(k)};

    VirtualMachine chain;
    chain.loadProgram(prog);

    int64_t addr = static_cast<int64_t>(Memory::CAPACITY + base);
    size_t hops = 0;
    Memory::Image mem = chain.memory();
    while (addr > static_cast<int64_t>(Memory::CAPACITY)) {
      addr = mem[addr - Memory::CAPACITY];
      hops++;
    }
    assert(hops == k);

    assert(chain.step() == StepResult::advanced());
    assert(chain.lastAccessed() == static_cast<size_t>(addr));
    assert(chain.accumulator() == mem[addr]);
    assert(chain.metrics().indirections == k);
  }

  // Escritura a traves de puntero
  VirtualMachine store;
  store.compile("LDA v\nSTA @p\nHLT\np DAT 20\nv DAT 9\n");
  runToEnd(store);
  assert(store.memory()[20] == 9);
  assert(store.memory()[3] == 20);

  // LDR: el acumulador es el puntero
  VirtualMachine ldr;
  ldr.compile("LDA ptr\nLDR\nHLT\nptr DAT 4\nval DAT 9\n");
  assert(ldr.step() == StepResult::advanced());
  assert(ldr.step() == StepResult::advanced());
  assert(ldr.accumulator() == 9);
  assert(ldr.lastAccessed() == 4);
  // El fetch del HLT vuelve a marcar el PC
  assert(ldr.step() == StepResult::halted());
  assert(ldr.lastAccessed() == 2);
}

static void test_self_modifying() {
  VirtualMachine vm;
  vm.compile("LDA instr\nSTA 2\nHLT\nHLT\ninstr DAT 902\n");
  std::vector<int64_t> out = runToEnd(vm);
  assert(out.size() == 1 && out[0] == 902);
  assert(vm.programCounter() == 3);
}

int main() {
  test_suspend_resume();
  test_input_overwrite();
  test_decode_skip_and_end_of_memory();
  test_arithmetic_and_bitwise();
  test_branches();
  test_indirection();
  test_self_modifying();
  std::puts("OK vm step test");
  return 0;
}
