#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>

#include "components/memory.h"

int main() {
  Memory mem;
  for (size_t a = 0; a < Memory::CAPACITY; ++a) assert(mem.read(a) == 0);

  mem.write(0, -5);
  mem.write(Memory::CAPACITY - 1, 1234567890123LL);
  assert(mem.read(0) == -5);
  assert(mem.read(Memory::CAPACITY - 1) == 1234567890123LL);

  bool threw = false;
  try { mem.read(Memory::CAPACITY); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
  threw = false;
  try { mem.write(Memory::CAPACITY, 1); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);

  assert(Memory::in_range(0));
  assert(Memory::in_range(99));
  assert(!Memory::in_range(100));
  assert(!Memory::in_range(-1));

  // load / snapshot
  Memory::Image img{};
  img[7] = 42;
  mem.load(img);
  assert(mem.snapshot()[7] == 42);
  assert(mem.read(0) == 0);

  // dump marca el PC
  std::ostringstream os;
  mem.dump(os, 7, 6, 8);
  assert(os.str() == "   006: 0\n>> 007: 42\n");

  mem.clear();
  assert(mem.read(7) == 0);

  std::puts("OK memory test");
  return 0;
}
