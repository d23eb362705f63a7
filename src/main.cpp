#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include "assembler/Assembler.h"
#include "VM/VirtualMachine.hpp"
#include "VM/ProgramRunner.hpp"
#include "VM/ProgramLoader.hpp"
#include "VM/SamplePrograms.hpp"

struct RunnerOptions {
    bool debug = false;
    bool dump = false;
    bool listing = false;
    uint64_t maxCycles = ProgramRunner::DEFAULT_MAX_CYCLES;
    std::vector<int64_t> inputs;
    std::string programPath;   // vacio: programa de ejemplo
};

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--debug] [--dump] [--listing] [--max-cycles N]"
              << " [--inputs a,b,c] [program.lmc]\n"
              << "Sin programa se ejecuta el ordenamiento burbuja de ejemplo.\n";
}

static int64_t parseInt(const std::string& text, const std::string& what) {
    try {
        size_t used = 0;
        int64_t v = std::stoll(text, &used, 10);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("invalid " + what + ": '" + text + "'");
    } catch (const std::out_of_range&) {
        throw std::runtime_error(what + " out of range: '" + text + "'");
    }
}

static std::vector<int64_t> parseInputList(const std::string& list) {
    std::vector<int64_t> values;
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (item.empty()) continue;
        values.push_back(parseInt(item, "input"));
    }
    return values;
}

static RunnerOptions parseArgs(int argc, char* argv[]) {
    RunnerOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error(arg + " requires a value");
            return argv[++i];
        };
        if (arg == "--debug") opts.debug = true;
        else if (arg == "--dump") opts.dump = true;
        else if (arg == "--listing") opts.listing = true;
        else if (arg == "--max-cycles") {
            int64_t n = parseInt(next(), "--max-cycles");
            if (n <= 0) throw std::runtime_error("--max-cycles must be positive");
            opts.maxCycles = static_cast<uint64_t>(n);
        }
        else if (arg == "--inputs") {
            std::vector<int64_t> more = parseInputList(next());
            opts.inputs.insert(opts.inputs.end(), more.begin(), more.end());
        }
        else if (!arg.empty() && arg[0] == '-') throw std::runtime_error("unknown option " + arg);
        else if (opts.programPath.empty()) opts.programPath = arg;
        else throw std::runtime_error("only one program file is accepted");
    }
    return opts;
}

static void printListing(const std::string& source) {
    std::vector<Instruction> prog = assemble(source);
    std::cout << "==== Listado ====\n";
    for (size_t addr = 0; addr < prog.size(); ++addr) {
        std::cout << std::setw(3) << std::setfill('0') << addr << std::setfill(' ')
                  << "  " << toString(prog[addr]) << "\n";
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") { printUsage(argv[0]); return 0; }
    }

    try {
        RunnerOptions opts = parseArgs(argc, argv);

        std::string source = opts.programPath.empty() ? std::string(BUBBLE_SORT_PROGRAM)
                                                      : loadProgramFile(opts.programPath);
        if (opts.debug) {
            std::cout << "[LMC] Programa: " << (opts.programPath.empty() ? "<burbuja de ejemplo>" : opts.programPath)
                      << ", " << opts.inputs.size() << " entradas en cola\n";
        }
        if (opts.listing) printListing(source);

        VirtualMachine vm(opts.debug);
        vm.compile(source);

        ProgramRunner runner(vm, opts.debug);
        runner.queueInputs(opts.inputs);
        runner.onOutput([](int64_t v) { std::cout << v << "\n"; });
        RunReport report = runner.run(opts.maxCycles);

        if (opts.dump) {
            std::cout << "==== Memoria ====\n";
            Memory mem;
            mem.load(vm.memory());
            mem.dump(std::cout, vm.programCounter());
        }

        std::cerr << "[LMC] " << stopReasonName(report.reason);
        if (report.reason == RunReport::StopReason::FAULT) std::cerr << " (" << faultName(report.fault) << ")";
        std::cerr << " PC=" << vm.programCounter()
                  << " ACC=" << vm.accumulator()
                  << " ciclos=" << vm.cycles() << "\n";
        if (opts.debug) vm.metrics().print(std::cerr);

        return report.reason == RunReport::StopReason::HALTED ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[LMC] Error: " << e.what() << "\n";
        return 1;
    }
}
