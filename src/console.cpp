#include "console.hpp"

#include <iostream>

namespace memsched {

void console_prompt() {
  std::cout << "memsched - memory-aware Round-Robin simulator\n"
            << "Commands: initialize [file], baseline, memory-aware, compare,\n"
            << "          report-util [file], process-smi, clear, exit\n"
            << std::endl;
}

}  // namespace memsched
