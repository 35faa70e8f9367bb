#ifndef MEMSCHED_CONSOLE_H_
#define MEMSCHED_CONSOLE_H_

namespace memsched {

void console_prompt();

}  // namespace memsched

#endif
