#include <cassert>
#include <iostream>
#include <vector>

#include "working_set_window.hpp"

using namespace memsched;

void run_tests() {
    std::cout << "Starting working set window tests..." << std::endl;

    // Test 1: capacity 3, references 1 1 2 3 4
    WorkingSetWindow window(3);
    std::vector<uint32_t> refs = {1, 1, 2, 3, 4};
    std::vector<bool> faults;
    for (uint32_t page : refs) {
        faults.push_back(window.reference(page));
    }
    assert((faults == std::vector<bool>{true, false, true, true, true}));
    assert(window.size() == 3);
    assert(window.working_set_size() == 3);
    // Both references to page 1 have left the window.
    assert(!window.contains(1));
    assert(window.reference_count(1) == 0);
    assert(window.contains(2) && window.contains(3) && window.contains(4));
    std::cout << "Four faults, working set capped at 3." << std::endl;

    // Test 2: a page referenced twice stays resident until both leave.
    WorkingSetWindow repeat(3);
    repeat.reference(7);
    repeat.reference(7);
    repeat.reference(8);
    assert(repeat.reference_count(7) == 2);
    assert(repeat.reference(9));  // 9 is new, evicts the first 7
    assert(repeat.reference_count(7) == 1);
    assert(repeat.contains(7));
    assert(!repeat.reference(7));  // still resident through the second 7
    assert(repeat.reference_count(7) == 1);
    std::cout << "Reference counts decrement on eviction." << std::endl;

    // Test 3: capacity one faults on every change of page.
    WorkingSetWindow single(1);
    assert(single.reference(5));
    assert(!single.reference(5));
    assert(single.reference(6));
    assert(!single.contains(5));
    assert(single.working_set_size() == 1);

    // Test 4: zero capacity is coerced to one.
    WorkingSetWindow zero(0);
    assert(zero.capacity() == 1);
    std::cout << "Degenerate capacities verified." << std::endl;

    std::cout << "All tests passed!" << std::endl;
}

int main() {
    try {
        run_tests();
    } catch (const std::exception& e) {
        std::cerr << "An exception occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
