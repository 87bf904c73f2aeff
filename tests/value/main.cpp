#include <iostream>

#include "suites.hpp"

int main() {
    value_type_tests();
    value_writer_tests();
    map_key_tests();
    emitter_tests();
    value_reader_tests();
    identity_tests();
    std::cout << "all value tests passed" << std::endl;
    return 0;
}
