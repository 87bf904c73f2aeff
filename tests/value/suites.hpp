#pragma once

void value_type_tests();
void value_writer_tests();
void map_key_tests();
void emitter_tests();
void value_reader_tests();
void identity_tests();
