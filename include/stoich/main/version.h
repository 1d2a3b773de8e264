#pragma once

namespace stoich::main {
/// Log the program banner and third party library versions
void print_header();
} // namespace stoich::main
