#include "main/main_processor.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
  MainProcessor processor(std::cin, std::cout);
  return processor.main(argc, argv);
}
