#include "main/main_processor.hpp"

int main(int argc, char *argv[]) {
  MainProcessor processor;
  MainProcessor::Exit(processor.main(argc, argv));
}
