#include "id_generator.hpp"
#include <chrono>

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {
  using namespace std::chrono;
  epoch_ = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string IdGenerator::next() {
  return prefix_ + "-" + std::to_string(++counter_) + "-" + std::to_string(epoch_);
}
