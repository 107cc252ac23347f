#pragma once
/*
 * IdGenerator
 *
 * Purpose: hand out "<prefix>-<n>-<epoch>" ids. A generator never repeats an
 * id; the start-up epoch keeps ids from different runs apart.
 */
#include <cstdint>
#include <string>

class IdGenerator {
public:
  explicit IdGenerator(std::string prefix);
  std::string next();
private:
  std::string prefix_;
  std::uint64_t counter_ = 0;
  std::int64_t epoch_ = 0;
};
