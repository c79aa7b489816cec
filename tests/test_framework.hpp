#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cligate::tests {

/// Thrown by require(); anything else escaping a test is reported as an error.
class TestFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

using Registrar = void (*)(std::vector<TestCase> &);

inline void require(const bool condition, const std::string &message) {
  if (!condition) {
    throw TestFailure(message);
  }
}

} // namespace cligate::tests
