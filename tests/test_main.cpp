#include <gmock/gmock.h>

#include <iostream>

int main(int argc, char **argv) {
  std::cout << "Running docsearch test suite..." << std::endl;

  // Also initialises GoogleTest
  ::testing::InitGoogleMock(&argc, argv);

  const int result = RUN_ALL_TESTS();
  std::cout << (result == 0 ? "docsearch: all tests passed" : "docsearch: test failures above")
            << std::endl;
  return result;
}
