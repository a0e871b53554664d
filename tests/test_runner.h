#ifndef TEST_RUNNER_H
#define TEST_RUNNER_H

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

class TestRunner {
private:
  int testsPassed = 0;
  int testsFailed = 0;
  int failuresInTest = 0;
  std::string currentTest = "";

  void fail(const std::string &message) {
    std::cerr << "  [FAIL] " << currentTest << ": " << message << std::endl;
    testsFailed++;
    failuresInTest++;
  }

public:
  void assertTrue(bool condition, const std::string &message) {
    if (!condition) {
      fail(message);
      return;
    }
    testsPassed++;
  }

  void assertFalse(bool condition, const std::string &message) {
    assertTrue(!condition, message);
  }

  void assertEquals(const std::string &expected, const std::string &actual,
                    const std::string &message) {
    if (expected != actual) {
      fail(message);
      std::cerr << "    Expected: '" << expected << "'" << std::endl;
      std::cerr << "    Actual: '" << actual << "'" << std::endl;
      return;
    }
    testsPassed++;
  }

  void assertEquals(const char *expected, const std::string &actual,
                    const std::string &message) {
    assertEquals(std::string(expected), actual, message);
  }

  void assertEquals(int64_t expected, int64_t actual,
                    const std::string &message) {
    if (expected != actual) {
      fail(message);
      std::cerr << "    Expected: " << expected << std::endl;
      std::cerr << "    Actual: " << actual << std::endl;
      return;
    }
    testsPassed++;
  }

  void assertNotEmpty(const std::string &str, const std::string &message) {
    if (str.empty()) {
      fail(message);
      return;
    }
    testsPassed++;
  }

  void assertContains(const std::string &haystack, const std::string &needle,
                      const std::string &message) {
    if (haystack.find(needle) == std::string::npos) {
      fail(message);
      std::cerr << "    Missing: '" << needle << "' in '" << haystack << "'"
                << std::endl;
      return;
    }
    testsPassed++;
  }

  template <typename Exception>
  void assertThrows(const std::function<void()> &action,
                    const std::string &message) {
    try {
      action();
    } catch (const Exception &) {
      testsPassed++;
      return;
    } catch (const std::exception &e) {
      fail(message + " (threw a different exception: " + e.what() + ")");
      return;
    }
    fail(message + " (nothing thrown)");
  }

  void runTest(const std::string &testName,
               std::function<void()> testFunction) {
    currentTest = testName;
    failuresInTest = 0;
    std::cout << "[TEST] " << testName << std::endl;
    try {
      testFunction();
      if (failuresInTest == 0)
        std::cout << "  [PASS]" << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "  [FAIL] Exception: " << e.what() << std::endl;
      testsFailed++;
    }
  }

  void printSummary() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Passed: " << testsPassed << std::endl;
    std::cout << "Failed: " << testsFailed << std::endl;
    std::cout << "Total: " << (testsPassed + testsFailed) << std::endl;
    std::cout << "========================================\n" << std::endl;

    if (testsFailed == 0) {
      std::cout << "ALL TESTS PASSED" << std::endl;
      exit(0);
    } else {
      std::cout << "SOME TESTS FAILED" << std::endl;
      exit(1);
    }
  }
};

#endif
