#ifndef TEST_RUNNER_H
#define TEST_RUNNER_H

#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

class TestRunner {
private:
  int testsPassed = 0;
  int testsFailed = 0;
  std::string currentTest = "";

  void fail(const std::string &message) {
    std::cerr << "  [FAIL] " << currentTest << ": " << message << std::endl;
    testsFailed++;
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

  void assertEquals(long long expected, long long actual,
                    const std::string &message) {
    if (expected != actual) {
      fail(message);
      std::cerr << "    Expected: " << expected << std::endl;
      std::cerr << "    Actual: " << actual << std::endl;
      return;
    }
    testsPassed++;
  }

  void assertContains(const std::string &haystack, const std::string &needle,
                      const std::string &message) {
    if (haystack.find(needle) == std::string::npos) {
      fail(message);
      std::cerr << "    Looking for: '" << needle << "'" << std::endl;
      std::cerr << "    In: '" << haystack << "'" << std::endl;
      return;
    }
    testsPassed++;
  }

  // Runs fn and passes when it throws E.
  template <typename E>
  void assertThrows(const std::function<void()> &fn,
                    const std::string &message) {
    try {
      fn();
    } catch (const E &) {
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
    int failedBefore = testsFailed;
    std::cout << "[TEST] " << testName << std::endl;
    try {
      testFunction();
    } catch (const std::exception &e) {
      fail(std::string("Exception: ") + e.what());
    } catch (...) {
      fail("Unknown exception");
    }
    if (testsFailed == failedBefore)
      std::cout << "  [PASS]" << std::endl;
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
