#pragma once
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

inline bool env_on(const char* name) {
  const char* v = std::getenv(name);
  return v && (*v == '1' || *v == 't' || *v == 'T' || *v == 'y' || *v == 'Y');
}

inline void json_string(std::ostream& os, const std::string& s) {
  os << '"';
  for (char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c;
    else if (c == '\n') os << "\\n";
    else os << c;
  }
  os << '"';
}

// Runs every registered test whose name contains `filter` (argv[1], else
// $SAFERE_TEST_FILTER). SAFERE_TEST_JSON=1 prints one JSON object per line.
inline int run_all(int argc = 0, char** argv = nullptr) {
  std::string filter;
  if (argc > 1 && argv) filter = argv[1];
  else if (const char* f = std::getenv("SAFERE_TEST_FILTER")) filter = f;
  const bool json = env_on("SAFERE_TEST_JSON");

  int failed = 0, passed = 0, skipped = 0;
  for (auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string::npos) { ++skipped; continue; }
    std::string error;
    auto t0 = std::chrono::steady_clock::now();
    try {
      t.fn();
    } catch (const std::exception& e) {
      error = e.what();
      if (error.empty()) error = "exception with empty message";
    } catch (...) {
      error = "unknown exception";
    }
    auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    if (error.empty()) ++passed; else ++failed;
    if (json) {
      std::cout << "{\"event\":\"test\",\"name\":";
      json_string(std::cout, t.name);
      std::cout << ",\"status\":\"" << (error.empty() ? "pass" : "fail") << "\",\"ms\":" << ms;
      if (!error.empty()) { std::cout << ",\"error\":"; json_string(std::cout, error); }
      std::cout << "}\n";
    } else if (error.empty()) {
      std::cout << "[PASS] " << t.name << " (" << ms << " ms)\n";
    } else {
      std::cerr << "[FAIL] " << t.name << ": " << error << "\n";
    }
  }

  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed
              << ",\"skipped\":" << skipped << "}\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed";
    if (skipped) std::cout << ", " << skipped << " filtered out";
    std::cout << "\n";
  }
  return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, type) do { bool thrown_ = false; try { (void)(expr); } catch (const type&) { thrown_ = true; } \
  if (!thrown_) throw ::mini::AssertionError(std::string("ASSERT_THROWS failed: ") + #expr " did not throw " #type); } while(0)
