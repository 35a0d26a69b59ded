#pragma once
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

// Thrown by SKIP(); the test counts as skipped, not failed.
struct Skipped : public std::runtime_error { using std::runtime_error::runtime_error; };

enum class Outcome { Pass, Fail, Skip };

inline void json_string(std::ostream& os, const std::string& s) {
  os << '"';
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c;
    else if (c == '\n') os << "\\n";
    else os << c;
  }
  os << '"';
}

inline void report(bool json, const std::string& name, Outcome o, const std::string& detail) {
  static const char* const kWord[] = {"pass", "fail", "skip"};
  static const char* const kTag[] = {"[PASS] ", "[FAIL] ", "[SKIP] "};
  const int idx = static_cast<int>(o);
  if (json) {
    std::cout << "{\"event\":\"test\",\"name\":";
    json_string(std::cout, name);
    std::cout << ",\"status\":\"" << kWord[idx] << "\"";
    if (!detail.empty()) { std::cout << ",\"detail\":"; json_string(std::cout, detail); }
    std::cout << "}\n";
    return;
  }
  std::ostream& os = (o == Outcome::Fail) ? std::cerr : std::cout;
  os << kTag[idx] << name;
  if (!detail.empty()) os << ": " << detail;
  os << "\n";
}

// Runs every registered test whose name contains `filter` (all when empty).
// VIGIL_TEST_JSON=1 switches to one JSON object per line.
inline int run_all(const std::string& filter = "") {
  const char* json_env = std::getenv("VIGIL_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  int counts[3] = {0, 0, 0};
  for (auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string::npos) continue;
    Outcome o = Outcome::Pass;
    std::string detail;
    try {
      t.fn();
    } catch (const Skipped& s) {
      o = Outcome::Skip;
      detail = s.what();
    } catch (const std::exception& e) {
      o = Outcome::Fail;
      detail = e.what();
    } catch (...) {
      o = Outcome::Fail;
      detail = "unknown exception";
    }
    ++counts[static_cast<int>(o)];
    report(json, t.name, o, detail);
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << counts[0] << ",\"failed\":" << counts[1]
              << ",\"skipped\":" << counts[2] << "}\n";
  } else {
    std::cout << "\n" << counts[0] << " passed, " << counts[1] << " failed, " << counts[2] << " skipped\n";
  }
  return counts[1] == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define SKIP(why) throw ::mini::Skipped(why)

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, ex_type) do { bool thrown_ = false; \
  try { (void)(expr); } catch (const ex_type&) { thrown_ = true; } \
  if (!thrown_) throw ::mini::AssertionError(std::string("ASSERT_THROWS failed: ") + #expr " throws " #ex_type); } while(0)
