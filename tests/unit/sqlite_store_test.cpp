#include "internal/kv/sqlite/sqlite_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using profile::kv::ErrorCode;
using profile::kv::sqlite::SqliteDB;
using profile::kv::sqlite::SqliteStore;

std::filesystem::path FreshDb(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "profile_store_sqlite_tests";
  std::filesystem::create_directories(base_dir);

  const auto path = base_dir / (test_name + ".db");
  for (const auto* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

void TestPutGet() {
  SqliteStore store(std::make_shared<SqliteDB>(FreshDb("put_get").string(), true));

  assert(store.Put("profiles/1", "p1/10", "{\"sessions\":\"1\"}"));
  assert(store.Put("profiles/1", "p1/10", "{\"sessions\":\"2\"}"));

  std::string value;
  assert(store.Get("profiles/1", "p1/10", &value));
  assert(value == "{\"sessions\":\"2\"}");

  assert(store.Get("profiles/1", "p1/11", &value).code == ErrorCode::NotFound);
  assert(store.Get("profiles/2", "p1/10", &value).code == ErrorCode::NotFound);
}

void TestBinaryValuesRoundTrip() {
  SqliteStore store(std::make_shared<SqliteDB>(FreshDb("binary").string(), false));

  const std::string bytes("a\0b\xff", 4);
  assert(store.Put("profiles/1", "k", bytes));

  std::string value;
  assert(store.Get("profiles/1", "k", &value));
  assert(value == bytes);
}

void TestVersionsKeepAppendOrder() {
  SqliteStore store(std::make_shared<SqliteDB>(FreshDb("versions").string(), true));

  assert(store.Append("profiles/1", "p1", 300));
  assert(store.Append("profiles/1", "p1", 100));
  assert(store.Append("profiles/1", "p1", 200));
  assert(store.Append("profiles/1", "p2", 999));

  std::vector<std::int64_t> versions;
  assert(store.ListSorted("profiles/1", "p1", true, 0, &versions));
  assert((versions == std::vector<std::int64_t>{200, 100, 300}));

  assert(store.ListSorted("profiles/1", "p1", false, 2, &versions));
  assert((versions == std::vector<std::int64_t>{300, 100}));

  assert(store.ListSorted("profiles/1", "nobody", true, 1, &versions));
  assert(versions.empty());
}

void TestDataSurvivesReopen() {
  const auto path = FreshDb("reopen").string();
  {
    SqliteStore store(std::make_shared<SqliteDB>(path, true));
    assert(store.Put("profiles/1", "p1/1", "{}"));
    assert(store.Append("profiles/1", "p1", 1));
  }

  SqliteStore               store(std::make_shared<SqliteDB>(path, true));
  std::vector<std::int64_t> versions;
  assert(store.ListSorted("profiles/1", "p1", true, 1, &versions));
  assert((versions == std::vector<std::int64_t>{1}));

  std::string value;
  assert(store.Get("profiles/1", "p1/1", &value));
}

void TestUnopenablePathThrows() {
  bool threw = false;
  try {
    SqliteDB db("/nonexistent-dir/profiles.db", true);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPutGet();
  TestBinaryValuesRoundTrip();
  TestVersionsKeepAppendOrder();
  TestDataSurvivesReopen();
  TestUnopenablePathThrows();

  std::cout << "profile_store_unit_sqlite_store: pass\n";
  return 0;
}
