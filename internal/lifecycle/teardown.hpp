#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "internal/notify/change_notifier.hpp"

namespace profile::lifecycle {

/*
  Teardown

  Ordered list of disposables owned by one profile. Run() disposes them in
  reverse registration order, exactly once; the destructor runs it too.

    Callback        invoked
    Subscription    disconnected
    NestedResource  another Teardown, run recursively
*/
class Teardown {
 public:
  using Callback = std::function<void()>;

  struct NamedCallback {
    std::string name;
    Callback    callback;
  };

  using NestedResource = std::unique_ptr<Teardown>;
  using Entry          = std::variant<NamedCallback, notify::Subscription, NestedResource>;

  Teardown() = default;
  ~Teardown();

  Teardown(const Teardown&)            = delete;
  Teardown& operator=(const Teardown&) = delete;

  void Add(std::string name, Callback callback);
  void Add(notify::Subscription subscription);
  void Add(NestedResource nested);

  // Entries added after Run() are disposed immediately.
  void Run();

  bool        HasRun() const;
  std::size_t Size() const;

 private:
  void Dispose(Entry& entry);
  void AddEntry(Entry entry);

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  bool               ran_{false};
};

} // namespace profile::lifecycle
