#include "teardown.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace profile::lifecycle {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

Teardown::~Teardown() {
  Run();
}

void Teardown::Add(std::string name, Callback callback) {
  AddEntry(NamedCallback{std::move(name), std::move(callback)});
}

void Teardown::Add(notify::Subscription subscription) {
  AddEntry(std::move(subscription));
}

void Teardown::Add(NestedResource nested) {
  if (!nested) return;
  AddEntry(std::move(nested));
}

void Teardown::AddEntry(Entry entry) {
  {
    std::lock_guard lock(mutex_);
    if (!ran_) {
      entries_.push_back(std::move(entry));
      return;
    }
  }
  Dispose(entry);
}

void Teardown::Dispose(Entry& entry) {
  std::visit(Overloaded{[](NamedCallback& named) {
                          if (!named.callback) return;
                          try {
                            named.callback();
                          } catch (const std::exception& e) {
                            PROFILE_LOG_ERROR("teardown step failed",
                                              {observability::StringField("step", named.name), observability::StringField("error", e.what())});
                          }
                        },
                        [](notify::Subscription& subscription) { subscription.Disconnect(); },
                        [](NestedResource& nested) { nested->Run(); }},
             entry);
}

void Teardown::Run() {
  std::vector<Entry> entries;
  {
    std::lock_guard lock(mutex_);
    if (ran_) return;
    ran_ = true;
    entries.swap(entries_);
  }

  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    Dispose(*it);
  }
}

bool Teardown::HasRun() const {
  std::lock_guard lock(mutex_);
  return ran_;
}

std::size_t Teardown::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace profile::lifecycle
