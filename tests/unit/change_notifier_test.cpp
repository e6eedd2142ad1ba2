#include "internal/notify/change_notifier.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

using google::protobuf::Struct;
using profile::notify::ChangeNotifier;
using profile::notify::Subscription;

Struct Doc(double coins) {
  Struct doc;
  (*doc.mutable_fields())["coins"].set_number_value(coins);
  return doc;
}

void TestChangedAndSavedAreSeparateStreams() {
  ChangeNotifier notifier;
  int            changed = 0;
  int            saved   = 0;

  auto on_changed = notifier.OnChanged([&](const Struct&) { ++changed; });
  auto on_saved   = notifier.OnSaved([&](const Struct&) { ++saved; });

  notifier.EmitChanged(Doc(1));
  notifier.EmitChanged(Doc(2));
  notifier.EmitSaved(Doc(2));

  assert(changed == 2);
  assert(saved == 1);
  assert(notifier.SubscriberCount() == 2);
}

void TestSubscribersReceiveTheDocument() {
  ChangeNotifier notifier;
  double         seen = 0;
  auto           sub  = notifier.OnChanged([&](const Struct& doc) { seen = doc.fields().at("coins").number_value(); });

  notifier.EmitChanged(Doc(17));
  assert(seen == 17);
}

void TestDisconnectStopsDelivery() {
  ChangeNotifier notifier;
  int            calls = 0;
  auto           sub   = notifier.OnChanged([&](const Struct&) { ++calls; });

  assert(sub.Connected());
  sub.Disconnect();
  assert(!sub.Connected());
  notifier.EmitChanged(Doc(1));
  assert(calls == 0);
  assert(notifier.SubscriberCount() == 0);

  // second disconnect is a no-op
  sub.Disconnect();
}

void TestDestroyedSubscriptionDisconnects() {
  ChangeNotifier notifier;
  int            calls = 0;
  {
    auto sub = notifier.OnSaved([&](const Struct&) { ++calls; });
    notifier.EmitSaved(Doc(1));
  }
  notifier.EmitSaved(Doc(1));
  assert(calls == 1);
}

void TestMovedSubscriptionKeepsCallback() {
  ChangeNotifier notifier;
  int            calls = 0;

  Subscription moved;
  {
    auto sub = notifier.OnChanged([&](const Struct&) { ++calls; });
    moved    = std::move(sub);
  }
  notifier.EmitChanged(Doc(1));
  assert(calls == 1);
  assert(moved.Connected());
}

void TestSubscriptionOutlivesNotifier() {
  Subscription sub;
  {
    ChangeNotifier notifier;
    sub = notifier.OnChanged([](const Struct&) {});
  }
  assert(!sub.Connected());
  sub.Disconnect();
}

void TestThrowingSubscriberDoesNotStopOthers() {
  ChangeNotifier notifier;
  int            calls = 0;

  auto first  = notifier.OnChanged([](const Struct&) { throw std::runtime_error("subscriber bug"); });
  auto second = notifier.OnChanged([&](const Struct&) { ++calls; });

  notifier.EmitChanged(Doc(1));
  assert(calls == 1);
}

void TestSubscriberMayDisconnectItselfDuringEmit() {
  ChangeNotifier notifier;
  int            calls = 0;

  auto holder = std::make_shared<Subscription>();
  *holder     = notifier.OnChanged([&, holder_ref = std::weak_ptr<Subscription>(holder)](const Struct&) {
    ++calls;
    if (auto self = holder_ref.lock()) self->Disconnect();
  });

  notifier.EmitChanged(Doc(1));
  notifier.EmitChanged(Doc(2));
  assert(calls == 1);
}

} // namespace

int main() {
  TestChangedAndSavedAreSeparateStreams();
  TestSubscribersReceiveTheDocument();
  TestDisconnectStopsDelivery();
  TestDestroyedSubscriptionDisconnects();
  TestMovedSubscriptionKeepsCallback();
  TestSubscriptionOutlivesNotifier();
  TestThrowingSubscriberDoesNotStopOthers();
  TestSubscriberMayDisconnectItselfDuringEmit();

  std::cout << "profile_store_unit_change_notifier: pass\n";
  return 0;
}
