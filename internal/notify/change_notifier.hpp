#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace profile::notify {

using DocumentCallback = std::function<void(const google::protobuf::Struct& document)>;

class ChangeNotifier;

/*
  Subscription

  Move-only handle to one registered callback. Disconnect() (or destruction)
  unregisters it; both are safe after the notifier is gone.
*/
class Subscription {
 public:
  Subscription() = default;
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  void Disconnect();
  bool Connected() const;

 private:
  friend class ChangeNotifier;

  struct Channel;

  Subscription(std::weak_ptr<Channel> channel, std::uint64_t id) : channel_(std::move(channel)), id_(id) {
  }

  std::weak_ptr<Channel> channel_;
  std::uint64_t          id_{0};
};

/*
  ChangeNotifier

  Two event streams for one profile:

    Changed  any mutation, reconcile or reset
    Saved    only after a fully successful save

  Subscribers receive the full current document. Callbacks run on the
  emitting thread with no notifier lock held; a subscriber that throws is
  logged and the remaining subscribers still run.
*/
class ChangeNotifier {
 public:
  ChangeNotifier();

  [[nodiscard]] Subscription OnChanged(DocumentCallback callback);
  [[nodiscard]] Subscription OnSaved(DocumentCallback callback);

  void EmitChanged(const google::protobuf::Struct& document) const;
  void EmitSaved(const google::protobuf::Struct& document) const;

  std::size_t SubscriberCount() const;

 private:
  static Subscription Connect(const std::shared_ptr<Subscription::Channel>& channel, DocumentCallback callback);
  static void         Emit(const Subscription::Channel& channel, const google::protobuf::Struct& document);

  std::shared_ptr<Subscription::Channel> changed_;
  std::shared_ptr<Subscription::Channel> saved_;
};

struct Subscription::Channel {
  const char*                                                name{""};
  mutable std::mutex                                         mutex;
  std::uint64_t                                              next_id{1};
  std::map<std::uint64_t, std::shared_ptr<DocumentCallback>> callbacks;
};

} // namespace profile::notify
