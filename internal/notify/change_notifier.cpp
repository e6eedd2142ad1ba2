#include "change_notifier.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace profile::notify {

Subscription::~Subscription() {
  Disconnect();
}

Subscription::Subscription(Subscription&& other) noexcept : channel_(std::move(other.channel_)), id_(other.id_) {
  other.channel_.reset();
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Disconnect();
    channel_ = std::move(other.channel_);
    id_      = other.id_;
    other.channel_.reset();
    other.id_ = 0;
  }
  return *this;
}

void Subscription::Disconnect() {
  if (auto channel = channel_.lock()) {
    std::lock_guard lock(channel->mutex);
    channel->callbacks.erase(id_);
  }
  channel_.reset();
  id_ = 0;
}

bool Subscription::Connected() const {
  auto channel = channel_.lock();
  if (!channel) return false;
  std::lock_guard lock(channel->mutex);
  return channel->callbacks.count(id_) > 0;
}

ChangeNotifier::ChangeNotifier()
    : changed_(std::make_shared<Subscription::Channel>()), saved_(std::make_shared<Subscription::Channel>()) {
  changed_->name = "changed";
  saved_->name   = "saved";
}

Subscription ChangeNotifier::Connect(const std::shared_ptr<Subscription::Channel>& channel, DocumentCallback callback) {
  std::lock_guard lock(channel->mutex);
  const auto      id = channel->next_id++;
  channel->callbacks.emplace(id, std::make_shared<DocumentCallback>(std::move(callback)));
  return Subscription(channel, id);
}

Subscription ChangeNotifier::OnChanged(DocumentCallback callback) {
  return Connect(changed_, std::move(callback));
}

Subscription ChangeNotifier::OnSaved(DocumentCallback callback) {
  return Connect(saved_, std::move(callback));
}

void ChangeNotifier::Emit(const Subscription::Channel& channel, const google::protobuf::Struct& document) {
  std::vector<std::shared_ptr<DocumentCallback>> snapshot;
  {
    std::lock_guard lock(channel.mutex);
    snapshot.reserve(channel.callbacks.size());
    for (const auto& [id, callback] : channel.callbacks) {
      snapshot.push_back(callback);
    }
  }

  for (const auto& callback : snapshot) {
    try {
      (*callback)(document);
    } catch (const std::exception& e) {
      PROFILE_LOG_ERROR("profile subscriber threw",
                        {observability::StringField("event", channel.name), observability::StringField("error", e.what())});
    }
  }
}

void ChangeNotifier::EmitChanged(const google::protobuf::Struct& document) const {
  Emit(*changed_, document);
}

void ChangeNotifier::EmitSaved(const google::protobuf::Struct& document) const {
  Emit(*saved_, document);
}

std::size_t ChangeNotifier::SubscriberCount() const {
  std::size_t     count = 0;
  {
    std::lock_guard lock(changed_->mutex);
    count += changed_->callbacks.size();
  }
  std::lock_guard lock(saved_->mutex);
  return count + saved_->callbacks.size();
}

} // namespace profile::notify
