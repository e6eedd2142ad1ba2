#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <memory>
#include <string>

namespace profile::document {

// Produces the fresh document for an owner: new profiles, Reset() and the
// fallback of a degraded load.
class TemplateProvider {
 public:
  virtual ~TemplateProvider() = default;

  virtual google::protobuf::Struct Build(const std::string& owner_id) const = 0;
};

class FixedTemplate final : public TemplateProvider {
 public:
  explicit FixedTemplate(google::protobuf::Struct document);

  google::protobuf::Struct Build(const std::string& owner_id) const override;

 private:
  google::protobuf::Struct document_;
};

class TemplateFunction final : public TemplateProvider {
 public:
  using Factory = std::function<google::protobuf::Struct(const std::string& owner_id)>;

  explicit TemplateFunction(Factory factory);

  google::protobuf::Struct Build(const std::string& owner_id) const override;

 private:
  Factory factory_;
};

std::shared_ptr<const TemplateProvider> MakeFixedTemplate(google::protobuf::Struct document);

} // namespace profile::document
