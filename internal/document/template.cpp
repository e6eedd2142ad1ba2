#include "template.hpp"

#include <stdexcept>

namespace profile::document {

FixedTemplate::FixedTemplate(google::protobuf::Struct document) : document_(std::move(document)) {
}

google::protobuf::Struct FixedTemplate::Build(const std::string&) const {
  return document_;
}

TemplateFunction::TemplateFunction(Factory factory) : factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("template factory is empty");
  }
}

google::protobuf::Struct TemplateFunction::Build(const std::string& owner_id) const {
  return factory_(owner_id);
}

std::shared_ptr<const TemplateProvider> MakeFixedTemplate(google::protobuf::Struct document) {
  return std::make_shared<FixedTemplate>(std::move(document));
}

} // namespace profile::document
