#include "descriptor_transaction.hpp"

#include <stdexcept>

namespace pbxpatch::core {

DescriptorTransaction::DescriptorTransaction(model::Descriptor& target) : target_(target), working_(target) {
}

DescriptorTransaction::~DescriptorTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void DescriptorTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("transaction already rolled back");
  }
  target_    = std::move(working_);
  committed_ = true;
}

void DescriptorTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace pbxpatch::core
