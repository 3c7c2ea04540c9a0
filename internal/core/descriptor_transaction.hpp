#pragma once

#include "internal/model/descriptor.hpp"

namespace pbxpatch::core {

/*
  Transaction = snapshot + working copy

  Changes go to the working copy. Commit replaces the target with it;
  destroying an uncommitted transaction leaves the target untouched.
*/

class DescriptorTransaction {
 public:
  explicit DescriptorTransaction(model::Descriptor& target);
  ~DescriptorTransaction();

  DescriptorTransaction(const DescriptorTransaction&)            = delete;
  DescriptorTransaction& operator=(const DescriptorTransaction&) = delete;

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

  model::Descriptor& Mutable() {
    return working_;
  }
  const model::Descriptor& View() const {
    return working_;
  }

 private:
  model::Descriptor& target_;
  model::Descriptor  working_;
  bool               committed_   = false;
  bool               rolled_back_ = false;
};

} // namespace pbxpatch::core
