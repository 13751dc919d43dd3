// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#ifndef RBD_TARGET_GW_TEST_MOCK_FENCING_REGISTRY_H
#define RBD_TARGET_GW_TEST_MOCK_FENCING_REGISTRY_H

#include "tools/rbd_target_gw/FencingRegistry.h"
#include "gmock/gmock.h"

namespace rbd {
namespace target_gw {

struct MockFencingRegistry : public FencingRegistry {
  MOCK_METHOD1(list, int(std::string*));
  MOCK_METHOD2(remove, int(const std::string&, std::string*));
  MOCK_CONST_METHOD0(confirmation_phrase, std::string());
};

} // namespace target_gw
} // namespace rbd

#endif // RBD_TARGET_GW_TEST_MOCK_FENCING_REGISTRY_H
