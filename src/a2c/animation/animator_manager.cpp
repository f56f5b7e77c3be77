// Copyright (c) Meta Platforms, Inc. and affiliates.
// All rights reserved.
//
// This source code is licensed under the license found in the
// LICENSE file in the root directory of this source tree.

#include "a2c/animation/animator_manager.h"

#include <iostream>
#include <stdexcept>
#include <system_error>

namespace a2c {
namespace anim {

namespace {

/**
 * @brief Lowers the busy flag when the animator thread leaves its body
 */
class ReleaseGuard {
 public:
  explicit ReleaseGuard(AnimatorManager& manager) : manager_(manager) {}
  ~ReleaseGuard() { manager_.Release(); }

 private:
  AnimatorManager& manager_;
};

}  // namespace

AnimatorManager::AnimatorManager() = default;

AnimatorManager::~AnimatorManager() {
  Cancel();
  Join();
}

bool AnimatorManager::TryAcquire() {
  bool expected = false;
  return busy_.compare_exchange_strong(expected, true);
}

void AnimatorManager::Release() { busy_ = false; }

bool AnimatorManager::Busy() const { return busy_; }

void AnimatorManager::Start(const RotationAnimator& animator,
                            const AnimationRequest& request,
                            std::weak_ptr<Viewport> sink) {
  if (!busy_) {
    throw std::logic_error("AnimatorManager::Start called without the busy flag");
  }

  std::unique_lock<std::mutex> guard{mutex_};

  // the previous thread has released the flag, it is done or about to return
  if (thread_.joinable()) {
    thread_.join();
  }

  cancel_ = false;
  try {
    thread_ = std::thread([this, animator, request, sink]() {
      ReleaseGuard release{*this};
      try {
        last_write_count_ = animator.Run(request, sink, cancel_);
      } catch (const std::exception& e) {
        std::cerr << "[a2c] rotation animation aborted: " << e.what() << std::endl;
      }
    });
  } catch (const std::system_error&) {
    Release();
    throw;
  }
}

void AnimatorManager::Cancel() { cancel_ = true; }

void AnimatorManager::Wait() { Join(); }

void AnimatorManager::Join() {
  std::unique_lock<std::mutex> guard{mutex_};
  if (thread_.joinable()) {
    thread_.join();
  }
}

}  // namespace anim
}  // namespace a2c
