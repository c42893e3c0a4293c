// SPDX-License-Identifier: MIT

#include "lib/stream/event_loop.hpp"
#include "lib/stream/epoll_event_loop.hpp"

namespace flowtap {

// Pimpl implementation using EpollEventLoop
struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) {
    impl_->Poll(timeout_ms);
}

bool EventLoop::PollUntil(const std::function<bool()>& done,
                          std::chrono::milliseconds deadline) {
    return impl_->PollUntil(done, deadline);
}

void EventLoop::Run() {
    impl_->Run();
}

void EventLoop::Stop() {
    impl_->Stop();
}

EventLoop::operator IEventLoop&() {
    return *impl_;
}

EventLoop::operator const IEventLoop&() const {
    return *impl_;
}

}  // namespace flowtap
