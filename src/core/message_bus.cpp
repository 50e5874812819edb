#include "core/message_bus.h"

namespace mazerl {

void LastValueBus::publish(const std::string& topic, const BusValue& value) {
    PublishHook hook;
    {
        std::lock_guard<std::mutex> lock(mu_);
        slots_[topic] = value;
        publish_count_++;
        hook = hook_;
    }
    if (hook) hook(topic, value);
}

std::optional<BusValue> LastValueBus::read(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(topic);
    if (it == slots_.end()) return std::nullopt;
    return it->second;
}

void LastValueBus::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    slots_.clear();
}

void LastValueBus::set_publish_hook(PublishHook hook) {
    std::lock_guard<std::mutex> lock(mu_);
    hook_ = std::move(hook);
}

size_t LastValueBus::n_topics() const {
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.size();
}

uint64_t LastValueBus::publish_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return publish_count_;
}

} // namespace mazerl
