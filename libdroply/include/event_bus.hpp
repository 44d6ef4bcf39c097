/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for output events.
 */

#ifndef DROPLY_EVENT_BUS_HPP
#define DROPLY_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace droply {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The OutputWriter publishes an event for every file it writes,
     * skips or fails on; the CLI subscribes to print progress and to collect
     * the final summary. Subscriptions and publications share one mutex, so
     * handlers must not subscribe from inside a handler.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Registers a handler for events of type Event.
         * @tparam Event Event struct (e.g. OutputWrittenEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /// Delivers the event to every handler of its type, in subscription order.
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

        /// @return Number of handlers registered for Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_; ///< Callbacks per event type
        std::mutex mtx_; ///< Protects subscribers_
    };

} // namespace droply

#endif // DROPLY_EVENT_BUS_HPP
