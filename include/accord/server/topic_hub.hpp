#pragma once

/// @file topic_hub.hpp
/// @brief Topic fan-out between message-transport connections

#include <accord/server/connection.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace accord::server {

/// Subscriptions keyed by topic; connections are held weakly
class topic_hub {
public:
    void subscribe(const std::string& topic, const std::shared_ptr<connection>& conn) {
        auto& members = topics_[topic];
        prune(members);
        for (const auto& m : members) {
            if (m.lock() == conn) {
                return;
            }
        }
        members.push_back(conn);
    }

    void unsubscribe(const std::string& topic, const connection* conn) {
        auto it = topics_.find(topic);
        if (it == topics_.end()) {
            return;
        }
        std::erase_if(it->second, [conn](const std::weak_ptr<connection>& m) {
            auto live = m.lock();
            return !live || live.get() == conn;
        });
        if (it->second.empty()) {
            topics_.erase(it);
        }
    }

    /// Drop @p conn from every topic
    void unsubscribe_all(const connection* conn) {
        for (auto it = topics_.begin(); it != topics_.end();) {
            std::erase_if(it->second, [conn](const std::weak_ptr<connection>& m) {
                auto live = m.lock();
                return !live || live.get() == conn;
            });
            it = it->second.empty() ? topics_.erase(it) : std::next(it);
        }
    }

    /// Queue @p frame on every open subscriber except @p exclude
    /// @return Number of connections the frame was queued on
    size_t publish(const std::string& topic, const std::string& frame, const connection* exclude = nullptr) {
        auto it = topics_.find(topic);
        if (it == topics_.end()) {
            return 0;
        }
        std::vector<std::shared_ptr<connection>> targets;
        for (const auto& m : it->second) {
            if (auto live = m.lock(); live && live.get() != exclude) {
                targets.push_back(std::move(live));
            }
        }
        size_t delivered = 0;
        for (const auto& target : targets) {
            if (target->post(frame)) {
                ++delivered;
            }
        }
        return delivered;
    }

    size_t subscriber_count(const std::string& topic) const {
        auto it = topics_.find(topic);
        if (it == topics_.end()) {
            return 0;
        }
        return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
            [](const std::weak_ptr<connection>& m) { return !m.expired(); }));
    }

private:
    static void prune(std::vector<std::weak_ptr<connection>>& members) {
        std::erase_if(members, [](const std::weak_ptr<connection>& m) { return m.expired(); });
    }

    std::map<std::string, std::vector<std::weak_ptr<connection>>> topics_;
};

} // namespace accord::server
