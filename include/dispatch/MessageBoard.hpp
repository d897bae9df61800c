#pragma once
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

// Two-way message history behind the dashboard (AI <-> user).
// Lives on the dispatch loop thread; no locking.
class MessageBoard {
public:
    struct Message {
        std::string id;
        double      timestamp;         // seconds since epoch
        enum class Direction { AiToUser, UserToAi } direction;
        std::string type;              // question|status|notification|response
        std::string priority;          // low|normal|high|critical
        std::string content;
        bool        requiresResponse = false;
        bool        read = false;

        nlohmann::json toJson() const {
            return {
                {"id",                id},
                {"timestamp",         timestamp},
                {"direction",         direction == Direction::AiToUser
                                          ? "ai_to_user" : "user_to_ai"},
                {"type",              type},
                {"priority",          priority},
                {"content",           content},
                {"requires_response", requiresResponse},
                {"status",            read ? "read" : "pending"}
            };
        }
    };

    struct Filter {
        bool                       markAsRead = true;
        std::optional<std::string> type;
        std::optional<double>      sinceTimestamp;
    };

    explicit MessageBoard(size_t maxEntries = 500)
        : maxEntries_(std::max<size_t>(1, maxEntries)) {}

    const Message& postFromAi(const std::string& content,
                              const std::string& type,
                              const std::string& priority,
                              bool requiresResponse) {
        Message m;
        m.id               = nextId();
        m.timestamp        = now();
        m.direction        = Message::Direction::AiToUser;
        m.type             = type;
        m.priority         = priority;
        m.content          = content;
        m.requiresResponse = requiresResponse;
        entries_.push_back(m);
        trim();
        return entries_.back();
    }

    const Message& postFromUser(const std::string& content,
                                const std::string& type = "response") {
        Message m;
        m.id        = nextId();
        m.timestamp = now();
        m.direction = Message::Direction::UserToAi;
        m.type      = type;
        m.priority  = "normal";
        m.content   = content;
        entries_.push_back(m);
        trim();
        return entries_.back();
    }

    // Unread user messages, optionally marking them read
    std::vector<Message> unreadFromUser(const Filter& f) {
        std::vector<Message> out;
        for (auto& m : entries_) {
            if (m.direction != Message::Direction::UserToAi || m.read)
                continue;
            if (f.type && m.type != *f.type) continue;
            if (f.sinceTimestamp && m.timestamp <= *f.sinceTimestamp) continue;
            if (f.markAsRead) m.read = true;
            out.push_back(m);
        }
        return out;
    }

    std::vector<Message> history() const {
        return {entries_.begin(), entries_.end()};
    }

    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }

private:
    std::string nextId() {
        return "msg-" + std::to_string(++seq_);
    }

    static double now() {
        using namespace std::chrono;
        return duration_cast<duration<double>>(
            system_clock::now().time_since_epoch()).count();
    }

    void trim() {
        while (entries_.size() > maxEntries_)
            entries_.pop_front();
    }

    size_t maxEntries_;
    uint64_t seq_ = 0;
    std::deque<Message> entries_;
};
