#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Message {
    std::string role; // "user" | "assistant"
    std::string text;
    int64_t timestamp{0}; // unix millis
};

struct Session {
    std::string id;
    std::vector<Message> messages; // oldest first
    int64_t created{0};
    int64_t last_activity{0};
};

struct SessionSummary {
    std::string id;
    std::size_t message_count{0};
    int64_t created{0};
    int64_t last_activity{0};
};

// Bounded per-session conversation history. Appending past max_messages drops the
// oldest messages first.
class SessionStore {
public:
    using Clock = std::function<int64_t()>;

    explicit SessionStore(int max_messages, Clock clock = {});

    // A missing or unknown id creates the session (under that id when one is given).
    Session get_or_create(const std::optional<std::string>& session_id = std::nullopt);
    // Throws SessionNotFoundError for an unknown id, ValidationError for a bad role.
    void append(const std::string& session_id, const std::string& role, const std::string& text);
    // The most recent `limit` messages after skipping the `offset` most recent, oldest first.
    std::vector<Message> history(const std::string& session_id, std::size_t limit, std::size_t offset = 0) const;
    // Removes sessions whose last activity is strictly before older_than. Returns the count.
    std::size_t expire_idle(int64_t older_than);

    bool exists(const std::string& session_id) const;
    std::vector<SessionSummary> list() const;
    bool remove(const std::string& session_id);
    std::size_t count() const;

private:
    int64_t now() const;

    std::size_t max_messages_;
    Clock clock_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Session> sessions_;
};
