#include "../include/session_store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>

SessionStore::SessionStore(int max_messages, Clock clock)
    : max_messages_((std::size_t)std::max(max_messages, 1)), clock_(std::move(clock)) {
    if (max_messages <= 0) throw ValidationError("session max_messages must be positive");
}

int64_t SessionStore::now() const {
    return clock_ ? clock_() : unix_millis();
}

Session SessionStore::get_or_create(const std::optional<std::string>& session_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (session_id && !session_id->empty()) {
        auto it = sessions_.find(*session_id);
        if (it != sessions_.end()) return it->second;
    }
    Session s;
    s.id = (session_id && !session_id->empty()) ? *session_id : gen_id();
    while (sessions_.count(s.id)) s.id = gen_id();
    s.created = s.last_activity = now();
    sessions_.emplace(s.id, s);
    return s;
}

void SessionStore::append(const std::string& session_id, const std::string& role, const std::string& text) {
    if (role != "user" && role != "assistant") throw ValidationError("unknown message role: " + role);
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) throw SessionNotFoundError(session_id);
    auto& s = it->second;
    int64_t ts = now();
    s.messages.push_back(Message{role, text, ts});
    if (s.messages.size() > max_messages_) {
        s.messages.erase(s.messages.begin(), s.messages.begin() + (s.messages.size() - max_messages_));
    }
    s.last_activity = std::max(s.last_activity, ts);
}

std::vector<Message> SessionStore::history(const std::string& session_id, std::size_t limit, std::size_t offset) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) throw SessionNotFoundError(session_id);
    const auto& msgs = it->second.messages;
    if (offset >= msgs.size()) return {};
    std::size_t end = msgs.size() - offset;
    std::size_t begin = end > limit ? end - limit : 0;
    return std::vector<Message>(msgs.begin() + begin, msgs.begin() + end);
}

std::size_t SessionStore::expire_idle(int64_t older_than) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.last_activity < older_than) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool SessionStore::exists(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.count(session_id) > 0;
}

std::vector<SessionSummary> SessionStore::list() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<SessionSummary> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        out.push_back(SessionSummary{kv.first, kv.second.messages.size(), kv.second.created, kv.second.last_activity});
    }
    std::sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b){
        if (a.last_activity != b.last_activity) return a.last_activity > b.last_activity;
        return a.id < b.id;
    });
    return out;
}

bool SessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.erase(session_id) > 0;
}

std::size_t SessionStore::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.size();
}
